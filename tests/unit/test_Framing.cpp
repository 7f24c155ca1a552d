#include <gtest/gtest.h>

#include "protocols/ctl/framing.hpp"

#include <arpa/inet.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

using namespace tw::protocols::ctl;

class FramingTest : public ::testing::Test {
protected:
    int fds[2]{-1, -1};

    void SetUp() override {
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    }

    void TearDown() override {
        for (const int fd : fds)
            if (fd >= 0) ::close(fd);
    }
};

TEST_F(FramingTest, JsonCrossesTheSocket) {
    const nlohmann::json sent = {{"line", "status of api"}, {"n", 3}};
    sendJson(fds[0], sent);
    EXPECT_EQ(recvJson(fds[1]), sent);
}

TEST_F(FramingTest, BackToBackFrames) {
    sendJson(fds[0], {{"a", 1}});
    sendJson(fds[0], {{"b", 2}});
    EXPECT_EQ(recvJson(fds[1])["a"], 1);
    EXPECT_EQ(recvJson(fds[1])["b"], 2);
}

TEST_F(FramingTest, OversizedFrameIsRefused) {
    const uint32_t len = htonl(MAX_FRAME_BYTES + 1);
    ASSERT_TRUE(writen(fds[0], &len, sizeof(len)));
    EXPECT_THROW(recvJson(fds[1]), std::runtime_error);
}

TEST_F(FramingTest, EofIsAnError) {
    ::close(fds[0]);
    fds[0] = -1;
    EXPECT_THROW(recvJson(fds[1]), std::runtime_error);
}

TEST_F(FramingTest, TruncatedBodyIsAnError) {
    const uint32_t len = htonl(10);
    ASSERT_TRUE(writen(fds[0], &len, sizeof(len)));
    ASSERT_TRUE(writen(fds[0], "{}", 2));
    ::close(fds[0]);
    fds[0] = -1;
    EXPECT_THROW(recvJson(fds[1]), std::runtime_error);
}

TEST_F(FramingTest, MalformedJson) {
    const std::string body = "{not json";
    const uint32_t len = htonl(static_cast<uint32_t>(body.size()));
    ASSERT_TRUE(writen(fds[0], &len, sizeof(len)));
    ASSERT_TRUE(writen(fds[0], body.data(), body.size()));
    EXPECT_THROW(recvJson(fds[1]), nlohmann::json::parse_error);
}

#pragma once

#include <optional>
#include <string>
#include <variant>

namespace tw::health::model {

namespace outcome {

// The endpoint answered with a 2xx status
struct Success {
    int status_code{};
    double response_time_ms{};
};

// The endpoint answered, but not with a 2xx status
struct UnexpectedStatus {
    int status_code{};
    double response_time_ms{};
};

struct Timeout {};

struct ConnectionFailed {
    std::string detail;
};

struct OtherError {
    std::string message;
};

}

using Outcome = std::variant<outcome::Success,
                             outcome::UnexpectedStatus,
                             outcome::Timeout,
                             outcome::ConnectionFailed,
                             outcome::OtherError>;

// Status code carried by the outcome, if the endpoint answered at all.
std::optional<int> statusCode(const Outcome& o);

std::optional<double> responseTimeMs(const Outcome& o);

std::string describe(const Outcome& o);

}

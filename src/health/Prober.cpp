#include "health/Prober.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <curl/curl.h>

using namespace tw::health;
using namespace tw::health::model;
using namespace tw::util;

namespace {

bool isConnectionFailure(const CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PEER_FAILED_VERIFICATION:
            return true;
        default:
            return false;
    }
}

}

HttpProber::HttpProber(std::string userAgent) : userAgent_(std::move(userAgent)) {}

Outcome HttpProber::probe(const std::string& endpoint, const std::chrono::milliseconds timeout) {
    HttpResponse res;

    try {
        SList headers;
        headers.add("Accept: text/html,application/json,*/*");

        res = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, endpoint.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(h, CURLOPT_USERAGENT, userAgent_.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
            curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
            curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
        }, /*keepBody=*/false);
    } catch (const std::exception& e) {
        // curl handle could not be created; nothing went over the wire
        log::Registry::probe()->error("[HttpProber] {}: {}", endpoint, e.what());
        return outcome::OtherError{e.what()};
    }

    if (res.curl == CURLE_OK) {
        const auto code = static_cast<int>(res.http);
        log::Registry::probe()->debug("[HttpProber] {} -> HTTP {} in {:.2f} ms", endpoint, code, res.total_time_ms);
        if (code / 100 == 2) return outcome::Success{code, res.total_time_ms};
        return outcome::UnexpectedStatus{code, res.total_time_ms};
    }

    log::Registry::probe()->warn("[HttpProber] {} failed: {}", endpoint, res.error);

    if (res.curl == CURLE_OPERATION_TIMEDOUT) return outcome::Timeout{};
    if (isConnectionFailure(res.curl)) return outcome::ConnectionFailed{res.error};
    return outcome::OtherError{res.error};
}

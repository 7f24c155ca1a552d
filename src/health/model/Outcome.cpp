#include "health/model/Outcome.hpp"

#include <fmt/core.h>

namespace tw::health::model {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

std::optional<int> statusCode(const Outcome& o) {
    if (const auto* s = std::get_if<outcome::Success>(&o)) return s->status_code;
    if (const auto* u = std::get_if<outcome::UnexpectedStatus>(&o)) return u->status_code;
    return std::nullopt;
}

std::optional<double> responseTimeMs(const Outcome& o) {
    if (const auto* s = std::get_if<outcome::Success>(&o)) return s->response_time_ms;
    if (const auto* u = std::get_if<outcome::UnexpectedStatus>(&o)) return u->response_time_ms;
    return std::nullopt;
}

std::string describe(const Outcome& o) {
    return std::visit(overloaded{
        [](const outcome::Success& s) { return fmt::format("HTTP {} in {:.2f} ms", s.status_code, s.response_time_ms); },
        [](const outcome::UnexpectedStatus& u) { return fmt::format("unexpected HTTP {} in {:.2f} ms", u.status_code, u.response_time_ms); },
        [](const outcome::Timeout&) { return std::string("timeout"); },
        [](const outcome::ConnectionFailed& c) {
            return c.detail.empty() ? std::string("connection failed") : "connection failed: " + c.detail;
        },
        [](const outcome::OtherError& e) { return "error: " + e.message; },
    }, o);
}

}

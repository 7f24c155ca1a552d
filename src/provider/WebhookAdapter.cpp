#include "provider/WebhookAdapter.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace tw::provider;
using namespace tw::util;

WebhookAdapter::WebhookAdapter(std::string url, const std::chrono::milliseconds timeout, std::string userAgent)
    : url_(std::move(url)), timeout_(timeout), userAgent_(std::move(userAgent)) {
    if (url_.empty()) throw std::invalid_argument("Webhook adapter requires a URL");
}

void WebhookAdapter::applyTrafficShift(const TrafficShift& shift) {
    post("traffic_shift", shift);
}

void WebhookAdapter::applyTrafficRule(const traffic::model::Rule& rule) {
    post("traffic_rule", rule);
}

void WebhookAdapter::createScalingAlarm(const scaling::model::Rule& rule, const std::size_t ruleId) {
    nlohmann::json payload = rule;
    payload["alarm_name"] = alarmName(rule, ruleId);
    post("scaling_alarm", payload);
}

void WebhookAdapter::post(const std::string& kind, const nlohmann::json& payload) const {
    const auto body = nlohmann::json{{"kind", kind}, {"payload", payload}}.dump();

    SList headers;
    headers.add("Content-Type: application/json");

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(h, CURLOPT_USERAGENT, userAgent_.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    });

    if (!res.ok()) {
        const auto reason = res.curl != CURLE_OK ? res.error : fmt::format("HTTP {}", res.http);
        throw std::runtime_error(fmt::format("Webhook {} failed: {}", kind, reason));
    }

    log::Registry::provider()->debug("[WebhookAdapter] {} delivered ({} ms)", kind, res.total_time_ms);
}

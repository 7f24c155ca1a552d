#include "protocols/command/Parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <regex>
#include <stdexcept>

namespace tw::protocols::command {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::regex re(const char* pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

std::string normalize(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    for (const unsigned char c : line) out.push_back(static_cast<char>(std::tolower(c)));

    const auto first = out.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = out.find_last_not_of(" \t\r\n");
    return out.substr(first, last - first + 1);
}

bool contains(const std::string& s, const char* word) {
    return s.find(word) != std::string::npos;
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) { return std::isdigit(c); });
}

// Numbers too large for the target type saturate rather than fail the parse.
long long toNumber(const std::string& digits) {
    try {
        return std::stoll(digits);
    } catch (const std::out_of_range&) {
        return std::numeric_limits<long long>::max();
    }
}

const std::array<std::regex, 3>& unregisterPatterns() {
    static const std::array patterns{
        re(R"(stop monitoring (.+))"),
        re(R"(unregister (.+))"),
        re(R"(unmonitor (.+))"),
    };
    return patterns;
}

const std::array<std::regex, 6>& healthPatterns() {
    static const std::array patterns{
        re(R"(check health of (.+?) every (\d+) (seconds?|minutes?))"),
        re(R"(monitor (.+?) health every (\d+))"),
        re(R"(health check (.+?) interval (\d+))"),
        re(R"(ping (.+?) every (\d+))"),
        re(R"(watch (.+?) health)"),
        re(R"(monitor (.+))"),
    };
    return patterns;
}

const std::array<std::regex, 7>& trafficPatterns() {
    static const std::array patterns{
        re(R"(route (.+?) to (.+?) with (\d+)% traffic)"),
        re(R"(send (\d+)% of traffic from (.+?) to (.+))"),
        re(R"(redirect (.+?) to (.+?) at (\d+)%)"),
        re(R"(balance (\d+)% traffic from (.+?) to (.+))"),
        re(R"(redirect (.+?) to (.+))"),
        re(R"(balance traffic between (.+?) and (.+))"),
        re(R"(failover (.+?) to (.+))"),
    };
    return patterns;
}

const std::array<std::regex, 6>& scalingPatterns() {
    static const std::array patterns{
        re(R"(scale up when cpu above (\d+)%)"),
        re(R"(scale down when cpu below (\d+)%)"),
        re(R"(auto scale (.+?) when (.+?) above (\d+))"),
        re(R"(increase capacity when (.+?) above (\d+))"),
        re(R"(decrease capacity when (.+?) below (\d+))"),
        re(R"(scale when (.+?) threshold (\d+))"),
    };
    return patterns;
}

const std::array<std::regex, 6>& statusPatterns() {
    static const std::array patterns{
        re(R"(status of (.+))"),
        re(R"(show health of (.+))"),
        re(R"(check (.+?) status)"),
        re(R"(how is (.+?) doing)"),
        re(R"(health report for (.+))"),
        re(R"(show (.+?) metrics)"),
    };
    return patterns;
}

constexpr std::array GLOBAL_STATUS_WORDS{"show status", "system status", "overall health", "dashboard", "summary"};

}

Command parse(const std::string& line) {
    const auto cmd = normalize(line);
    if (cmd.empty()) return Unknown{line};

    std::smatch m;

    for (const auto& p : unregisterPatterns())
        if (std::regex_search(cmd, m, p)) return Unregister{m[1].str()};

    for (const auto& p : healthPatterns()) {
        if (!std::regex_search(cmd, m, p)) continue;

        HealthCheck hc{m[1].str()};
        if (m.size() > 2 && allDigits(m[2].str())) {
            auto seconds = toNumber(m[2].str());
            if (m.size() > 3 && contains(m[3].str(), "minute"))
                seconds = seconds > std::numeric_limits<long long>::max() / 60 ? std::numeric_limits<long long>::max()
                                                                              : seconds * 60;
            hc.interval = std::chrono::seconds(seconds);
        }
        return hc;
    }

    for (const auto& p : trafficPatterns()) {
        if (!std::regex_search(cmd, m, p)) continue;

        if (m.size() > 3 && allDigits(m[3].str())) return RouteTraffic{m[1].str(), m[2].str(), toNumber(m[3].str())};
        if (m.size() > 3 && allDigits(m[1].str())) return RouteTraffic{m[2].str(), m[3].str(), toNumber(m[1].str())};
        return RouteTraffic{m[1].str(), m[2].str(), 100};
    }

    for (const auto& p : scalingPatterns()) {
        if (!std::regex_search(cmd, m, p)) continue;

        AutoScale as;
        as.threshold = static_cast<double>(toNumber(m[m.size() - 1].str()));
        as.action = contains(cmd, "down") || contains(cmd, "decrease") || contains(cmd, "below")
                        ? scaling::model::Action::ScaleDown
                        : scaling::model::Action::ScaleUp;

        if (contains(cmd, "memory")) as.metric = scaling::model::Metric::Memory;
        else if (contains(cmd, "disk")) as.metric = scaling::model::Metric::Disk;
        else if (contains(cmd, "network")) as.metric = scaling::model::Metric::Network;
        else as.metric = scaling::model::Metric::Cpu;
        return as;
    }

    for (const auto& p : statusPatterns())
        if (std::regex_search(cmd, m, p)) return Status{m[1].str()};

    for (const auto* word : GLOBAL_STATUS_WORDS)
        if (contains(cmd, word)) return Status{};

    if (contains(cmd, "alert")) return Alerts{};
    if (contains(cmd, "recommend")) return Recommendations{};
    if (cmd == "endpoints" || cmd == "list endpoints") return Endpoints{};
    if (cmd == "metrics") return Metrics{};
    if (contains(cmd, "help")) return Help{};
    if (contains(cmd, "clear") || contains(cmd, "reset")) return Clear{};

    return Unknown{line};
}

std::string name(const Command& cmd) {
    return std::visit(overloaded{
        [](const HealthCheck&) { return "health_check"; },
        [](const Unregister&) { return "unregister"; },
        [](const RouteTraffic&) { return "route_traffic"; },
        [](const AutoScale&) { return "auto_scale"; },
        [](const Status&) { return "get_status"; },
        [](const Alerts&) { return "alerts"; },
        [](const Recommendations&) { return "recommendations"; },
        [](const Endpoints&) { return "endpoints"; },
        [](const Metrics&) { return "metrics"; },
        [](const Help&) { return "help"; },
        [](const Clear&) { return "clear"; },
        [](const Unknown&) { return "unknown"; },
    }, cmd);
}

}

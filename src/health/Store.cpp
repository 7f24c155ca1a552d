#include "health/Store.hpp"

#include <mutex>

using namespace tw::health;
using namespace tw::health::model;

Registration Store::upsert(const std::string& endpoint, const CheckConfig& config, const TimePoint now) {
    std::unique_lock lock(mutex_);

    if (const auto it = monitors_.find(endpoint); it != monitors_.end()) {
        auto& m = it->second;
        m.config = config;
        m.resetLiveState();
        m.generation = nextGeneration_++;
        return {m, true};
    }

    Monitor m(endpoint, config, now);
    m.generation = nextGeneration_++;
    const auto [it, _] = monitors_.emplace(endpoint, std::move(m));
    return {it->second, false};
}

bool Store::remove(const std::string& endpoint) {
    std::unique_lock lock(mutex_);
    return monitors_.erase(endpoint) > 0;
}

void Store::clear() {
    std::unique_lock lock(mutex_);
    monitors_.clear();
}

std::optional<Transition> Store::apply(const std::string& endpoint, const uint64_t generation,
                                       const Outcome& outcome, const TimePoint now) {
    std::unique_lock lock(mutex_);

    const auto it = monitors_.find(endpoint);
    if (it == monitors_.end() || it->second.generation != generation) return std::nullopt;

    auto t = StateMachine::apply(it->second, outcome, now);
    it->second = t.monitor;
    return t;
}

std::optional<Monitor> Store::get(const std::string& endpoint) const {
    std::shared_lock lock(mutex_);
    if (const auto it = monitors_.find(endpoint); it != monitors_.end()) return it->second;
    return std::nullopt;
}

std::vector<Monitor> Store::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<Monitor> out;
    out.reserve(monitors_.size());
    for (const auto& [_, m] : monitors_) out.push_back(m);
    return out;
}

size_t Store::size() const {
    std::shared_lock lock(mutex_);
    return monitors_.size();
}

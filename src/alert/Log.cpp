#include "alert/Log.hpp"

#include <algorithm>
#include <mutex>

using namespace tw::alert;
using namespace tw::alert::model;

Alert Log::append(Alert alert) {
    std::unique_lock lock(mutex_);
    alert.id = nextId_++;
    alerts_.push_back(alert);
    while (alerts_.size() > CAPACITY) alerts_.pop_front();
    return alert;
}

std::vector<Alert> Log::recent(const size_t limit) const {
    std::shared_lock lock(mutex_);
    const auto n = std::min(limit, alerts_.size());
    return {alerts_.end() - static_cast<std::ptrdiff_t>(n), alerts_.end()};
}

size_t Log::countSince(const std::chrono::system_clock::time_point cutoff) const {
    std::shared_lock lock(mutex_);
    return static_cast<size_t>(std::ranges::count_if(alerts_, [&](const Alert& a) { return a.timestamp > cutoff; }));
}

size_t Log::size() const {
    std::shared_lock lock(mutex_);
    return alerts_.size();
}

void Log::clear() {
    std::unique_lock lock(mutex_);
    alerts_.clear();
}

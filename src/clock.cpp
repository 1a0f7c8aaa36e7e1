#include "looper/clock.hpp"

#include <algorithm>

namespace looper {

inline namespace v1 {

void clock::add_listener(const void* key, task_function on_change) {
    std::lock_guard<std::mutex> lock{listeners_mutex_};
    listeners_.emplace_back(key, std::move(on_change));
}

void clock::remove_listener(const void* key) {
    std::lock_guard<std::mutex> lock{listeners_mutex_};
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                             [key](const auto& p) { return p.first == key; }),
            listeners_.end());
}

void clock::notify_listeners() {
    std::lock_guard<std::mutex> lock{listeners_mutex_};
    for (auto& p : listeners_)
        p.second();
}

clock::time_point steady_clock_source::now() const {
    return std::chrono::time_point_cast<duration>(std::chrono::steady_clock::now());
}

steady_clock_source& steady_clock_source::instance() {
    static steady_clock_source inst;
    return inst;
}

manual_clock::manual_clock(time_point start)
    : now_(start) {}

clock::time_point manual_clock::now() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return now_;
}

void manual_clock::advance(duration d) {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        now_ += d;
    }
    notify_listeners();
}

} // namespace v1
} // namespace looper

#pragma once

#include "task.hpp"

#include <chrono>
#include <mutex>
#include <vector>
#include <utility>

namespace looper {

inline namespace v1 {

/**
 * @brief      Time source used by execution contexts for delayed continuations.
 *
 * An @ref execution_context reads the time through this interface whenever it needs to decide if a
 * delayed continuation is due. The default is @ref steady_clock_source. Tests can inject a
 * @ref manual_clock to control the passage of time explicitly.
 *
 * A clock can notify interested parties when its time jumps (see @ref manual_clock::advance()), so
 * that sleeping loops re-evaluate their timers.
 */
class clock {
public:
    using duration = std::chrono::nanoseconds;
    using time_point = std::chrono::time_point<std::chrono::steady_clock, duration>;

    clock() = default;
    virtual ~clock() = default;

    clock(const clock&) = delete;
    clock& operator=(const clock&) = delete;

    //! Returns the current time of this clock
    virtual time_point now() const = 0;

    //! Registers a function to be called whenever the time of the clock changes discontinuously
    void add_listener(const void* key, task_function on_change);
    //! Removes the listener registered with the given key
    void remove_listener(const void* key);

protected:
    //! Calls all the registered listeners
    void notify_listeners();

private:
    std::mutex listeners_mutex_;
    std::vector<std::pair<const void*, task_function>> listeners_;
};

//! Clock reading from `std::chrono::steady_clock`
class steady_clock_source : public clock {
public:
    time_point now() const override;

    //! Returns the process-wide instance of the steady clock
    static steady_clock_source& instance();
};

/**
 * @brief      Clock whose time only moves when explicitly told to.
 *
 * Starts at the epoch of the steady clock (or at a given time point). Thread-safe.
 */
class manual_clock : public clock {
public:
    explicit manual_clock(time_point start = time_point{});

    time_point now() const override;

    //! Moves the time forward by the given amount and wakes up the listening contexts
    void advance(duration d);

private:
    mutable std::mutex mutex_;
    time_point now_;
};

} // namespace v1
} // namespace looper

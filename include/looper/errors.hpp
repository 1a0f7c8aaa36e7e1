#pragma once

#include <stdexcept>
#include <string>

namespace looper {

inline namespace v1 {

//! Base class for all the errors reported by looper itself
struct error : std::runtime_error {
    explicit error(const std::string& what)
        : runtime_error(what) {}
};

/**
 * @brief      Exception indicating that a job was cancelled.
 *
 * Thrown by @ref this_job::check_cancelled() when the current job received a cancel request, and by
 * @ref deferred::await() when the awaited job ended up in the cancelled state.
 *
 * A closure that lets this exception escape is recorded as cancelled, not as failed.
 */
struct cancellation_error : error {
    cancellation_error()
        : error("job cancelled") {}
};

/**
 * @brief      Exception thrown when work cannot be accepted.
 *
 * This happens when submitting to a @ref dispatcher_pool that was shut down or that reached its
 * pending capacity, or when launching in a @ref scope that is already cancelled. The rejected
 * closure is never executed.
 */
struct rejected_submission_error : error {
    explicit rejected_submission_error(const std::string& reason)
        : error("submission rejected: " + reason) {}
};

/**
 * @brief      Exception indicating that a deadline won the race against a job's completion.
 *
 * @see scope::launch_with_timeout(), deferred::await_for()
 */
struct timeout_error : error {
    timeout_error()
        : error("timeout") {}
};

/**
 * @brief      Exception thrown when attempting to initialize the library more than once.
 *
 * @see init(), is_initialized()
 */
struct already_initialized : error {
    already_initialized()
        : error("already initialized") {}
};

} // namespace v1
} // namespace looper

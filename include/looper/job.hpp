#pragma once

#include "job_state.hpp"
#include "detail/job_impl.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>

namespace looper {

inline namespace v1 {

/**
 * @brief      Handle to one scheduled unit of background work.
 *
 * A job is created when a closure is submitted to a @ref dispatcher_pool, either directly or
 * through a @ref scope. It goes through the states described by @ref job_state.
 *
 * job implements shared-copy semantics: copies of a job object refer to the same unit of work.
 * Cancelling through one copy is visible through all the others.
 *
 * **Cancellation**
 *
 * A job that has not started yet is removed from the pool's queue and its closure never executes.
 * A job that is already running only gets a cooperative flag set; the closure can observe it with
 * @ref this_job::is_cancelled() or @ref this_job::check_cancelled(). If the closure ignores the
 * flag, it runs until the end, but its result is discarded: the job is recorded as cancelled and
 * its result is not delivered.
 *
 * @see deferred, scope, dispatcher_pool
 */
class job {
public:
    //! Creates an empty job handle; no operations can be called on it
    job() = default;
    ~job() = default;

    job(const job&) = default;
    job(job&&) = default;
    job& operator=(const job&) = default;
    job& operator=(job&&) = default;

    //! Checks if this handle refers to a job
    explicit operator bool() const { return static_cast<bool>(impl_); }

    //! Returns the unique identifier of the job
    std::uint64_t id() const;

    //! Returns the current state of the job
    job_state state() const;

    //! Checks if the job reached a terminal state
    bool is_done() const;

    /**
     * @brief      Requests the cancellation of the job
     *
     * @return     True if the job was cancelled before starting; its closure will never execute.
     *
     * For a running job, this sets the cooperative cancellation flag and returns false. Calling this
     * on a terminal job has no effect.
     */
    bool cancel();

    //! Checks if cancellation was requested for the job
    bool is_cancel_requested() const;

    //! Returns the error of a failed job; null for all the other states
    std::exception_ptr error() const;

    //! Blocks the calling thread until the job reaches a terminal state
    void wait() const;

    /**
     * @brief      Blocks the calling thread until the job is done, or the timeout expires
     *
     * @return     True if the job reached a terminal state within the given time
     */
    bool wait_for(std::chrono::nanoseconds timeout) const;

    friend bool operator==(const job& l, const job& r) { return l.impl_ == r.impl_; }
    friend bool operator!=(const job& l, const job& r) { return l.impl_ != r.impl_; }

protected:
    explicit job(std::shared_ptr<detail::job_impl> impl)
        : impl_(std::move(impl)) {}

    //! The shared state of the job
    std::shared_ptr<detail::job_impl> impl_;

    friend detail::job_access;
};

/**
 * @brief      Functions to be called from within a running closure, regarding its own job.
 *
 * These use thread-local storage to find the job whose closure runs on the current thread.
 */
namespace this_job {

//! Returns the id of the job running on the current thread; 0 if there is none
std::uint64_t id();

/**
 * @brief      Checks if the job running on the current thread was asked to cancel
 *
 * Closures performing long work should call this at natural suspension points and return early
 * when it yields true. Returns false if called outside of a job.
 */
bool is_cancelled();

/**
 * @brief      Throws @ref cancellation_error if the current job was asked to cancel
 *
 * The exception leaving the closure marks the job as cancelled (not failed).
 */
void check_cancelled();

} // namespace this_job

} // namespace v1
} // namespace looper

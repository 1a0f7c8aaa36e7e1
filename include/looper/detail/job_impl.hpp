#pragma once

#include "looper/task.hpp"
#include "looper/job_state.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace looper {

inline namespace v1 {
class execution_context;
}

namespace detail {

struct scope_impl;
struct pool_data;

//! The type returned by calling a functor of type F with no arguments
template <typename F>
using result_of_t = std::invoke_result_t<std::decay_t<F>>;

/**
 * @brief      The shared state of a job.
 *
 * Handles (@ref job, @ref deferred), the pool queue, the owning scope and the delivery
 * continuations all share this object. The state machine is kept in an atomic; the transitions are
 * made with compare-and-swap, so a cancel request racing with a worker picking up the job has
 * exactly one winner.
 *
 * The closure and the result storage live in the derived @ref result_job.
 */
struct job_impl : std::enable_shared_from_this<job_impl> {
    //! Unique identifier of the job
    const std::uint64_t id_;
    //! The current state; one of the values of job_state
    std::atomic<int> state_{static_cast<int>(job_state::created)};
    //! Set when a cancel is requested; the closure can poll this flag
    std::atomic<bool> cancel_requested_{false};
    //! Set by the first continuation that decides the outcome on the return context (delivery or
    //! timeout); the other one becomes a no-op
    std::atomic<bool> settled_{false};
    //! Set when the result of the job was retrieved through await()
    std::atomic<bool> observed_{false};
    //! The error captured while executing the closure. Written before the terminal state is
    //! published.
    std::exception_ptr error_;

    //! The scope owning this job; can be empty
    std::weak_ptr<scope_impl> owner_;
    //! The pool in which the job is queued; used to remove the job on cancellation
    std::weak_ptr<pool_data> pool_;
    //! The context on which the outcome is delivered; can be null
    execution_context* return_ctx_{nullptr};
    //! Called on `return_ctx_` when the job is completed or failed
    std::function<void(job_impl&)> deliver_;
    //! True for jobs created by `async`; their errors are raised when awaited
    bool is_deferred_{false};

    job_impl();
    virtual ~job_impl();

    job_impl(const job_impl&) = delete;
    job_impl& operator=(const job_impl&) = delete;

    //! Calls the closure and stores the result. Can throw.
    virtual void invoke() = 0;
    //! Drops the result computed by the closure
    virtual void discard_result() {}

    job_state state() const {
        return static_cast<job_state>(state_.load(std::memory_order_acquire));
    }
    bool is_terminal() const { return looper::is_terminal(state()); }

    //! Moves the job from created to running. Returns false if the job was cancelled meanwhile.
    bool try_start();

    //! Executes the closure and moves the job to a terminal state. Posts the delivery
    //! continuation, if needed. Must be called after a successful try_start().
    void run() noexcept;

    //! Requests cancellation. A created job becomes cancelled immediately (returns true); a
    //! running job only gets the cooperative flag set; a terminal job is left untouched.
    bool request_cancel();

    //! Marks the outcome as decided on the return context. Returns true for the first caller.
    bool try_settle() { return !settled_.exchange(true); }

    //! Blocks until the job reaches a terminal state
    void wait();
    //! Blocks until the job reaches a terminal state, or the timeout expires
    bool wait_for(std::chrono::nanoseconds timeout);

    //! Registers a function to be called (on an arbitrary thread) once the job is terminal. If the
    //! job is already terminal, the function is called immediately.
    void when_terminal(task_function f);

private:
    //! Guards the waiters and the sleeping of awaiting threads
    std::mutex mutex_;
    std::condition_variable done_cv_;
    //! Functions to be called when the job becomes terminal
    std::vector<task_function> waiters_;

    //! Tries to perform the given transition; on success notifies everybody interested
    bool transition(job_state from, job_state to);
    //! Called exactly once, after the job becomes terminal
    void on_terminal();
    //! Posts the delivery continuation to the return context
    void post_delivery();
};

//! A job whose closure returns a value of type T
template <typename T>
struct result_job : job_impl {
    std::function<T()> fun_;
    std::optional<T> value_;

    template <typename F>
    explicit result_job(F&& f)
        : fun_(std::forward<F>(f)) {}

    void invoke() override { value_.emplace(fun_()); }
    void discard_result() override { value_.reset(); }
};

//! A job whose closure returns nothing
template <>
struct result_job<void> : job_impl {
    std::function<void()> fun_;

    template <typename F>
    explicit result_job(F&& f)
        : fun_(std::forward<F>(f)) {}

    void invoke() override { fun_(); }
};

//! Rethrows the error of a terminal job that is not completed
void throw_if_not_completed(const job_impl& j);

//! Called by the job when it becomes terminal, to let the owning scope know
void on_scope_job_terminal(scope_impl& s, job_impl& j);

//! Called by the job when it is cancelled before being started, to drop it from the pool's queue
void remove_from_pool(pool_data& p, job_impl& j);

//! Gives access to the implementation behind job handles
struct job_access {
    template <typename Handle>
    static const std::shared_ptr<job_impl>& get_impl(const Handle& h) {
        return h.impl_;
    }
    template <typename Handle>
    static Handle make(std::shared_ptr<job_impl> impl) {
        return Handle{std::move(impl)};
    }
};

} // namespace detail
} // namespace looper

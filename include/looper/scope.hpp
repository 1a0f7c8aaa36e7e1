#pragma once

#include "job.hpp"
#include "deferred.hpp"
#include "dispatcher_pool.hpp"
#include "execution_context.hpp"
#include "except_fun_type.hpp"
#include "detail/job_impl.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace looper {

namespace detail {

//! Routes the error of a launched job to the exception handler of its scope
void on_launch_error(job_impl& j, std::exception_ptr ex);

//! Value consumer used when launching without one
struct ignore_value {
    template <typename... Ts>
    void operator()(Ts&&...) const {}
};

} // namespace detail

inline namespace v1 {

/**
 * @brief      Structured-concurrency boundary that owns background jobs.
 *
 * All the jobs launched through a scope are owned by it. A scope can be cancelled, which cancels all
 * the jobs it owns and all its child scopes, transitively. A scope can be waited for (see
 * @ref await_quiescence()) and, at the end, it must be closed (see @ref close()).
 *
 * scope implements shared-copy semantics, similar to @ref job. The copies refer to the same
 * ownership boundary.
 *
 * **Launching work**
 *
 * There are two flavors:
 *  - @ref launch() is fire-and-forget: the value produced by the closure is handed to a consumer
 *    on the given execution context; errors go to the scope's exception handler, also on that
 *    context
 *  - @ref async() returns a @ref deferred; the error of the closure is stored and raised when the
 *    deferred is awaited
 *
 * **Error handling**
 *
 * The default exception handler logs the error and cancels the sibling jobs. The scope itself is
 * not flagged as cancelled, so new work can still be launched. One can install a different handler
 * with @ref set_exception_handler().
 *
 * If a deferred job fails and nobody awaits it, the error is reported to the exception handler
 * when the scope is closed.
 *
 * @see job, deferred, dispatcher_pool
 */
class scope {
public:
    /**
     * @brief      Default constructor
     *
     * Creates an empty scope; no operations can be called on it. Used to mark the absence of a
     * parent.
     *
     * @see create()
     */
    scope() = default;
    ~scope() = default;

    scope(const scope&) = default;
    scope(scope&&) = default;
    scope& operator=(const scope&) = default;
    scope& operator=(scope&&) = default;

    /**
     * @brief      Creates a scope whose jobs run on the given pool
     *
     * @param      pool    The pool that executes the jobs; must outlive the scope
     * @param      parent  The parent scope (optional); cancelling the parent cancels this scope too
     *
     * @return     The newly created scope
     */
    static scope create(dispatcher_pool& pool, const scope& parent = {});

    //! Creates a scope whose jobs run on the default pool
    static scope create(const scope& parent = {});

    //! Checks if this is a valid scope, obtained through @ref create()
    explicit operator bool() const { return static_cast<bool>(impl_); }

    /**
     * @brief      Launches a closure, delivering its value to the given context
     *
     * @param      f           The closure to be executed on the pool
     * @param      return_ctx  The context on which `on_value` and the error handler are called
     * @param      on_value    Consumer for the value produced by `f`; optional
     *
     * @return     A handle to the launched job
     *
     * The consumer is called exactly once, on `return_ctx`, if the job completes. If the closure
     * throws, the error goes to the scope's exception handler. If the job is cancelled, neither is
     * called.
     *
     * Throws @ref rejected_submission_error if the scope is cancelled or closed, or if the pool
     * rejects the job; in that case `f` never runs.
     */
    template <typename F, typename C = detail::ignore_value>
    job launch(F&& f, execution_context& return_ctx, C&& on_value = {}) {
        auto j = make_launched_job(std::forward<F>(f), return_ctx, std::forward<C>(on_value));
        do_launch(j);
        return detail::job_access::make<job>(std::move(j));
    }

    /**
     * @brief      Launches a closure whose outcome must be delivered within the given time
     *
     * @param      f           The closure to be executed on the pool
     * @param      return_ctx  The context on which `on_value` and the error handler are called
     * @param      timeout     The time, as measured by the clock of `return_ctx`, the job has
     * @param      on_value    Consumer for the value produced by `f`
     *
     * @return     A handle to the launched job
     *
     * A timer is started on `return_ctx`. The delivery of the result and the expiration of the
     * timer race on `return_ctx`; whichever runs first wins. If the timer wins, the job is
     * cancelled and a @ref timeout_error is passed to the exception handler; the late result has
     * no effect.
     */
    template <typename F, typename C>
    job launch_with_timeout(F&& f, execution_context& return_ctx,
            std::chrono::nanoseconds timeout, C&& on_value) {
        auto j = make_launched_job(std::forward<F>(f), return_ctx, std::forward<C>(on_value));
        do_launch(j);
        arm_timeout(j, return_ctx, timeout);
        return detail::job_access::make<job>(std::move(j));
    }

    /**
     * @brief      Starts a closure whose result can be awaited later
     *
     * @param      f     The closure to be executed on the pool
     *
     * @return     A deferred handle that can be awaited
     *
     * Throws @ref rejected_submission_error if the scope is cancelled or closed, or if the pool
     * rejects the job.
     */
    template <typename F>
    deferred<detail::result_of_t<F>> async(F&& f) {
        using res_t = detail::result_of_t<F>;
        std::shared_ptr<detail::job_impl> j =
                std::make_shared<detail::result_job<res_t>>(std::forward<F>(f));
        j->is_deferred_ = true;
        do_launch(j);
        return detail::job_access::make<deferred<res_t>>(std::move(j));
    }

    /**
     * @brief      Cancels the scope
     *
     * Marks the scope as cancelled, cancels all the jobs it owns, and cancels all its child scopes.
     * Subsequent launches throw @ref rejected_submission_error. Cancelling multiple times has the
     * same effect as cancelling once.
     */
    void cancel();

    //! Cancels the jobs owned by this scope, without marking the scope as cancelled
    void cancel_jobs();

    //! Checks if this scope, or one of its ancestors, was cancelled
    bool is_cancelled() const;

    /**
     * @brief      Sets the function to be called when a launched job fails
     *
     * @param      except_fun  The function to be called on exceptions
     *
     * For jobs started with @ref launch(), the handler is called on the job's return context. At
     * @ref close(), the handler is also called for the failed deferred jobs that were never
     * awaited.
     */
    void set_exception_handler(except_fun_t except_fun);

    //! Returns the number of owned jobs that did not reach a terminal state yet
    std::size_t num_active_jobs() const;

    //! Checks whether all the owned jobs reached a terminal state
    bool is_quiescent() const;

    //! Blocks until all the owned jobs reach a terminal state
    void await_quiescence() const;

    /**
     * @brief      Blocks until all the owned jobs are terminal, or the timeout expires
     *
     * @return     True if the scope became quiescent in the given time
     */
    bool await_quiescence(std::chrono::nanoseconds timeout) const;

    /**
     * @brief      Tears down the scope
     *
     * @param      timeout  How long to wait for the owned jobs to finish
     *
     * @return     True if the scope became quiescent before the timeout
     *
     * Waits for the owned jobs to finish. The jobs still pending after the timeout are cancelled.
     * Reports failed deferred jobs that were never awaited, detaches the scope from its parent
     * and drops the references to the jobs. After this, no new jobs can be launched.
     */
    bool close(std::chrono::nanoseconds timeout);

    friend bool operator==(const scope& l, const scope& r) { return l.impl_ == r.impl_; }
    friend bool operator!=(const scope& l, const scope& r) { return l.impl_ != r.impl_; }

private:
    //! The implementation data; shared between the copies of the scope and referenced by the jobs
    std::shared_ptr<detail::scope_impl> impl_;

    //! Registers the job in the scope, and submits it to the pool
    void do_launch(const std::shared_ptr<detail::job_impl>& j);

    //! Posts the timer that races against the delivery of the job
    void arm_timeout(const std::shared_ptr<detail::job_impl>& j, execution_context& ctx,
            std::chrono::nanoseconds timeout);

    template <typename F, typename C>
    static std::shared_ptr<detail::job_impl> make_launched_job(
            F&& f, execution_context& return_ctx, C&& on_value) {
        using res_t = detail::result_of_t<F>;
        auto j = std::make_shared<detail::result_job<res_t>>(std::forward<F>(f));
        j->return_ctx_ = &return_ctx;
        j->deliver_ = [on_value = std::forward<C>(on_value)](detail::job_impl& ji) mutable {
            if (ji.state() == job_state::failed) {
                detail::on_launch_error(ji, ji.error_);
                return;
            }
            if constexpr (std::is_void<res_t>::value)
                on_value();
            else
                on_value(std::move(*static_cast<detail::result_job<res_t>&>(ji).value_));
        };
        return j;
    }
};

} // namespace v1
} // namespace looper

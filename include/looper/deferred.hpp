#pragma once

#include "job.hpp"
#include "errors.hpp"
#include "execution_context.hpp"

#include <chrono>
#include <memory>
#include <type_traits>
#include <utility>

namespace looper {

inline namespace v1 {

/**
 * @brief      A job whose result can be retrieved later.
 *
 * @tparam     T     The type of the value produced by the closure; can be `void`.
 *
 * The result of the job is cached once the job reaches a terminal state. Awaiting the same deferred
 * multiple times yields the same outcome; the closure is never executed again:
 *  - for a completed job, @ref await() returns the value
 *  - for a failed job, @ref await() rethrows the error thrown by the closure
 *  - for a cancelled job, @ref await() throws @ref cancellation_error
 *
 * There are two ways of waiting for the result:
 *  - @ref await() blocks the calling thread until the job is done
 *  - @ref on_ready() does not block; it posts a continuation into an execution context once the
 *    job is done. The continuation receives the deferred object and calls @ref await() on it, which
 *    returns immediately.
 *
 * If the job fails and nobody awaits it, the error is reported when the owning @ref scope is
 * closed.
 *
 * @see scope::async(), dispatcher_pool::submit()
 */
template <typename T>
class deferred : public job {
public:
    using value_type = T;
    //! The type returned by @ref await(); a reference to the value cached in the job
    using result_type =
            std::conditional_t<std::is_void<T>::value, void, std::add_lvalue_reference_t<const T>>;

    //! Creates an empty handle
    deferred() = default;

    /**
     * @brief      Waits for the job to finish and returns its result
     *
     * @return     The value returned by the closure
     *
     * Rethrows the error of a failed job; throws @ref cancellation_error for a cancelled job. The
     * returned reference stays valid as long as a handle to the job exists.
     */
    result_type await() const {
        impl_->wait();
        return get_result();
    }

    /**
     * @brief      Waits for a limited amount of time for the job to finish
     *
     * @param      timeout  The maximum time to wait
     *
     * @return     The value returned by the closure
     *
     * If the job doesn't finish in time, it is cancelled and this throws @ref timeout_error.
     * Otherwise, behaves like @ref await().
     */
    result_type await_for(std::chrono::nanoseconds timeout) const {
        if (!impl_->wait_for(timeout)) {
            impl_->request_cancel();
            throw timeout_error{};
        }
        return get_result();
    }

    /**
     * @brief      Posts a continuation into the given context once the job is done
     *
     * @param      ctx   The context in which the continuation needs to be executed
     * @param      f     The continuation; called with a copy of this deferred object
     *
     * This is the non-blocking form of awaiting. The continuation is posted for all the terminal
     * states, including cancellation. If the job is already done, the continuation is posted
     * immediately.
     */
    template <typename F>
    void on_ready(execution_context& ctx, F&& f) const {
        auto ctx_ptr = &ctx;
        impl_->when_terminal([impl = impl_, ctx_ptr, f = std::forward<F>(f)]() {
            ctx_ptr->post([impl, f]() { f(deferred<T>{impl}); });
        });
    }

private:
    explicit deferred(std::shared_ptr<detail::job_impl> impl)
        : job(std::move(impl)) {}

    result_type get_result() const {
        impl_->observed_.store(true);
        detail::throw_if_not_completed(*impl_);
        if constexpr (std::is_void<T>::value)
            return;
        else
            return *static_cast<const detail::result_job<T>&>(*impl_).value_;
    }

    friend detail::job_access;
};

} // namespace v1
} // namespace looper

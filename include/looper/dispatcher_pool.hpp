#pragma once

#include "deferred.hpp"
#include "init.hpp"
#include "execution_context.hpp"
#include "detail/job_impl.hpp"

#include <cstddef>
#include <memory>
#include <utility>

namespace looper {

inline namespace v1 {

class scope;

/**
 * @brief      A bounded pool of worker threads that execute background closures.
 *
 * The pool is created with a fixed number of persistent worker threads. Submitted closures are
 * placed in a FIFO work queue; each worker repeatedly takes the oldest job in the queue, executes
 * it, records its outcome and, if the job has a return context, posts a continuation delivering the
 * outcome into that context.
 *
 * **Guarantees**:
 *  - no more than @ref num_workers() closures are executed at the same time
 *  - jobs are taken from the queue in submission order; their completion order is not guaranteed
 *  - queued jobs are never dropped; they are only deferred until a worker is free
 *  - a job cancelled before a worker picks it up is removed from the queue and never executed
 *
 * The pool must outlive the scopes that use it.
 *
 * @see scope, job, deferred
 */
class dispatcher_pool {
public:
    /**
     * @brief      Constructs a pool with the given number of workers
     *
     * @param      num_workers  The number of worker threads; 0 = number of cores available
     */
    explicit dispatcher_pool(std::size_t num_workers);

    /**
     * @brief      Constructs a pool from a configuration object
     *
     * @param      config  The configuration; uses `num_workers_`, `max_pending_` and
     *                     `worker_start_fun_`
     */
    explicit dispatcher_pool(const init_data& config = {});

    //! Destructor. Equivalent to calling @ref shutdown().
    ~dispatcher_pool();

    dispatcher_pool(const dispatcher_pool&) = delete;
    dispatcher_pool& operator=(const dispatcher_pool&) = delete;

    /**
     * @brief      Submits a closure to be executed in the background
     *
     * @param      f     The closure to be executed; takes no arguments
     *
     * @return     A handle that can be used to cancel the job and to await its result
     *
     * Returns immediately. Throws @ref rejected_submission_error if the pool was shut down or if
     * its queue is full.
     */
    template <typename F>
    deferred<detail::result_of_t<F>> submit(F&& f) {
        using res_t = detail::result_of_t<F>;
        auto j = std::make_shared<detail::result_job<res_t>>(std::forward<F>(f));
        j->is_deferred_ = true;
        do_submit(j);
        return detail::job_access::make<deferred<res_t>>(std::move(j));
    }

    /**
     * @brief      Submits a closure, delivering its outcome to the given context
     *
     * @param      f           The closure to be executed; takes no arguments
     * @param      return_ctx  The context in which `on_done` is called
     * @param      on_done     Called with the @ref deferred handle, once the job is completed or
     *                         failed; calling `await()` on the handle returns immediately
     *
     * @return     A handle to the job
     *
     * If the job is cancelled, `on_done` is not called.
     */
    template <typename F, typename C>
    deferred<detail::result_of_t<F>> submit(F&& f, execution_context& return_ctx, C&& on_done) {
        using res_t = detail::result_of_t<F>;
        auto j = std::make_shared<detail::result_job<res_t>>(std::forward<F>(f));
        j->is_deferred_ = true;
        j->return_ctx_ = &return_ctx;
        j->deliver_ = [on_done = std::forward<C>(on_done)](detail::job_impl& ji) {
            on_done(detail::job_access::make<deferred<res_t>>(ji.shared_from_this()));
        };
        do_submit(j);
        return detail::job_access::make<deferred<res_t>>(std::move(j));
    }

    /**
     * @brief      Stops accepting new jobs, and waits for the submitted ones to finish
     *
     * All the jobs already in the queue are executed (unless cancelled). After this returns, the
     * worker threads are joined, and any further submission throws
     * @ref rejected_submission_error.
     *
     * Calling this from one of the pool's workers throws `std::logic_error`. Calling it multiple
     * times is allowed.
     */
    void shutdown();

    //! Checks if @ref shutdown() was called
    bool is_shut_down() const;

    //! Returns the number of worker threads
    std::size_t num_workers() const;

    //! Returns the number of closures being executed right now
    std::size_t num_active() const;

    //! Returns the number of jobs waiting in the queue
    std::size_t num_pending() const;

    //! Checks if the current thread is one of the pool's workers
    bool running_in_this_thread() const;

private:
    //! The implementation data; shared with the jobs, so that they can leave the queue when
    //! cancelled
    std::shared_ptr<detail::pool_data> impl_;

    //! Enqueues an already constructed job
    void do_submit(const std::shared_ptr<detail::job_impl>& j);

    friend scope;
};

} // namespace v1
} // namespace looper

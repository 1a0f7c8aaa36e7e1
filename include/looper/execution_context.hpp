#pragma once

#include "task.hpp"
#include "clock.hpp"
#include "except_fun_type.hpp"

#include <memory>
#include <string>

namespace looper {

inline namespace v1 {

/**
 * @brief      A single-threaded home for continuations, drained by a cooperative loop.
 *
 * An execution context owns a FIFO mailbox of continuations (zero-argument callables). Any thread
 * can post continuations into it; one thread at a time drains it by calling @ref run() or
 * @ref poll(). The thread that drains the context is its *home thread*; all the continuations of
 * the context are executed there, one after the other.
 *
 * The typical usage is to have one "main" context, on which the results of background jobs are
 * delivered:
 *
 *      looper::execution_context main_ctx{"main"};
 *      looper::dispatcher_pool pool{4};
 *      auto sc = looper::scope::create(pool);
 *      sc.launch([] { return compute(); }, main_ctx, [](int v) { show(v); });
 *      main_ctx.run(); // show() is called here, on this thread
 *
 * **Guarantees**:
 *  - continuations posted to the same context execute in the order in which they were posted
 *  - a running continuation is never interrupted; the next continuation is taken only after the
 *    previous one finished
 *  - a continuation posted from within a continuation of the same context is appended after all
 *    the continuations already in the mailbox; it is never executed inline
 *  - an exception escaping a continuation is reported to the exception handler and the loop
 *    continues with the next continuation
 *
 * Delayed continuations (see @ref post_delayed()) are kept aside until their due time, as
 * measured by the context's @ref clock; when due they join the mailbox, ordered by due time and,
 * for equal due times, by posting order.
 *
 * The context must outlive all the jobs that deliver results to it.
 *
 * @see dispatcher_pool, scope
 */
class execution_context {
public:
    /**
     * @brief      Constructs an execution context
     *
     * @param      label  A label for the context; used for logging
     * @param      clk    The clock used for delayed continuations; must outlive the context
     */
    explicit execution_context(
            std::string label = "main", clock& clk = steady_clock_source::instance());
    //! Destructor. Pending continuations are discarded without being executed.
    ~execution_context();

    execution_context(const execution_context&) = delete;
    execution_context& operator=(const execution_context&) = delete;
    execution_context(execution_context&&) = delete;
    execution_context& operator=(execution_context&&) = delete;

    /**
     * @brief      Posts a continuation in the mailbox of the context
     *
     * @param      f     The continuation to be executed on the home thread of the context
     *
     * Returns immediately. Can be called from any thread, including from within continuations of
     * this context. Posting to a stopped context is allowed; the continuation will be executed
     * when the context is run again.
     */
    void post(task_function f);

    /**
     * @brief      Posts a continuation that becomes ready after the given delay
     *
     * @param      f      The continuation to be executed
     * @param      delay  The time, measured by the context's clock, after which `f` is ready
     *
     * A zero (or negative) delay makes the continuation ready at the next loop iteration, after the
     * continuations already in the mailbox.
     */
    void post_delayed(task_function f, clock::duration delay);

    /**
     * @brief      Runs the cooperative loop of the context on the current thread
     *
     * @return     The number of continuations executed
     *
     * Repeatedly takes the oldest ready continuation and executes it. When nothing is ready, the
     * current thread sleeps until something is posted, a delayed continuation becomes due, or the
     * context is stopped. Returns after @ref stop() is called, once the continuation being executed
     * (if any) finishes.
     *
     * Throws `std::logic_error` if the context is already being run by another thread.
     *
     * @see poll(), stop()
     */
    std::size_t run();

    /**
     * @brief      Executes the continuations that are ready, without blocking
     *
     * @return     The number of continuations executed
     *
     * Only the continuations that are ready when the call starts are executed; continuations posted
     * while polling are left for the next call. Stops early if @ref stop() is called.
     */
    std::size_t poll();

    /**
     * @brief      Asks the loop to stop
     *
     * No further continuations are taken from the mailbox; @ref run() returns once the continuation
     * in progress finishes. The continuations still in the mailbox are kept.
     */
    void stop();

    //! Clears the stopped flag, so that the context can be run again
    void restart();

    //! Checks if the context was stopped
    bool stopped() const;

    //! Returns the number of continuations in the mailbox (ready or delayed)
    std::size_t num_pending() const;

    //! Returns the label given at construction
    const std::string& label() const;

    //! Returns the clock of this context
    clock& get_clock() const;

    //! Checks whether the current thread is draining this context
    bool running_in_this_thread() const;

    /**
     * @brief      Returns the context being drained on the current thread
     *
     * @return     The context, or null if the current thread is not inside @ref run() or
     *             @ref poll().
     */
    static execution_context* current();

    /**
     * @brief      Sets the function to be called whenever a continuation throws
     *
     * @param      except_fun  The function to be called on exceptions
     *
     * If no handler is set, the exceptions are logged at error level. The handler is called on the
     * home thread of the context.
     */
    void set_exception_handler(except_fun_t except_fun);

private:
    struct impl;

    //! The implementation data; use pimpl idiom
    std::unique_ptr<impl> impl_;
};

} // namespace v1
} // namespace looper

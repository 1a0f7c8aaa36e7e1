#include "looper/execution_context.hpp"
#include "looper/data/concurrent_queue.hpp"
#include "looper/detail/except_utils.hpp"
#include "looper/profiling.hpp"
#include "looper/log.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace looper {

namespace detail {

//! TLS pointer to the context being drained on the current thread.
//! Set and reset around each run() / poll() call.
thread_local execution_context* g_current_context{nullptr};

//! A continuation that waits for its due time
struct timer_entry {
    clock::time_point due_;
    //! Posting order; breaks ties between entries with the same due time
    std::uint64_t seq_;
    task_function fun_;
};

//! Ordering for a min-heap of timers
struct timer_later {
    bool operator()(const timer_entry& l, const timer_entry& r) const {
        return l.due_ > r.due_ || (l.due_ == r.due_ && l.seq_ > r.seq_);
    }
};

} // namespace detail

inline namespace v1 {

struct execution_context::impl {
    //! The label of the context
    std::string label_;
    //! The clock used to decide when delayed continuations are due
    clock& clock_;
    //! The continuations ready to be executed, in posting order
    concurrent_queue<task_function> mailbox_;

    //! Guards the timers and the sleeping of the home thread
    mutable std::mutex mutex_;
    //! Used to wake up the home thread when there is something to do
    std::condition_variable wakeup_;
    //! Heap of delayed continuations; the earliest is at the front
    std::vector<detail::timer_entry> timers_;
    //! Sequence number for the next delayed continuation
    std::uint64_t next_seq_{0};

    //! Set by stop(), cleared by restart()
    std::atomic<bool> stopped_{false};
    //! True while a thread is inside run() or poll()
    std::atomic<bool> draining_{false};

    //! Handler for exceptions thrown by continuations
    except_fun_t except_fun_;

    impl(std::string label, clock& clk)
        : label_(std::move(label))
        , clock_(clk) {}

    //! Wakes up the home thread, if sleeping
    void notify() {
        { std::lock_guard<std::mutex> lock{mutex_}; }
        wakeup_.notify_all();
    }

    //! Moves all the due timers into the mailbox, in due order. Expects `mutex_` to be held.
    void collect_due_timers() {
        if (timers_.empty())
            return;
        auto now = clock_.now();
        while (!timers_.empty() && timers_.front().due_ <= now) {
            std::pop_heap(timers_.begin(), timers_.end(), detail::timer_later{});
            mailbox_.push(std::move(timers_.back().fun_));
            timers_.pop_back();
        }
    }

    //! Checks whether the home thread has something to do. Expects `mutex_` to be held.
    bool has_work() const {
        return stopped_.load() || !mailbox_.empty() ||
               (!timers_.empty() && timers_.front().due_ <= clock_.now());
    }

    //! Puts the home thread to sleep until there is something to do
    void wait_for_work() {
        LOOPER_PROFILING_SCOPE_NC("idle", LOOPER_PROFILING_COLOR_SILVER);
        std::unique_lock<std::mutex> lock{mutex_};
        auto pred = [this] { return has_work(); };
        if (timers_.empty())
            wakeup_.wait(lock, pred);
        else {
            // The clock may be a manual one; in that case, its listener wakes us on changes
            auto delay = timers_.front().due_ - clock_.now();
            wakeup_.wait_for(lock, delay, pred);
        }
    }

    //! Pops one continuation from the mailbox and executes it.
    //! Returns false if the mailbox was empty.
    bool pop_and_execute() {
        task_function f;
        if (!mailbox_.try_pop(f))
            return false;
        LOOPER_PROFILING_SCOPE_N("continuation");
        try {
            f();
        } catch (...) {
            except_fun_t handler;
            {
                std::lock_guard<std::mutex> lock{mutex_};
                handler = except_fun_;
            }
            detail::report_exception(handler, std::current_exception(), label_.c_str());
        }
        return true;
    }
};

namespace {

//! Marks the current thread as the home thread of the context, for the duration of a drain
struct drain_guard {
    execution_context* prev_;
    std::atomic<bool>& draining_;

    drain_guard(execution_context* ctx, std::atomic<bool>& draining, const std::string& label)
        : prev_(detail::g_current_context)
        , draining_(draining) {
        if (draining_.exchange(true))
            throw std::logic_error("execution context '" + label + "' is already being run");
        detail::g_current_context = ctx;
    }
    ~drain_guard() {
        detail::g_current_context = prev_;
        draining_.store(false);
    }

    drain_guard(const drain_guard&) = delete;
    drain_guard& operator=(const drain_guard&) = delete;
};

} // namespace

execution_context::execution_context(std::string label, clock& clk)
    : impl_(std::make_unique<impl>(std::move(label), clk)) {
    impl_->clock_.add_listener(this, [p = impl_.get()]() { p->notify(); });
}

execution_context::~execution_context() { impl_->clock_.remove_listener(this); }

void execution_context::post(task_function f) {
    auto size = impl_->mailbox_.push(std::move(f));
    LOOPER_PROFILING_PLOT("looper mailbox", int64_t(size));
    static_cast<void>(size);
    impl_->notify();
}

void execution_context::post_delayed(task_function f, clock::duration delay) {
    {
        std::lock_guard<std::mutex> lock{impl_->mutex_};
        auto due = impl_->clock_.now() + std::max(delay, clock::duration::zero());
        impl_->timers_.push_back(detail::timer_entry{due, impl_->next_seq_++, std::move(f)});
        std::push_heap(impl_->timers_.begin(), impl_->timers_.end(), detail::timer_later{});
    }
    impl_->wakeup_.notify_all();
}

std::size_t execution_context::run() {
    LOOPER_PROFILING_FUNCTION();
    drain_guard guard{this, impl_->draining_, impl_->label_};
    LOOPER_LOG_DEBUG("context '" << impl_->label_ << "' starts running");

    std::size_t count = 0;
    while (!impl_->stopped_.load()) {
        {
            std::lock_guard<std::mutex> lock{impl_->mutex_};
            impl_->collect_due_timers();
        }
        if (impl_->pop_and_execute())
            count++;
        else
            impl_->wait_for_work();
    }

    LOOPER_LOG_DEBUG("context '" << impl_->label_ << "' stopped after " << count << " items");
    return count;
}

std::size_t execution_context::poll() {
    LOOPER_PROFILING_FUNCTION();
    drain_guard guard{this, impl_->draining_, impl_->label_};

    {
        std::lock_guard<std::mutex> lock{impl_->mutex_};
        impl_->collect_due_timers();
    }
    // Only execute what was ready when we started
    auto num_ready = impl_->mailbox_.size();
    std::size_t count = 0;
    while (count < num_ready && !impl_->stopped_.load()) {
        if (!impl_->pop_and_execute())
            break;
        count++;
    }
    return count;
}

void execution_context::stop() {
    impl_->stopped_.store(true);
    impl_->notify();
}

void execution_context::restart() { impl_->stopped_.store(false); }

bool execution_context::stopped() const { return impl_->stopped_.load(); }

std::size_t execution_context::num_pending() const {
    std::lock_guard<std::mutex> lock{impl_->mutex_};
    return impl_->mailbox_.size() + impl_->timers_.size();
}

const std::string& execution_context::label() const { return impl_->label_; }

clock& execution_context::get_clock() const { return impl_->clock_; }

bool execution_context::running_in_this_thread() const {
    return detail::g_current_context == this;
}

execution_context* execution_context::current() { return detail::g_current_context; }

void execution_context::set_exception_handler(except_fun_t except_fun) {
    std::lock_guard<std::mutex> lock{impl_->mutex_};
    impl_->except_fun_ = std::move(except_fun);
}

} // namespace v1
} // namespace looper

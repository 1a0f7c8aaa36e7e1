#include "looper/job.hpp"
#include "looper/errors.hpp"
#include "looper/execution_context.hpp"
#include "looper/detail/except_utils.hpp"
#include "looper/profiling.hpp"
#include "looper/log.hpp"

#include <stdexcept>

namespace looper {
namespace detail {

//! The id to be given to the next job
std::atomic<std::uint64_t> g_next_job_id{1};

//! TLS pointer to the job whose closure runs on the current thread.
//! This will be set and reset at each job execution.
thread_local job_impl* g_current_job{nullptr};

namespace {
struct current_job_guard {
    job_impl* prev_;
    explicit current_job_guard(job_impl* j)
        : prev_(g_current_job) {
        g_current_job = j;
    }
    ~current_job_guard() { g_current_job = prev_; }

    current_job_guard(const current_job_guard&) = delete;
    current_job_guard& operator=(const current_job_guard&) = delete;
};
} // namespace

job_impl::job_impl()
    : id_(g_next_job_id.fetch_add(1, std::memory_order_relaxed)) {}

job_impl::~job_impl() {
    // Failures of awaitable jobs that no scope collects are reported here, if nobody awaited them
    if (is_deferred_ && owner_.expired() && state() == job_state::failed && !observed_.load())
        LOOPER_LOG_WARN("job " << id_ << " failed and was never awaited: " << describe(error_));
}

bool job_impl::transition(job_state from, job_state to) {
    int expected = static_cast<int>(from);
    if (!state_.compare_exchange_strong(
                expected, static_cast<int>(to), std::memory_order_acq_rel))
        return false;
    if (looper::is_terminal(to))
        on_terminal();
    return true;
}

bool job_impl::try_start() { return transition(job_state::created, job_state::running); }

void job_impl::run() noexcept {
    LOOPER_PROFILING_SCOPE_N("job");
    std::exception_ptr ex;
    {
        current_job_guard guard{this};
        try {
            invoke();
        } catch (...) {
            ex = std::current_exception();
        }
    }

    job_state to = job_state::completed;
    if (cancel_requested_.load() || holds_exception<cancellation_error>(ex)) {
        // Whatever the closure produced, nobody is going to see it
        discard_result();
        to = job_state::cancelled;
    } else if (ex) {
        error_ = ex;
        to = job_state::failed;
        LOOPER_LOG_DEBUG("job " << id_ << " failed: " << describe(ex));
    }
    transition(job_state::running, to);

    if (to != job_state::cancelled)
        post_delivery();
}

bool job_impl::request_cancel() {
    // Finished work keeps its outcome
    if (is_terminal())
        return false;
    cancel_requested_.store(true);
    if (transition(job_state::created, job_state::cancelled)) {
        if (auto pool = pool_.lock())
            remove_from_pool(*pool, *this);
        return true;
    }
    return false;
}

void job_impl::wait() {
    std::unique_lock<std::mutex> lock{mutex_};
    done_cv_.wait(lock, [this] { return is_terminal(); });
}

bool job_impl::wait_for(std::chrono::nanoseconds timeout) {
    std::unique_lock<std::mutex> lock{mutex_};
    return done_cv_.wait_for(lock, timeout, [this] { return is_terminal(); });
}

void job_impl::when_terminal(task_function f) {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (!is_terminal()) {
            waiters_.push_back(std::move(f));
            return;
        }
    }
    f();
}

void job_impl::on_terminal() {
    std::vector<task_function> waiters;
    {
        std::lock_guard<std::mutex> lock{mutex_};
        waiters.swap(waiters_);
    }
    done_cv_.notify_all();

    for (auto& w : waiters) {
        try {
            w();
        } catch (...) {
            report_exception({}, std::current_exception(), "job waiter");
        }
    }

    if (auto owner = owner_.lock())
        on_scope_job_terminal(*owner, *this);
}

void job_impl::post_delivery() {
    if (!return_ctx_ || !deliver_)
        return;
    try {
        return_ctx_->post([self = shared_from_this()]() {
            // Only the first one that reaches the return context decides the outcome
            if (!self->try_settle())
                return;
            self->deliver_(*self);
        });
    } catch (...) {
        report_exception({}, std::current_exception(), "job delivery");
    }
}

void throw_if_not_completed(const job_impl& j) {
    switch (j.state()) {
    case job_state::completed:
        return;
    case job_state::failed:
        std::rethrow_exception(j.error_);
    case job_state::cancelled:
        throw cancellation_error{};
    default:
        throw std::logic_error("job is not finished");
    }
}

} // namespace detail

inline namespace v1 {

std::uint64_t job::id() const { return impl_->id_; }

job_state job::state() const { return impl_->state(); }

bool job::is_done() const { return impl_->is_terminal(); }

bool job::cancel() { return impl_->request_cancel(); }

bool job::is_cancel_requested() const { return impl_->cancel_requested_.load(); }

std::exception_ptr job::error() const {
    return impl_->state() == job_state::failed ? impl_->error_ : std::exception_ptr{};
}

void job::wait() const { impl_->wait(); }

bool job::wait_for(std::chrono::nanoseconds timeout) const { return impl_->wait_for(timeout); }

namespace this_job {

std::uint64_t id() {
    auto* j = detail::g_current_job;
    return j ? j->id_ : 0;
}

bool is_cancelled() {
    auto* j = detail::g_current_job;
    return j && j->cancel_requested_.load(std::memory_order_relaxed);
}

void check_cancelled() {
    if (is_cancelled())
        throw cancellation_error{};
}

} // namespace this_job

} // namespace v1
} // namespace looper

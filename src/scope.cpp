#include "looper/scope.hpp"
#include "looper/init.hpp"
#include "looper/errors.hpp"
#include "looper/detail/except_utils.hpp"
#include "looper/profiling.hpp"
#include "looper/log.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace looper {
namespace detail {

//! The data for a scope object. Shared between the copies of the scope, and referenced (weakly) by
//! the jobs it owns and by its parent.
struct scope_impl : std::enable_shared_from_this<scope_impl> {
    //! The parent of this scope
    std::shared_ptr<scope_impl> parent_;
    //! The pool on which the jobs are executed
    dispatcher_pool& pool_;

    //! Set once, when the scope is cancelled
    std::atomic<bool> cancelled_{false};
    //! Set once, when the scope is closed
    std::atomic<bool> closed_{false};

    //! Guards the data below
    mutable std::mutex mutex_;
    //! Notified when the number of active jobs reaches zero
    mutable std::condition_variable quiescent_cv_;
    //! The function to be called for the errors of launched jobs
    except_fun_t except_fun_;
    //! The jobs owned by this scope
    std::vector<std::shared_ptr<job_impl>> jobs_;
    //! The child scopes
    std::vector<std::weak_ptr<scope_impl>> children_;
    //! Number of owned jobs not yet terminal
    std::size_t num_active_{0};

    scope_impl(dispatcher_pool& pool, std::shared_ptr<scope_impl> parent)
        : parent_(std::move(parent))
        , pool_(pool) {}

    bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire) || (parent_ && parent_->is_cancelled());
    }

    //! Adds the job to the list of owned jobs; throws if the scope doesn't accept jobs anymore
    void add_job(const std::shared_ptr<job_impl>& j) {
        std::lock_guard<std::mutex> lock{mutex_};
        if (closed_.load())
            throw rejected_submission_error("scope is closed");
        if (is_cancelled())
            throw rejected_submission_error("scope is cancelled");
        prune_jobs();
        j->owner_ = weak_from_this();
        jobs_.push_back(j);
        num_active_++;
    }

    //! Drops the terminal jobs that carry nothing of interest. Must be called under the lock.
    void prune_jobs() {
        auto is_done = [](const std::shared_ptr<job_impl>& j) {
            return j->is_terminal() && !unobserved_failure(*j);
        };
        jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(), is_done), jobs_.end());
    }

    static bool unobserved_failure(const job_impl& j) {
        return j.is_deferred_ && j.state() == job_state::failed && !j.observed_.load();
    }

    void on_job_terminal() {
        std::lock_guard<std::mutex> lock{mutex_};
        if (num_active_ > 0 && --num_active_ == 0)
            quiescent_cv_.notify_all();
    }

    void cancel_jobs() {
        std::vector<std::shared_ptr<job_impl>> jobs;
        {
            std::lock_guard<std::mutex> lock{mutex_};
            jobs = jobs_;
        }
        // The lock must not be held here; cancelled jobs call back into on_job_terminal()
        for (auto& j : jobs)
            j->request_cancel();
    }

    void cancel() {
        if (cancelled_.exchange(true))
            return;
        LOOPER_PROFILING_SCOPE_N("scope cancel");
        cancel_jobs();

        std::vector<std::weak_ptr<scope_impl>> children;
        {
            std::lock_guard<std::mutex> lock{mutex_};
            children = children_;
        }
        for (auto& c : children) {
            if (auto child = c.lock())
                child->cancel();
        }
    }

    void report_error(std::exception_ptr ex) {
        except_fun_t handler;
        {
            std::lock_guard<std::mutex> lock{mutex_};
            handler = except_fun_;
        }
        if (handler) {
            report_exception(handler, ex, "scope exception handler");
            return;
        }
        LOOPER_LOG_ERROR("job failed: " << describe(ex) << "; cancelling sibling jobs");
        cancel_jobs();
    }

    void add_child(const std::shared_ptr<scope_impl>& child) {
        std::lock_guard<std::mutex> lock{mutex_};
        children_.push_back(child);
    }

    void remove_child(const scope_impl* child) {
        std::lock_guard<std::mutex> lock{mutex_};
        auto pred = [child](const std::weak_ptr<scope_impl>& c) {
            auto p = c.lock();
            return !p || p.get() == child;
        };
        children_.erase(std::remove_if(children_.begin(), children_.end(), pred), children_.end());
    }

    bool wait_quiescent(std::chrono::nanoseconds timeout) const {
        std::unique_lock<std::mutex> lock{mutex_};
        return quiescent_cv_.wait_for(lock, timeout, [this] { return num_active_ == 0; });
    }
};

void on_scope_job_terminal(scope_impl& s, job_impl&) { s.on_job_terminal(); }

void on_launch_error(job_impl& j, std::exception_ptr ex) {
    if (auto owner = j.owner_.lock())
        owner->report_error(ex);
    else
        LOOPER_LOG_ERROR("job " << j.id_ << " failed after its scope was gone: " << describe(ex));
}

} // namespace detail

inline namespace v1 {

scope scope::create(dispatcher_pool& pool, const scope& parent) {
    scope res;
    res.impl_ = std::make_shared<detail::scope_impl>(pool, parent.impl_);
    if (parent.impl_)
        parent.impl_->add_child(res.impl_);
    return res;
}

scope scope::create(const scope& parent) { return create(default_pool(), parent); }

void scope::do_launch(const std::shared_ptr<detail::job_impl>& j) {
    impl_->add_job(j);
    try {
        impl_->pool_.do_submit(j);
    } catch (...) {
        // Never executed; take it out of the active count
        j->request_cancel();
        throw;
    }
    LOOPER_LOG_TRACE("job " << j->id_ << " launched");
}

void scope::arm_timeout(const std::shared_ptr<detail::job_impl>& j, execution_context& ctx,
        std::chrono::nanoseconds timeout) {
    ctx.post_delayed(
            [j]() {
                // A job cancelled by other means does not time out
                if (j->state() == job_state::cancelled || !j->try_settle())
                    return;
                j->request_cancel();
                detail::on_launch_error(*j, std::make_exception_ptr(timeout_error{}));
            },
            timeout);
}

void scope::cancel() { impl_->cancel(); }

void scope::cancel_jobs() { impl_->cancel_jobs(); }

bool scope::is_cancelled() const { return impl_ && impl_->is_cancelled(); }

void scope::set_exception_handler(except_fun_t except_fun) {
    std::lock_guard<std::mutex> lock{impl_->mutex_};
    impl_->except_fun_ = std::move(except_fun);
}

std::size_t scope::num_active_jobs() const {
    std::lock_guard<std::mutex> lock{impl_->mutex_};
    return impl_->num_active_;
}

bool scope::is_quiescent() const { return num_active_jobs() == 0; }

void scope::await_quiescence() const {
    std::unique_lock<std::mutex> lock{impl_->mutex_};
    impl_->quiescent_cv_.wait(lock, [this] { return impl_->num_active_ == 0; });
}

bool scope::await_quiescence(std::chrono::nanoseconds timeout) const {
    return impl_->wait_quiescent(timeout);
}

bool scope::close(std::chrono::nanoseconds timeout) {
    if (impl_->closed_.exchange(true))
        return is_quiescent();

    bool quiescent = impl_->wait_quiescent(timeout);
    if (!quiescent) {
        LOOPER_LOG_WARN("scope closed with " << num_active_jobs() << " active jobs; cancelling them");
        impl_->cancel();
    }

    std::vector<std::shared_ptr<detail::job_impl>> jobs;
    {
        std::lock_guard<std::mutex> lock{impl_->mutex_};
        jobs.swap(impl_->jobs_);
    }
    for (auto& j : jobs) {
        if (detail::scope_impl::unobserved_failure(*j)) {
            j->observed_.store(true);
            impl_->report_error(j->error_);
        }
    }

    if (impl_->parent_)
        impl_->parent_->remove_child(impl_.get());
    return quiescent;
}

} // namespace v1
} // namespace looper

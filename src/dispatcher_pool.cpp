#include "looper/dispatcher_pool.hpp"
#include "looper/data/concurrent_queue.hpp"
#include "looper/low_level/semaphore.hpp"
#include "looper/detail/except_utils.hpp"
#include "looper/profiling.hpp"
#include "looper/log.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace looper {
namespace detail {

//! TLS pointer to the pool owning the current worker thread
thread_local const pool_data* g_current_pool{nullptr};

//! The implementation data of a dispatcher pool
struct pool_data : std::enable_shared_from_this<pool_data> {
    using job_ptr = std::shared_ptr<job_impl>;

    //! The number of worker threads
    const std::size_t count_;
    //! The maximum number of jobs in the queue; 0 = unbounded
    const std::size_t max_pending_;
    //! Function to be called at the start of each worker
    std::function<void()> worker_start_fun_;

    //! The worker threads
    std::vector<std::thread> threads_;
    //! The jobs waiting for a worker
    concurrent_queue<job_ptr> queue_;
    //! Signaled once per enqueued job, and once per worker at shutdown
    semaphore has_work_;
    //! The number of closures in execution
    std::atomic<int> num_active_{0};

    //! Guards accepting new jobs against shutting down
    std::mutex submit_mutex_;
    //! Set when the pool stops accepting jobs
    bool shut_down_{false};
    //! Set when the workers should exit once the queue is drained
    std::atomic<bool> done_{false};
    //! Serializes the joining of the worker threads
    std::mutex join_mutex_;

    pool_data(std::size_t count, std::size_t max_pending, std::function<void()> start_fun)
        : count_(count)
        , max_pending_(max_pending)
        , worker_start_fun_(std::move(start_fun)) {}

    ~pool_data() = default;

    pool_data(const pool_data&) = delete;
    pool_data& operator=(const pool_data&) = delete;

    //! Creates the worker threads
    void start() {
        LOOPER_PROFILING_INIT();
        threads_.reserve(count_);
        for (std::size_t i = 0; i < count_; i++)
            threads_.emplace_back([this]() { worker_run(); });
        LOOPER_LOG_DEBUG("dispatcher pool started with " << count_ << " workers");
    }

    void enqueue(const job_ptr& j) {
        LOOPER_PROFILING_FUNCTION();
        j->pool_ = weak_from_this();
        {
            std::lock_guard<std::mutex> lock{submit_mutex_};
            if (shut_down_)
                throw rejected_submission_error("dispatcher pool is shut down");
            auto to_push = j;
            if (!queue_.try_push(std::move(to_push), max_pending_))
                throw rejected_submission_error("dispatcher pool queue is full");
        }
        LOOPER_PROFILING_PLOT("looper pending jobs", int64_t(queue_.size()));
        has_work_.signal();
    }

    void remove(job_impl& j) {
        // The semaphore keeps its count; a worker will wake up, find nothing, and sleep again
        queue_.erase_if([&j](const job_ptr& p) { return p.get() == &j; });
    }

    //! The run procedure for a worker thread
    void worker_run() {
        LOOPER_PROFILING_SETTHREADNAME("looper_worker");
        g_current_pool = this;
        if (worker_start_fun_) {
            try {
                worker_start_fun_();
            } catch (...) {
                report_exception({}, std::current_exception(), "worker start function");
            }
        }

        while (true) {
            has_work_.wait();
            job_ptr j;
            if (queue_.try_pop(j)) {
                execute(*j);
                continue;
            }
            // Woken up with an empty queue: either shutting down, or a cancelled job left it
            if (done_.load())
                break;
        }
        g_current_pool = nullptr;
    }

    void execute(job_impl& j) {
        // Skip the job if it was cancelled after leaving the queue
        if (!j.try_start())
            return;
        auto active = ++num_active_;
        LOOPER_PROFILING_PLOT("looper active workers", int64_t(active));
        static_cast<void>(active);
        j.run();
        --num_active_;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock{submit_mutex_};
            if (g_current_pool == this)
                throw std::logic_error("cannot shut down a dispatcher pool from its own worker");
            shut_down_ = true;
        }
        if (!done_.exchange(true))
            has_work_.signal(static_cast<int>(count_));
        std::lock_guard<std::mutex> lock{join_mutex_};
        for (auto& t : threads_) {
            if (t.joinable())
                t.join();
        }
    }
};

void remove_from_pool(pool_data& p, job_impl& j) { p.remove(j); }

//! Determines the actual number of workers to create
std::size_t actual_num_workers(int requested) {
    if (requested > 0)
        return static_cast<std::size_t>(requested);
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace detail

inline namespace v1 {

dispatcher_pool::dispatcher_pool(std::size_t num_workers)
    : dispatcher_pool([num_workers]() {
        init_data config;
        config.num_workers_ = static_cast<int>(num_workers);
        return config;
    }()) {}

dispatcher_pool::dispatcher_pool(const init_data& config)
    : impl_(std::make_shared<detail::pool_data>(detail::actual_num_workers(config.num_workers_),
              config.max_pending_, config.worker_start_fun_)) {
    impl_->start();
}

dispatcher_pool::~dispatcher_pool() {
    try {
        impl_->shutdown();
    } catch (const std::exception& ex) {
        LOOPER_LOG_ERROR("dispatcher pool shutdown failed: " << ex.what());
    }
}

void dispatcher_pool::shutdown() { impl_->shutdown(); }

bool dispatcher_pool::is_shut_down() const {
    std::lock_guard<std::mutex> lock{impl_->submit_mutex_};
    return impl_->shut_down_;
}

std::size_t dispatcher_pool::num_workers() const { return impl_->count_; }

std::size_t dispatcher_pool::num_active() const {
    return static_cast<std::size_t>(impl_->num_active_.load());
}

std::size_t dispatcher_pool::num_pending() const { return impl_->queue_.size(); }

bool dispatcher_pool::running_in_this_thread() const {
    return detail::g_current_pool == impl_.get();
}

void dispatcher_pool::do_submit(const std::shared_ptr<detail::job_impl>& j) {
    impl_->enqueue(j);
}

} // namespace v1
} // namespace looper

#include "looper/init.hpp"
#include "looper/dispatcher_pool.hpp"
#include "looper/detail/likely.hpp"
#include "looper/log.hpp"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace looper {
namespace detail {

//! Guards the creation and the destruction of the default pool
std::mutex g_init_mutex;
//! The default pool; null if the library is not initialized
std::unique_ptr<dispatcher_pool> g_default_pool;
//! Fast-path pointer to the default pool
std::atomic<dispatcher_pool*> g_default_pool_ptr{nullptr};
//! Set after registering the shutdown at exit
bool g_atexit_registered{false};

//! Called at exit to shut down the library
void do_shutdown_at_exit() {
    try {
        looper::shutdown();
    } catch (const std::exception& ex) {
        LOOPER_LOG_ERROR("shutdown at exit failed: " << ex.what());
    }
}

//! Actually initializes the library; must be called under g_init_mutex
void do_init(const init_data& config) {
    set_log_level(config.log_level_);
    g_default_pool = std::make_unique<dispatcher_pool>(config);
    g_default_pool_ptr.store(g_default_pool.get(), std::memory_order_release);
    if (!g_atexit_registered) {
        std::atexit(&do_shutdown_at_exit);
        g_atexit_registered = true;
    }
    LOOPER_LOG_INFO("initialized with " << g_default_pool->num_workers() << " workers");
}

//! Parses a non-negative integer from the given environment variable
bool read_env_number(const char* name, unsigned long long& result) {
    const char* env = std::getenv(name);
    if (!env || !*env)
        return false;
    char* end = nullptr;
    errno = 0;
    auto val = std::strtoull(env, &end, 10);
    if (errno != 0 || *end != '\0' || *env == '-') {
        LOOPER_LOG_WARN("ignoring malformed value for " << name << ": '" << env << "'");
        return false;
    }
    result = val;
    return true;
}

} // namespace detail

inline namespace v1 {

init_data init_data::from_env() {
    init_data res;
    unsigned long long val = 0;
    if (detail::read_env_number("LOOPER_NUM_WORKERS", val))
        res.num_workers_ = static_cast<int>(val);
    if (detail::read_env_number("LOOPER_MAX_PENDING", val))
        res.max_pending_ = static_cast<std::size_t>(val);
    if (const char* lvl = std::getenv("LOOPER_LOG_LEVEL"))
        res.log_level_ = parse_log_level(lvl, res.log_level_);
    return res;
}

void init(const init_data& config) {
    std::lock_guard<std::mutex> lock{detail::g_init_mutex};
    if (detail::g_default_pool)
        throw already_initialized();
    detail::do_init(config);
}

bool is_initialized() { return detail::g_default_pool_ptr.load() != nullptr; }

void shutdown() {
    std::unique_ptr<dispatcher_pool> pool;
    {
        std::lock_guard<std::mutex> lock{detail::g_init_mutex};
        if (!detail::g_default_pool)
            return;
        if (detail::g_default_pool->running_in_this_thread())
            throw std::logic_error("cannot shut down looper from one of its workers");
        detail::g_default_pool_ptr.store(nullptr, std::memory_order_release);
        pool = std::move(detail::g_default_pool);
    }
    pool->shutdown();
    LOOPER_LOG_INFO("shut down");
}

dispatcher_pool& default_pool() {
    auto p = detail::g_default_pool_ptr.load(std::memory_order_acquire);
    LOOPER_IF_UNLIKELY(!p) {
        std::lock_guard<std::mutex> lock{detail::g_init_mutex};
        if (!detail::g_default_pool)
            detail::do_init(init_data::from_env());
        p = detail::g_default_pool.get();
    }
    return *p;
}

} // namespace v1
} // namespace looper

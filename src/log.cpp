#include "looper/log.hpp"
#include "looper/profiling.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace looper {
namespace detail {

//! Reads the initial log level from the environment
log_level level_from_env() noexcept {
    const char* env = std::getenv("LOOPER_LOG_LEVEL");
    if (!env)
        return log_level::warn;
    return parse_log_level(env, log_level::warn);
}

std::atomic<int> g_log_level{static_cast<int>(level_from_env())};

//! Guards the sink; both replacing it and calling it
std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

log_sink_t& user_sink() {
    static log_sink_t sink;
    return sink;
}

void default_sink(log_level level, const std::string& msg) {
    std::fprintf(stderr, "[looper] [%s] %s\n", to_string(level), msg.c_str());
}

} // namespace detail

inline namespace v1 {

void set_log_level(log_level level) noexcept {
    detail::g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

log_level get_log_level() noexcept {
    return static_cast<log_level>(detail::g_log_level.load(std::memory_order_relaxed));
}

void set_log_sink(log_sink_t sink) {
    std::lock_guard<std::mutex> lock{detail::sink_mutex()};
    detail::user_sink() = std::move(sink);
}

void log(log_level level, const std::string& msg) noexcept {
    if (!should_log(level))
        return;
    LOOPER_PROFILING_MESSAGE(msg.c_str(), msg.size());
    std::lock_guard<std::mutex> lock{detail::sink_mutex()};
    try {
        auto& sink = detail::user_sink();
        if (sink)
            sink(level, msg);
        else
            detail::default_sink(level, msg);
    } catch (const std::exception& ex) {
        // A failing sink cannot report through itself
        std::fprintf(stderr, "[looper] log sink failed: %s\n", ex.what());
    }
}

const char* to_string(log_level level) noexcept {
    switch (level) {
    case log_level::error:
        return "ERROR";
    case log_level::warn:
        return "WARN";
    case log_level::info:
        return "INFO";
    case log_level::debug:
        return "DEBUG";
    case log_level::trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

log_level parse_log_level(const std::string& name, log_level fallback) noexcept {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "error")
        return log_level::error;
    if (lower == "warn" || lower == "warning")
        return log_level::warn;
    if (lower == "info")
        return log_level::info;
    if (lower == "debug")
        return log_level::debug;
    if (lower == "trace")
        return log_level::trace;
    return fallback;
}

} // namespace v1
} // namespace looper

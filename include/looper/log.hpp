#pragma once

#include <functional>
#include <sstream>
#include <string>

namespace looper {

inline namespace v1 {

//! The severity levels for the log records emitted by looper
enum class log_level : int {
    error = 0,
    warn = 1,
    info = 2,
    debug = 3,
    trace = 4,
};

//! Function that receives all the log records that pass the level filter
using log_sink_t = std::function<void(log_level, const std::string&)>;

/**
 * @brief      Sets the maximum level of the records that reach the sink
 *
 * Records with a level numerically greater than this are dropped. The initial value is read from
 * the `LOOPER_LOG_LEVEL` environment variable (`error`, `warn`, `info`, `debug`, `trace`);
 * defaults to `warn`.
 */
void set_log_level(log_level level) noexcept;

//! Returns the current maximum log level
log_level get_log_level() noexcept;

//! Checks whether records with the given level would reach the sink
inline bool should_log(log_level level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

/**
 * @brief      Replaces the function that receives log records.
 *
 * @param      sink  The new sink; passing an empty function restores the default sink.
 *
 * The default sink writes one line per record to `stderr`. The sink may be called concurrently
 * from the worker threads and from the execution contexts; calls are serialized by looper.
 */
void set_log_sink(log_sink_t sink);

//! Emits a log record; the record is dropped if the level is filtered out
void log(log_level level, const std::string& msg) noexcept;

//! Returns the textual representation of a log level (e.g., "ERROR")
const char* to_string(log_level level) noexcept;

//! Parses a log level name (case insensitive). Returns `fallback` for unknown names.
log_level parse_log_level(const std::string& name, log_level fallback) noexcept;

} // namespace v1
} // namespace looper

#define __IMPL_LOOPER_LOG(level, expr)                                                             \
    do {                                                                                           \
        if (::looper::should_log(level)) {                                                         \
            std::ostringstream __looper_log_os;                                                    \
            __looper_log_os << expr;                                                               \
            ::looper::log(level, __looper_log_os.str());                                           \
        }                                                                                          \
    } while (false)

#define LOOPER_LOG_ERROR(expr) __IMPL_LOOPER_LOG(::looper::log_level::error, expr)
#define LOOPER_LOG_WARN(expr) __IMPL_LOOPER_LOG(::looper::log_level::warn, expr)
#define LOOPER_LOG_INFO(expr) __IMPL_LOOPER_LOG(::looper::log_level::info, expr)
#define LOOPER_LOG_DEBUG(expr) __IMPL_LOOPER_LOG(::looper::log_level::debug, expr)
#define LOOPER_LOG_TRACE(expr) __IMPL_LOOPER_LOG(::looper::log_level::trace, expr)

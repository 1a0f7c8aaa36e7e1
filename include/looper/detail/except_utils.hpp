#pragma once

#include "looper/except_fun_type.hpp"
#include "looper/log.hpp"

#include <exception>
#include <string>

namespace looper {
namespace detail {

//! Returns a human-readable description of the given exception
inline std::string describe(const std::exception_ptr& ex) {
    if (!ex)
        return "no exception";
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

//! Checks whether the given exception is of type `E`
template <typename E>
inline bool holds_exception(const std::exception_ptr& ex) {
    if (!ex)
        return false;
    try {
        std::rethrow_exception(ex);
    } catch (const E&) {
        return true;
    } catch (...) {
        return false;
    }
}

/**
 * @brief      Calls the given exception handler, guarding against the handler itself throwing.
 *
 * @param      except_fun  The handler to be called; if empty, the exception is logged
 * @param      ex          The exception to be reported
 * @param      where       Text describing who reported the exception; used for logging
 */
inline void report_exception(
        const except_fun_t& except_fun, std::exception_ptr ex, const char* where) noexcept {
    try {
        if (except_fun) {
            except_fun(ex);
            return;
        }
        LOOPER_LOG_ERROR(where << ": unhandled exception: " << describe(ex));
    } catch (const std::exception& e) {
        LOOPER_LOG_ERROR(where << ": exception handler failed: " << e.what());
    } catch (...) {
        LOOPER_LOG_ERROR(where << ": exception handler failed with unknown exception");
    }
}

} // namespace detail
} // namespace looper

#pragma once

#include <functional>
#include <exception>

namespace looper {

/**
 * @brief      Type of function to be called for handling exceptions
 *
 * This defines the type of exception handler function used across looper. A handler of this type
 * will be called whenever an exception escapes a continuation or a launched job.
 *
 * @see execution_context::set_exception_handler(), scope::set_exception_handler()
 */
using except_fun_t = std::function<void(std::exception_ptr)>;

} // namespace looper

#pragma once

#include <functional>

namespace looper {

inline namespace v1 {

/**
 * A function type that is compatible with a continuation.
 *
 * This function takes no arguments and returns nothing. It represents generic *work* that can be
 * posted into an @ref execution_context, or that a worker of a @ref dispatcher_pool can execute.
 *
 * @see execution_context::post()
 */
using task_function = std::function<void()>;

} // namespace v1
} // namespace looper

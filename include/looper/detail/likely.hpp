#pragma once

#include "looper/detail/platform.hpp"

#if LOOPER_CPP_COMPILER(gcc) || LOOPER_CPP_COMPILER(clang)

#define LOOPER_IF_LIKELY(cond) if (__builtin_expect(static_cast<bool>(cond), 1))
#define LOOPER_IF_UNLIKELY(cond) if (__builtin_expect(static_cast<bool>(cond), 0))

#else

#define LOOPER_IF_LIKELY(cond) if (cond)
#define LOOPER_IF_UNLIKELY(cond) if (cond)

#endif

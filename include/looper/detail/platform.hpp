#pragma once

// User can specify a "platform include" that can override everything that's in here
#ifdef LOOPER_PLATFORM_INCLUDE
#include LOOPER_PLATFORM_INCLUDE
#endif

// Detect the platform (if we were not given one)
#ifndef LOOPER_PLATFORM

#if __APPLE__
#define LOOPER_PLATFORM_APPLE 1
#elif __linux__ || __FreeBSD__ || __NetBSD__ || __OpenBSD__
#define LOOPER_PLATFORM_LINUX 1
#else
#define LOOPER_PLATFORM_UNKNOWN 1
#endif

#define LOOPER_PLATFORM(X) (LOOPER_PLATFORM_##X)
#endif

// Detect the compiler
#ifndef LOOPER_CPP_COMPILER

#if defined(__clang__)
#define LOOPER_CPP_COMPILER_clang 1
#elif defined(__GNUC__)
#define LOOPER_CPP_COMPILER_gcc 1
#elif defined(_MSC_VER)
#define LOOPER_CPP_COMPILER_msvc 1
#endif

#define LOOPER_CPP_COMPILER(X) (LOOPER_CPP_COMPILER_##X)
#endif

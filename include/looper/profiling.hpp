#pragma once

#include <cstring>

// User can specify a "profiling include" to specify how profiling needs to be done
#ifdef LOOPER_PROFILING_INCLUDE
#include LOOPER_PROFILING_INCLUDE
#endif

#if TRACY_ENABLE

#include "Tracy.hpp"

#define LOOPER_ENABLE_PROFILING 1

#define LOOPER_PROFILING_INIT() static_cast<void>(tracy::GetProfiler())
#define LOOPER_PROFILING_FUNCTION() ZoneScopedN(__FUNCTION__)
#define LOOPER_PROFILING_SCOPE() ZoneScoped
#define LOOPER_PROFILING_SCOPE_N(staticName) ZoneScopedN(staticName)
#define LOOPER_PROFILING_SCOPE_NC(staticName, color) ZoneScopedNC(staticName, color)
#define LOOPER_PROFILING_SET_TEXT(text) ZoneText(text, strlen(text))
#define LOOPER_PROFILING_MESSAGE(text, len) TracyMessage(text, len)
#define LOOPER_PROFILING_PLOT(staticName, val) TracyPlot(staticName, val)
#define LOOPER_PROFILING_SETTHREADNAME(staticName) tracy::SetThreadName(staticName)

#define LOOPER_PROFILING_COLOR_RED 0xFF0000
#define LOOPER_PROFILING_COLOR_GREEN 0x008000
#define LOOPER_PROFILING_COLOR_BLUE 0x0000FF
#define LOOPER_PROFILING_COLOR_SILVER 0xC0C0C0

#endif

#if !LOOPER_ENABLE_PROFILING

#define LOOPER_PROFILING_INIT()                       /*nothing*/
#define LOOPER_PROFILING_FUNCTION()                   /*nothing*/
#define LOOPER_PROFILING_SCOPE()                      /*nothing*/
#define LOOPER_PROFILING_SCOPE_N(staticName)          /*nothing*/
#define LOOPER_PROFILING_SCOPE_NC(staticName, color)  /*nothing*/
#define LOOPER_PROFILING_SET_TEXT(text)               /*nothing*/
#define LOOPER_PROFILING_MESSAGE(text, len)           /*nothing*/
#define LOOPER_PROFILING_PLOT(staticName, val)        /*nothing*/
#define LOOPER_PROFILING_SETTHREADNAME(staticName)    /*nothing*/

#define LOOPER_PROFILING_COLOR_RED    /*nothing*/
#define LOOPER_PROFILING_COLOR_GREEN  /*nothing*/
#define LOOPER_PROFILING_COLOR_BLUE   /*nothing*/
#define LOOPER_PROFILING_COLOR_SILVER /*nothing*/

#endif

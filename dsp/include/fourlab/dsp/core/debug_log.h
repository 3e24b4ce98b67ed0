// ==============================================================================
// Layer 0: Core Utility - Debug Logging
// ==============================================================================
// Compile-time gated diagnostic output. Build with -DFOURLAB_DSP_DEBUG=1 to
// trace validation failures; otherwise every FOURLAB_DSP_LOG call compiles
// away and the engine stays free of I/O.
// ==============================================================================

#pragma once

#ifndef FOURLAB_DSP_DEBUG
#define FOURLAB_DSP_DEBUG 0
#endif

#if FOURLAB_DSP_DEBUG
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace Fourlab {
namespace DSP {
namespace detail {

inline void debugLog(const char* fmt, ...) {
    char buf[512];
    int prefix = std::snprintf(buf, sizeof(buf), "[FOURLAB] ");
    if (prefix < 0) prefix = 0;
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf + prefix, sizeof(buf) - static_cast<size_t>(prefix), fmt, args);
    va_end(args);
#ifdef _WIN32
    OutputDebugStringA(buf);
    OutputDebugStringA("\n");
#else
    std::fprintf(stderr, "%s\n", buf);
#endif
}

} // namespace detail
} // namespace DSP
} // namespace Fourlab

#define FOURLAB_DSP_LOG(...) ::Fourlab::DSP::detail::debugLog(__VA_ARGS__)
#else
#define FOURLAB_DSP_LOG(...) ((void)0)
#endif

// SPDX-License-Identifier: MIT
// ch32blink - printf logging, compiled out unless stdout is retargeted

#pragma once

#include <cstdio>

#ifndef CH32BLINK_LOG_ENABLED
#define CH32BLINK_LOG_ENABLED 0
#endif

namespace ch32blink {

constexpr bool LOG_ENABLED = CH32BLINK_LOG_ENABLED != 0;

// printf when CH32BLINK_LOG_ENABLED is set, otherwise nothing
template <typename... Args>
inline void log_info(const char* format, Args... args) {
    if constexpr (LOG_ENABLED) {
        std::printf(format, args...);
    } else {
        (void)format;
        ((void)args, ...);
    }
}

} // namespace ch32blink

// SPDX-License-Identifier: MIT
// ch32blink - build-time configuration
//
// Every value here can be overridden with a compile definition; the
// CMake cache variables of the same name feed them.

#pragma once

#include <cstdint>

// LED bank as a character literal: 'A', 'C' or 'D'
#ifndef CH32BLINK_LED_BANK
#define CH32BLINK_LED_BANK 'A'
#endif

#ifndef CH32BLINK_LED_PIN
#define CH32BLINK_LED_PIN 1
#endif

// Half of the blink period; 500 ms gives a 1 Hz square wave
#ifndef CH32BLINK_HALF_PERIOD_MS
#define CH32BLINK_HALF_PERIOD_MS 500
#endif

// 1: calibrated spin loop instead of polling SysTick
#ifndef CH32BLINK_SPIN_DELAY
#define CH32BLINK_SPIN_DELAY 0
#endif

namespace ch32blink {

constexpr char LED_BANK = CH32BLINK_LED_BANK;
constexpr uint8_t LED_PIN = CH32BLINK_LED_PIN;
constexpr uint32_t HALF_PERIOD_MS = CH32BLINK_HALF_PERIOD_MS;

static_assert(LED_BANK == 'A' || LED_BANK == 'C' || LED_BANK == 'D',
              "CH32BLINK_LED_BANK must be 'A', 'C' or 'D'");
static_assert(HALF_PERIOD_MS > 0, "CH32BLINK_HALF_PERIOD_MS must be positive");

} // namespace ch32blink

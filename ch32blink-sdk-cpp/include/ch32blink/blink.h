// SPDX-License-Identifier: MIT
// ch32blink - blink loop
//
// The LED alternates between ON and OFF with a fixed half period. OUTDR
// resets to 0, so after configure_as_output the first step turns it on.

#pragma once

#include "ch32blink/gpio.h"

#include <cstdint>

namespace ch32blink {

// Delay is any type with delay_ms(uint32_t), e.g. SysTickDelay or SpinDelay
template <typename Regs, typename Delay>
void blink_step(Regs& regs, uint8_t pin, Delay& delay, uint32_t half_period_ms) {
    toggle(regs, pin);
    delay.delay_ms(half_period_ms);
}

template <typename Regs, typename Delay>
[[noreturn]] void blink_forever(Regs& regs, uint8_t pin, Delay& delay, uint32_t half_period_ms) {
    while (true) {
        blink_step(regs, pin, delay, half_period_ms);
    }
}

template <typename Delay>
void blink_step(Pin pin, Delay& delay, uint32_t half_period_ms) {
    toggle(pin);
    delay.delay_ms(half_period_ms);
}

template <typename Delay>
[[noreturn]] void blink_forever(Pin pin, Delay& delay, uint32_t half_period_ms) {
    while (true) {
        blink_step(pin, delay, half_period_ms);
    }
}

} // namespace ch32blink

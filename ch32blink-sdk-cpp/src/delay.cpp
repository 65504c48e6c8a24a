// SPDX-License-Identifier: MIT
// ch32blink - blocking delays

#include "ch32blink/delay.h"

namespace ch32blink {

void spin(uint32_t iterations) {
    while (iterations-- != 0) {
        __asm volatile("nop");
    }
}

SpinDelay::SpinDelay(uint32_t hclk_hz)
    : hclk_hz_(hclk_hz), iterations_per_ms_(spin_iterations(hclk_hz, 1000)) {}

void SpinDelay::delay_us(uint32_t us) {
    delay_ms(us / 1000);
    spin(spin_iterations(hclk_hz_, us % 1000));
}

void SpinDelay::delay_ms(uint32_t ms) {
    while (ms-- != 0) {
        spin(iterations_per_ms_);
    }
}

} // namespace ch32blink

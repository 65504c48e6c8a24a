// SPDX-License-Identifier: MIT
// ch32blink - blocking delays (calibrated spin and SysTick polling)

#pragma once

#include "ch32blink/log.h"
#include "ch32blink/regs.h"

#include <cstdint>

namespace ch32blink {

// Core cycles per spin() iteration: nop, addi and a taken branch
constexpr uint32_t SPIN_CYCLES_PER_ITERATION = 4;

// Longest single SysTick wait; keeps the wrap-around difference unambiguous
constexpr uint32_t MAX_WAIT_TICKS = 0x80000000u;

constexpr uint32_t spin_iterations(uint32_t hclk_hz, uint32_t us) {
    return static_cast<uint32_t>(static_cast<uint64_t>(hclk_hz) * us / 1000000u /
                                 SPIN_CYCLES_PER_ITERATION);
}

constexpr uint64_t ticks_for_us(uint32_t hclk_hz, uint32_t us) {
    return static_cast<uint64_t>(hclk_hz) * us / 1000000u;
}

constexpr uint64_t ticks_for_ms(uint32_t hclk_hz, uint32_t ms) {
    return static_cast<uint64_t>(hclk_hz) * ms / 1000u;
}

// Ticks between two samples of the up-counting SysTick CNT
constexpr uint32_t ticks_elapsed(uint32_t start, uint32_t now) {
    return now - start;
}

void spin(uint32_t iterations);

// Busy-wait calibrated from HCLK. Accuracy depends on
// SPIN_CYCLES_PER_ITERATION matching the generated loop.
class SpinDelay {
public:
    explicit SpinDelay(uint32_t hclk_hz);

    void delay_us(uint32_t us);
    void delay_ms(uint32_t ms);

    uint32_t iterations_per_ms() const { return iterations_per_ms_; }

private:
    uint32_t hclk_hz_;
    uint32_t iterations_per_ms_;
};

// Busy-wait polling the SysTick counter. Construction starts the counter
// free-running on HCLK with its interrupt disabled. Regs is SysTickRegs on
// hardware, or any block with CTLR and a readable CNT.
template <typename Regs>
class BasicSysTickDelay {
public:
    BasicSysTickDelay(Regs& regs, uint32_t hclk_hz) : regs_(regs), hclk_hz_(hclk_hz) {
        // Free-running up-counter on HCLK, no interrupt, no auto-reload
        regs_.CTLR = STK_STE | STK_STCLK;

        log_info("SysTick running at %lu Hz\r\n", static_cast<unsigned long>(hclk_hz));
    }

    void delay_us(uint32_t us) { wait(ticks_for_us(hclk_hz_, us)); }
    void delay_ms(uint32_t ms) { wait(ticks_for_ms(hclk_hz_, ms)); }

private:
    // Waits longer than MAX_WAIT_TICKS are split so each chunk is measured
    // with a single 32-bit wrap-around difference
    void wait(uint64_t ticks) {
        while (ticks > 0) {
            const uint32_t chunk = ticks > MAX_WAIT_TICKS ? MAX_WAIT_TICKS : static_cast<uint32_t>(ticks);
            const uint32_t start = regs_.CNT;
            while (ticks_elapsed(start, regs_.CNT) < chunk) {}
            ticks -= chunk;
        }
    }

    Regs& regs_;
    uint32_t hclk_hz_;
};

using SysTickDelay = BasicSysTickDelay<SysTickRegs>;

} // namespace ch32blink

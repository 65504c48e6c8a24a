// SPDX-License-Identifier: MIT
// ch32blink - clock tree and peripheral clock gates

#pragma once

#include "ch32blink/regs.h"

#include <cstdint>

namespace ch32blink {

// HPRE field values with a distinct divider. Encodings 0b1000..0b1010
// duplicate /2, /4 and /8 and are only decoded, never written.
enum class AhbPrescaler : uint8_t {
    DIV1 = 0b0000,
    DIV2 = 0b0001,
    DIV3 = 0b0010,
    DIV4 = 0b0011,
    DIV5 = 0b0100,
    DIV6 = 0b0101,
    DIV7 = 0b0110,
    DIV8 = 0b0111,
    DIV16 = 0b1011,
    DIV32 = 0b1100,
    DIV64 = 0b1101,
    DIV128 = 0b1110,
    DIV256 = 0b1111,
};

struct Clocks {
    uint32_t sysclk_hz;
    uint32_t hclk_hz;
};

constexpr uint32_t hpre_divider(uint32_t hpre) {
    return hpre < 0b1000 ? hpre + 1 : 2u << (hpre - 0b1000);
}

constexpr uint32_t hclk_hz(AhbPrescaler prescaler) {
    return HSI_HZ / hpre_divider(static_cast<uint32_t>(prescaler));
}

constexpr uint32_t gpio_clock_bit(Bank bank) {
    return bank == Bank::A ? RCC_IOPAEN : bank == Bank::C ? RCC_IOPCEN : RCC_IOPDEN;
}

// Open the APB2 clock gate of a GPIO bank. Only the bank's IOPxEN bit is
// written; safe to call more than once.
void enable_gpio_clock(RccRegs& regs, Bank bank);

inline void enable_gpio_clock(Bank bank) {
    enable_gpio_clock(rcc(), bank);
}

// Run SYSCLK from the 24 MHz HSI and program the AHB prescaler.
// Touches only HSION, SW and HPRE.
Clocks configure_clocks(RccRegs& regs, AhbPrescaler prescaler);

inline Clocks configure_clocks(AhbPrescaler prescaler) {
    return configure_clocks(rcc(), prescaler);
}

// Decode the clocks currently programmed in CFGR0 (HSI assumed)
Clocks current_clocks(const RccRegs& regs);

} // namespace ch32blink

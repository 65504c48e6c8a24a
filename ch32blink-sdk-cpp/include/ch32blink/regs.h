// SPDX-License-Identifier: MIT
// ch32blink - CH32V003 register map (RCC, GPIO, SysTick)

#pragma once

#include <cstdint>

namespace ch32blink {

// Peripheral base addresses (CH32V003 reference manual)
constexpr uint32_t RCC_BASE = 0x40021000;
constexpr uint32_t GPIOA_BASE = 0x40010800;
constexpr uint32_t GPIOC_BASE = 0x40011000;
constexpr uint32_t GPIOD_BASE = 0x40011400;
constexpr uint32_t SYSTICK_BASE = 0xE000F000;

struct RccRegs {
    volatile uint32_t CTLR;      // 0x00
    volatile uint32_t CFGR0;     // 0x04
    volatile uint32_t INTR;      // 0x08
    volatile uint32_t APB2PRSTR; // 0x0C
    volatile uint32_t APB1PRSTR; // 0x10
    volatile uint32_t AHBPCENR;  // 0x14
    volatile uint32_t APB2PCENR; // 0x18
    volatile uint32_t APB1PCENR; // 0x1C
    uint32_t RESERVED0;          // 0x20
    volatile uint32_t RSTSCKR;   // 0x24
};

struct GpioRegs {
    volatile uint32_t CFGLR; // 0x00
    uint32_t RESERVED0;      // 0x04, CFGHR on larger parts
    volatile uint32_t INDR;  // 0x08
    volatile uint32_t OUTDR; // 0x0C
    volatile uint32_t BSHR;  // 0x10
    volatile uint32_t BCR;   // 0x14
    volatile uint32_t LCKR;  // 0x18
};

struct SysTickRegs {
    volatile uint32_t CTLR; // 0x00
    volatile uint32_t SR;   // 0x04
    volatile uint32_t CNT;  // 0x08
    uint32_t RESERVED0;     // 0x0C
    volatile uint32_t CMP;  // 0x10
};

static_assert(sizeof(RccRegs) == 0x28, "RCC layout");
static_assert(sizeof(GpioRegs) == 0x1C, "GPIO layout");
static_assert(sizeof(SysTickRegs) == 0x14, "SysTick layout");

// RCC_CTLR
constexpr uint32_t RCC_HSION = 1u << 0;
constexpr uint32_t RCC_HSIRDY = 1u << 1;

// RCC_CFGR0
constexpr uint32_t RCC_SW_MASK = 0x3u << 0;
constexpr uint32_t RCC_SW_HSI = 0x0u << 0;
constexpr uint32_t RCC_SWS_MASK = 0x3u << 2;
constexpr uint32_t RCC_SWS_HSI = 0x0u << 2;
constexpr uint32_t RCC_HPRE_SHIFT = 4;
constexpr uint32_t RCC_HPRE_MASK = 0xFu << RCC_HPRE_SHIFT;

// RCC_APB2PCENR
constexpr uint32_t RCC_AFIOEN = 1u << 0;
constexpr uint32_t RCC_IOPAEN = 1u << 2;
constexpr uint32_t RCC_IOPCEN = 1u << 4;
constexpr uint32_t RCC_IOPDEN = 1u << 5;

// GPIOx_CFGLR: MODE[1:0] | CNF[1:0] << 2, one nibble per pin
constexpr uint32_t GPIO_CFG_BITS = 4;
constexpr uint32_t GPIO_CFG_MASK = 0xF;
constexpr uint32_t GPIO_CFGLR_RESET = 0x44444444;

// SysTick CTLR
constexpr uint32_t STK_STE = 1u << 0;
constexpr uint32_t STK_STIE = 1u << 1;
constexpr uint32_t STK_STCLK = 1u << 2;
constexpr uint32_t STK_STRE = 1u << 3;

constexpr uint32_t HSI_HZ = 24000000;

inline RccRegs& rcc() {
    return *reinterpret_cast<RccRegs*>(RCC_BASE);
}

inline SysTickRegs& systick() {
    return *reinterpret_cast<SysTickRegs*>(SYSTICK_BASE);
}

// GPIO banks present on the CH32V003 (there is no GPIOB)
enum class Bank : uint8_t {
    A,
    C,
    D,
};

constexpr uint32_t gpio_base(Bank bank) {
    return bank == Bank::A ? GPIOA_BASE : bank == Bank::C ? GPIOC_BASE : GPIOD_BASE;
}

inline GpioRegs& gpio(Bank bank) {
    return *reinterpret_cast<GpioRegs*>(gpio_base(bank));
}

} // namespace ch32blink

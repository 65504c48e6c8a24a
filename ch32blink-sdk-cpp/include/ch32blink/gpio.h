// SPDX-License-Identifier: MIT
// ch32blink - single-pin GPIO driver
//
// Every operation touches only the bits of its own pin:
//  - mode changes are a masked read-modify-write of the pin's CFGLR nibble
//  - level changes are single writes of the pin mask to BSHR (set) or BCR
//    (reset); OUTDR is never written directly
//
// The templates take any register block with the GpioRegs member names, so
// the same code runs against the hardware and against a simulated bank.

#pragma once

#include "ch32blink/regs.h"

#include <cstdint>

namespace ch32blink {

enum class PinMode : uint8_t {
    INPUT_ANALOG,
    INPUT_FLOATING,
    INPUT_PULL_UP,
    INPUT_PULL_DOWN,
    OUTPUT_PUSH_PULL,
    OUTPUT_OPEN_DRAIN,
};

// MODE[1:0] for outputs (maximum toggle rate)
enum class OutputSpeed : uint8_t {
    MHZ_10 = 0b01,
    MHZ_2 = 0b10,
    MHZ_30 = 0b11,
};

enum class PinState : uint8_t {
    LOW,
    HIGH,
};

// CFGLR nibble: CNF[1:0] << 2 | MODE[1:0]
constexpr uint32_t cfg_nibble(PinMode mode, OutputSpeed speed = OutputSpeed::MHZ_10) {
    switch (mode) {
    case PinMode::INPUT_ANALOG:
        return 0b0000;
    case PinMode::INPUT_FLOATING:
        return 0b0100;
    case PinMode::INPUT_PULL_UP:
    case PinMode::INPUT_PULL_DOWN:
        return 0b1000;
    case PinMode::OUTPUT_PUSH_PULL:
        return static_cast<uint32_t>(speed);
    case PinMode::OUTPUT_OPEN_DRAIN:
        return 0b0100 | static_cast<uint32_t>(speed);
    }
    return 0b0100;
}

struct Pin {
    Bank bank;
    uint8_t number;

    constexpr uint32_t mask() const { return 1u << number; }
};

// PA1/PA2 are the only port A pads bonded out; C and D expose 0..7.
// PD1 is SWIO and PD7 is NRST by default.
constexpr bool pin_exists(Bank bank, uint8_t number) {
    return bank == Bank::A ? (number == 1 || number == 2) : number < 8;
}

template <Bank B, uint8_t N>
constexpr Pin make_pin() {
    static_assert(pin_exists(B, N), "pin does not exist on the CH32V003");
    return Pin{B, N};
}

constexpr Pin PIN_A1 = make_pin<Bank::A, 1>();
constexpr Pin PIN_A2 = make_pin<Bank::A, 2>();
constexpr Pin PIN_C0 = make_pin<Bank::C, 0>();
constexpr Pin PIN_C1 = make_pin<Bank::C, 1>();
constexpr Pin PIN_C2 = make_pin<Bank::C, 2>();
constexpr Pin PIN_C3 = make_pin<Bank::C, 3>();
constexpr Pin PIN_C4 = make_pin<Bank::C, 4>();
constexpr Pin PIN_C5 = make_pin<Bank::C, 5>();
constexpr Pin PIN_C6 = make_pin<Bank::C, 6>();
constexpr Pin PIN_C7 = make_pin<Bank::C, 7>();
constexpr Pin PIN_D0 = make_pin<Bank::D, 0>();
constexpr Pin PIN_D1 = make_pin<Bank::D, 1>();
constexpr Pin PIN_D2 = make_pin<Bank::D, 2>();
constexpr Pin PIN_D3 = make_pin<Bank::D, 3>();
constexpr Pin PIN_D4 = make_pin<Bank::D, 4>();
constexpr Pin PIN_D5 = make_pin<Bank::D, 5>();
constexpr Pin PIN_D6 = make_pin<Bank::D, 6>();
constexpr Pin PIN_D7 = make_pin<Bank::D, 7>();

template <typename Regs>
void set_high(Regs& regs, uint8_t pin) {
    regs.BSHR = 1u << pin;
}

template <typename Regs>
void set_low(Regs& regs, uint8_t pin) {
    regs.BCR = 1u << pin;
}

template <typename Regs>
void set_state(Regs& regs, uint8_t pin, PinState state) {
    if (state == PinState::HIGH) {
        set_high(regs, pin);
    } else {
        set_low(regs, pin);
    }
}

// Driven level, as latched in OUTDR
template <typename Regs>
bool is_set_high(const Regs& regs, uint8_t pin) {
    return (regs.OUTDR & (1u << pin)) != 0;
}

// Pad level, as sampled in INDR
template <typename Regs>
bool is_high(const Regs& regs, uint8_t pin) {
    return (regs.INDR & (1u << pin)) != 0;
}

template <typename Regs>
bool is_low(const Regs& regs, uint8_t pin) {
    return !is_high(regs, pin);
}

// Invert the driven level. The old level is read from OUTDR, the new one
// is written through BSHR/BCR, so sibling pins and CFGLR are never written.
template <typename Regs>
void toggle(Regs& regs, uint8_t pin) {
    if (is_set_high(regs, pin)) {
        set_low(regs, pin);
    } else {
        set_high(regs, pin);
    }
}

// Rewrite the pin's CFGLR nibble. For pull-up/pull-down inputs the pull
// direction (OUTDR bit) is selected before the mode changes.
template <typename Regs>
void configure(Regs& regs, uint8_t pin, PinMode mode, OutputSpeed speed = OutputSpeed::MHZ_10) {
    if (mode == PinMode::INPUT_PULL_UP) {
        set_high(regs, pin);
    } else if (mode == PinMode::INPUT_PULL_DOWN) {
        set_low(regs, pin);
    }

    const uint32_t shift = pin * GPIO_CFG_BITS;
    uint32_t cfglr = regs.CFGLR;
    cfglr &= ~(GPIO_CFG_MASK << shift);
    cfglr |= cfg_nibble(mode, speed) << shift;
    regs.CFGLR = cfglr;
}

template <typename Regs>
void configure_as_output(Regs& regs, uint8_t pin, OutputSpeed speed = OutputSpeed::MHZ_10) {
    configure(regs, pin, PinMode::OUTPUT_PUSH_PULL, speed);
}

// Hardware entry points. The bank clock must be enabled first
// (enable_gpio_clock).
void configure(Pin pin, PinMode mode, OutputSpeed speed = OutputSpeed::MHZ_10);
void configure_as_output(Pin pin, OutputSpeed speed = OutputSpeed::MHZ_10);
void toggle(Pin pin);

} // namespace ch32blink

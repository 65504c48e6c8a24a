// SPDX-License-Identifier: MIT
// ch32blink - GPIO driver, memory-mapped entry points

#include "ch32blink/gpio.h"
#include "ch32blink/log.h"

namespace ch32blink {

static const char* mode_name(PinMode mode) {
    switch (mode) {
    case PinMode::INPUT_ANALOG:
        return "analog input";
    case PinMode::INPUT_FLOATING:
        return "floating input";
    case PinMode::INPUT_PULL_UP:
        return "pull-up input";
    case PinMode::INPUT_PULL_DOWN:
        return "pull-down input";
    case PinMode::OUTPUT_PUSH_PULL:
        return "push-pull output";
    case PinMode::OUTPUT_OPEN_DRAIN:
        return "open-drain output";
    }
    return "?";
}

void configure(Pin pin, PinMode mode, OutputSpeed speed) {
    configure(gpio(pin.bank), pin.number, mode, speed);

    log_info("P%c%d configured as %s\r\n",
             pin.bank == Bank::A ? 'A' : pin.bank == Bank::C ? 'C' : 'D',
             pin.number, mode_name(mode));
}

void configure_as_output(Pin pin, OutputSpeed speed) {
    configure(pin, PinMode::OUTPUT_PUSH_PULL, speed);
}

void toggle(Pin pin) {
    toggle(gpio(pin.bank), pin.number);
}

} // namespace ch32blink

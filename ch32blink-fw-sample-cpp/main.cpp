// SPDX-License-Identifier: MIT
//
// CH32V003 LED blink firmware
// Bare-metal, no vendor SDK: clocks, GPIO and SysTick by direct register access.

#include "ch32blink/blink.h"
#include "ch32blink/config.h"
#include "ch32blink/delay.h"
#include "ch32blink/gpio.h"
#include "ch32blink/log.h"
#include "ch32blink/rcc.h"

using namespace ch32blink;

constexpr Bank LED_BANK_ID = LED_BANK == 'A' ? Bank::A : LED_BANK == 'C' ? Bank::C : Bank::D;
constexpr Pin LED = make_pin<LED_BANK_ID, LED_PIN>();

int main() {
    // HCLK = HSI 24 MHz, undivided
    const Clocks clocks = configure_clocks(AhbPrescaler::DIV1);

    enable_gpio_clock(LED.bank);
    configure_as_output(LED);

#if CH32BLINK_SPIN_DELAY
    SpinDelay delay(clocks.hclk_hz);
#else
    SysTickDelay delay(systick(), clocks.hclk_hz);
#endif

    log_info("Blinking P%c%d, half period %lu ms\r\n", LED_BANK, LED.number,
             static_cast<unsigned long>(HALF_PERIOD_MS));

    blink_forever(LED, delay, HALF_PERIOD_MS);
}

// SPDX-License-Identifier: MIT
// ch32blink - clock tree and peripheral clock gates

#include "ch32blink/rcc.h"
#include "ch32blink/log.h"

namespace ch32blink {

static char bank_name(Bank bank) {
    return bank == Bank::A ? 'A' : bank == Bank::C ? 'C' : 'D';
}

void enable_gpio_clock(RccRegs& regs, Bank bank) {
    const uint32_t bit = gpio_clock_bit(bank);

    if (regs.APB2PCENR & bit) {
        return;
    }

    regs.APB2PCENR |= bit;
    // Read back so the gate is open before the first GPIO access
    (void)regs.APB2PCENR;

    log_info("GPIO%c clock enabled\r\n", bank_name(bank));
}

Clocks configure_clocks(RccRegs& regs, AhbPrescaler prescaler) {
    regs.CTLR |= RCC_HSION;
    while ((regs.CTLR & RCC_HSIRDY) == 0) {}

    uint32_t cfgr0 = regs.CFGR0;
    cfgr0 &= ~(RCC_SW_MASK | RCC_HPRE_MASK);
    cfgr0 |= RCC_SW_HSI;
    cfgr0 |= static_cast<uint32_t>(prescaler) << RCC_HPRE_SHIFT;
    regs.CFGR0 = cfgr0;

    while ((regs.CFGR0 & RCC_SWS_MASK) != RCC_SWS_HSI) {}

    Clocks clocks = current_clocks(regs);
    log_info("Clocks: SYSCLK=%lu Hz HCLK=%lu Hz\r\n",
             static_cast<unsigned long>(clocks.sysclk_hz),
             static_cast<unsigned long>(clocks.hclk_hz));
    return clocks;
}

Clocks current_clocks(const RccRegs& regs) {
    const uint32_t hpre = (regs.CFGR0 & RCC_HPRE_MASK) >> RCC_HPRE_SHIFT;
    return Clocks{HSI_HZ, HSI_HZ / hpre_divider(hpre)};
}

} // namespace ch32blink

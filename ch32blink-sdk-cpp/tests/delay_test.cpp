// SPDX-License-Identifier: MIT

#include "ch32blink/delay.h"
#include "sim_regs.h"

#include <gtest/gtest.h>

using namespace ch32blink;
using ch32blink::test::SimSysTickRegs;
using ch32blink::test::value;

TEST(Delay, SpinIterationsScaleWithHclk) {
    EXPECT_EQ(spin_iterations(24000000, 1000), 6000u);
    EXPECT_EQ(spin_iterations(8000000, 1000), 2000u);
    EXPECT_EQ(spin_iterations(24000000, 1), 6u);
    EXPECT_EQ(spin_iterations(93750, 1000), 23u);
    EXPECT_EQ(spin_iterations(24000000, 0), 0u);
}

TEST(Delay, SpinDelayPrecomputesOneMillisecond) {
    SpinDelay delay(24000000);
    EXPECT_EQ(delay.iterations_per_ms(), 6000u);

    // Short enough to run on the host
    delay.delay_us(50);
    delay.delay_ms(1);
}

TEST(Delay, SysTickTicks) {
    EXPECT_EQ(ticks_for_ms(24000000, 500), 12000000u);
    EXPECT_EQ(ticks_for_us(24000000, 1), 24u);
    EXPECT_EQ(ticks_for_us(8000000, 1500), 12000u);
    // Beyond 32 bits at 24 MHz
    EXPECT_EQ(ticks_for_ms(24000000, 200000), 4800000000ull);
}

TEST(Delay, ElapsedTicksAcrossWrap) {
    EXPECT_EQ(ticks_elapsed(100, 350), 250u);
    EXPECT_EQ(ticks_elapsed(0xFFFFFF00u, 0x00000100u), 0x200u);
    EXPECT_EQ(ticks_elapsed(0xFFFFFFFFu, 0xFFFFFFFFu), 0u);
}

TEST(Delay, SysTickDelayStartsCounterWithoutInterrupt) {
    SysTickRegs regs{};
    regs.CNT = 0x12345678;

    SysTickDelay delay(regs, 24000000);

    EXPECT_EQ(value(regs.CTLR), STK_STE | STK_STCLK);
    EXPECT_EQ(regs.CTLR & (STK_STIE | STK_STRE), 0u);
    // Counter is not reset on start
    EXPECT_EQ(value(regs.CNT), 0x12345678u);

    // Zero-length waits never poll
    delay.delay_us(0);
    delay.delay_ms(0);
}

TEST(Delay, SysTickWaitPollsCounter) {
    SimSysTickRegs regs;
    regs.CNT.step = 1000;

    BasicSysTickDelay<SimSysTickRegs> delay(regs, 24000000);
    EXPECT_EQ(regs.CTLR, STK_STE | STK_STCLK);

    delay.delay_ms(500);

    // One start sample, then polls until 12,000,000 ticks have gone by
    EXPECT_EQ(regs.CNT.reads, 12001u);
    EXPECT_GE(regs.CNT.advanced, 12000000u);
    EXPECT_LT(regs.CNT.advanced, 12000000u + 2 * regs.CNT.step);
}

TEST(Delay, SysTickWaitAcrossCounterWrap) {
    SimSysTickRegs regs;
    regs.CNT = 0xFFFFFF00u;

    BasicSysTickDelay<SimSysTickRegs> delay(regs, 1000000);
    delay.delay_us(0x300);

    EXPECT_EQ(regs.CNT.advanced, 0x301u);
    EXPECT_EQ(regs.CNT.now, 0x00000201u);
}

TEST(Delay, SysTickLongWaitIsSplitIntoChunks) {
    SimSysTickRegs regs;
    regs.CNT = 0xF0000000u;
    regs.CNT.step = 0x10000;

    BasicSysTickDelay<SimSysTickRegs> delay(regs, 24000000);
    // 4,800,000,000 ticks: two MAX_WAIT_TICKS chunks and a remainder
    delay.delay_ms(200000);

    const uint64_t wanted = ticks_for_ms(24000000, 200000);
    const uint64_t remainder = wanted - 2ull * MAX_WAIT_TICKS;
    const uint64_t step = regs.CNT.step;
    const uint64_t polls = 2 * (MAX_WAIT_TICKS / step) + (remainder + step - 1) / step;

    // Each chunk costs one start sample plus its polls
    EXPECT_EQ(regs.CNT.reads, polls + 3);
    EXPECT_EQ(regs.CNT.advanced, (polls + 3) * step);
    EXPECT_GE(regs.CNT.advanced, wanted);
    EXPECT_LT(regs.CNT.advanced, wanted + 3 * 2 * step);
}

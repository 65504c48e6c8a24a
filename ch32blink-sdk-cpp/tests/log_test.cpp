// SPDX-License-Identifier: MIT

#include "ch32blink/log.h"

#include <gtest/gtest.h>

#include <string>

using namespace ch32blink;

TEST(Log, HostBuildPrintsFormattedLine) {
    ASSERT_TRUE(LOG_ENABLED);

    testing::internal::CaptureStdout();
    log_info("P%c%d configured as %s\r\n", 'A', 1, "push-pull output");
    std::fflush(stdout);

    EXPECT_EQ(testing::internal::GetCapturedStdout(), std::string("PA1 configured as push-pull output\r\n"));
}

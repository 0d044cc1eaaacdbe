#include <gtest/gtest.h>
#include "SourceMeter.h"

TEST(SourceMeterTest, OutputCommands) {
    EXPECT_EQ(SourceMeter::outputCommand(true), ":OUTP ON");
    EXPECT_EQ(SourceMeter::outputCommand(false), ":OUTP OFF");
}

TEST(SourceMeterTest, OutputRefusedWithoutPort) {
    SourceMeter meter;
    EXPECT_FALSE(meter.isConnected());
    EXPECT_FALSE(meter.setOutput(false));
    EXPECT_TRUE(meter.errorString().contains(":OUTP OFF"));
}

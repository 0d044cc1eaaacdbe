#include <gtest/gtest.h>
#include <limits>
#include "DDSGenerator.h"

TEST(DDSGeneratorTest, WaveformRegisterPerChannel) {
    EXPECT_EQ(DDSGenerator::waveformCommand(WaveShape::Sine, 1), ":w21=0.");
    EXPECT_EQ(DDSGenerator::waveformCommand(WaveShape::Square, 2), ":w22=1.");
    // Pulse is the square output shaped by the duty register
    EXPECT_EQ(DDSGenerator::waveformCommand(WaveShape::Pulse, 1), ":w21=1.");
}

TEST(DDSGeneratorTest, FrequencyInCentiHertz) {
    EXPECT_EQ(DDSGenerator::frequencyCommand(1000.0, 1), ":w23=100000,0.");
    EXPECT_EQ(DDSGenerator::frequencyCommand(0.5, 2), ":w24=50,0.");
}

TEST(DDSGeneratorTest, AmplitudeOffsetDutyPhase) {
    EXPECT_EQ(DDSGenerator::amplitudeCommand(1.0, 1), ":w25=1000.");
    EXPECT_EQ(DDSGenerator::offsetCommand(0.5, 1), ":w27=1050.");
    EXPECT_EQ(DDSGenerator::offsetCommand(-1.0, 2), ":w28=900.");
    EXPECT_EQ(DDSGenerator::dutyCommand(0.5, 1), ":w29=500.");
    EXPECT_EQ(DDSGenerator::phaseCommand(90.0, 1), ":w31=900.");
    EXPECT_EQ(DDSGenerator::phaseCommand(-90.0, 2), ":w32=2700.");
    EXPECT_EQ(DDSGenerator::phaseCommand(360.0, 1), ":w31=0.");
}

TEST(DDSGeneratorTest, OutOfRangeArgumentsBuildNothing) {
    EXPECT_TRUE(DDSGenerator::waveformCommand(WaveShape::Sine, 3).isEmpty());
    EXPECT_TRUE(DDSGenerator::frequencyCommand(-1.0, 1).isEmpty());
    EXPECT_TRUE(DDSGenerator::frequencyCommand(std::numeric_limits<double>::quiet_NaN(), 1).isEmpty());
    EXPECT_TRUE(DDSGenerator::amplitudeCommand(25.0, 1).isEmpty());
    EXPECT_TRUE(DDSGenerator::offsetCommand(10.0, 1).isEmpty());
    EXPECT_TRUE(DDSGenerator::dutyCommand(1.5, 1).isEmpty());
    EXPECT_TRUE(DDSGenerator::dutyCommand(0.5, 0).isEmpty());
}

TEST(DDSGeneratorTest, NotConnectedWithoutPort) {
    DDSGenerator generator;
    EXPECT_FALSE(generator.isConnected());
    EXPECT_FALSE(generator.setAmplitude(1.0, 1));
    EXPECT_FALSE(generator.errorString().isEmpty());
}

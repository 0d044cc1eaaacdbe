#include <gtest/gtest.h>
#include <QSettings>
#include <QTemporaryDir>
#include "MeasurementConfig.h"

TEST(MeasurementConfigTest, DefaultsMatchTheBench) {
    const MeasurementConfig config;
    EXPECT_EQ(config.acquisition.scopeSource, "MATH");
    EXPECT_EQ(config.acquisition.averages, 10);
    EXPECT_EQ(config.acquisition.interCaptureDelayMs, 30);
    EXPECT_EQ(config.acquisition.settlingDelayMs, 500);
    EXPECT_EQ(config.generator.shape, WaveShape::Sine);
    EXPECT_DOUBLE_EQ(config.generator.dutyFraction(), 0.5);
    EXPECT_TRUE(config.instruments.sourceMeterPort.isEmpty());
}

TEST(MeasurementConfigTest, SavedValuesLoadBack) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("diffscope.ini");

    MeasurementConfig saved;
    saved.instruments.backend = "simulated";
    saved.instruments.scopeAddress = "TCPIP0::10.1.1.1::4000::SOCKET";
    saved.instruments.sourceMeterPort = "/dev/ttyUSB1";
    saved.acquisition.averages = 4;
    saved.acquisition.scopeSource = "CH2";
    saved.generator.shape = WaveShape::Pulse;
    saved.generator.frequencyHz = 2500.0;
    saved.generator.offsetV = -0.25;
    saved.generator.dutyPercent = 20.0;
    saved.outputDirectory = "/tmp/runs";
    {
        QSettings settings(path, QSettings::IniFormat);
        saved.save(settings);
    }

    QSettings settings(path, QSettings::IniFormat);
    MeasurementConfig loaded;
    loaded.load(settings);
    EXPECT_EQ(loaded.instruments.backend, "simulated");
    EXPECT_EQ(loaded.instruments.scopeAddress, saved.instruments.scopeAddress);
    EXPECT_EQ(loaded.instruments.sourceMeterPort, "/dev/ttyUSB1");
    EXPECT_EQ(loaded.acquisition.averages, 4);
    EXPECT_EQ(loaded.acquisition.scopeSource, "CH2");
    EXPECT_EQ(loaded.generator.shape, WaveShape::Pulse);
    EXPECT_DOUBLE_EQ(loaded.generator.frequencyHz, 2500.0);
    EXPECT_DOUBLE_EQ(loaded.generator.offsetV, -0.25);
    EXPECT_DOUBLE_EQ(loaded.generator.dutyFraction(), 0.2);
    EXPECT_EQ(loaded.outputDirectory, "/tmp/runs");
}

TEST(MeasurementConfigTest, BadStoredValuesAreRepaired) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QSettings settings(dir.filePath("bad.ini"), QSettings::IniFormat);
    settings.setValue("generator/shape", "TRIANGLE");
    settings.setValue("acquisition/averages", 0);
    settings.setValue("acquisition/settlingDelayMs", -5);

    MeasurementConfig config;
    config.load(settings);
    EXPECT_EQ(config.generator.shape, WaveShape::Sine);
    EXPECT_EQ(config.acquisition.averages, 1);
    EXPECT_EQ(config.acquisition.settlingDelayMs, 0);
}

TEST(MeasurementConfigTest, DutyIsClampedToUnitRange) {
    GeneratorSettings gen;
    gen.dutyPercent = -10.0;
    EXPECT_DOUBLE_EQ(gen.dutyFraction(), 0.0);
    gen.dutyPercent = 250.0;
    EXPECT_DOUBLE_EQ(gen.dutyFraction(), 1.0);
}

TEST(MeasurementConfigTest, ShapeNames) {
    bool ok = false;
    EXPECT_EQ(waveShapeFromString("sine", &ok), WaveShape::Sine);
    EXPECT_TRUE(ok);
    EXPECT_EQ(waveShapeFromString(" square ", &ok), WaveShape::Square);
    EXPECT_TRUE(ok);
    EXPECT_EQ(waveShapeFromString("saw", &ok), WaveShape::Sine);
    EXPECT_FALSE(ok);
    EXPECT_EQ(waveShapeToString(WaveShape::Pulse), "PULSE");
}

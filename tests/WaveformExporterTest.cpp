#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QStringList>
#include <algorithm>
#include <cmath>
#include "WaveformExporter.h"

namespace {

ProcessedTable sampleTable() {
    ProcessedTable table;
    table.statistics = {{"Max", 1.5}, {"Min", -0.25}, {"Range", 1.75}, {"Avg", 0.123456789012}};
    table.time = {0.0, 1e-6, 2e-6, 3e-6, 4e-6};
    table.processed = {0.5, -0.25, 1.5, 0.0, 0.1};
    table.frequency = {0.0, 200000.0};
    table.magnitude = {1.85, 0.333333333333};
    return table;
}

void expectNear(const QVector<double> &actual, const QVector<double> &expected) {
    ASSERT_EQ(actual.size(), expected.size());
    for (int i = 0; i < actual.size(); ++i) {
        EXPECT_NEAR(actual[i], expected[i], 1e-11 * std::max(1.0, std::abs(expected[i]))) << "index " << i;
    }
}

}

TEST(WaveformExporterTest, ProcessedLayout) {
    const QString text = WaveformExporter::formatProcessedCSV(sampleTable());
    const QStringList lines = text.split('\n');
    EXPECT_EQ(lines[0], "Statistics");
    EXPECT_EQ(lines[1], "Max,1.5");
    EXPECT_EQ(lines[2], "Min,-0.25");
    EXPECT_EQ(lines[5], "");
    EXPECT_EQ(lines[6], "Data");
    EXPECT_EQ(lines[7], "Time,Processed_Signal,Frequency,FFT_Magnitude");
    EXPECT_EQ(lines[8], "0,0.5,0,1.85");
    // Spectrum columns run out before the time axis does
    EXPECT_EQ(lines[10], "2e-06,1.5,,");
    EXPECT_EQ(lines[12], "4e-06,0.1,,");
    EXPECT_EQ(lines.size(), 14);
    EXPECT_TRUE(lines.last().isEmpty());
}

TEST(WaveformExporterTest, RowsFollowLongerOfTimeAndFrequency) {
    ProcessedTable table;
    table.time = {0.0};
    table.processed = {1.0};
    table.frequency = {0.0, 1.0, 2.0};
    table.magnitude = {3.0, 4.0, 5.0};
    const QStringList lines = WaveformExporter::formatProcessedCSV(table).split('\n', Qt::SkipEmptyParts);
    EXPECT_EQ(lines.last(), ",,2,5");
    EXPECT_EQ(lines.size(), 3 + 3);
}

TEST(WaveformExporterTest, RoundTripRespectsRaggedColumns) {
    const ProcessedTable table = sampleTable();
    ProcessedTable parsed;
    QString error;
    ASSERT_TRUE(WaveformExporter::parseProcessedCSV(WaveformExporter::formatProcessedCSV(table), parsed, &error))
        << error.toStdString();
    expectNear(parsed.time, table.time);
    expectNear(parsed.processed, table.processed);
    expectNear(parsed.frequency, table.frequency);
    expectNear(parsed.magnitude, table.magnitude);
    ASSERT_EQ(parsed.statistics.size(), table.statistics.size());
    for (int i = 0; i < table.statistics.size(); ++i) {
        EXPECT_EQ(parsed.statistics[i].first, table.statistics[i].first);
        EXPECT_NEAR(parsed.statistics[i].second, table.statistics[i].second, 1e-11);
    }
}

TEST(WaveformExporterTest, WriteAndReadBackFromDisk) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("nested/processed_test.csv");
    WaveformExporter exporter;
    QStringList written;
    QObject::connect(&exporter, &WaveformExporter::fileWritten, [&written](const QString &f) { written << f; });
    QString error;
    ASSERT_TRUE(exporter.exportProcessedCSV(path, sampleTable(), &error)) << error.toStdString();
    EXPECT_EQ(written, QStringList({path}));

    ProcessedTable parsed;
    ASSERT_TRUE(WaveformExporter::importProcessedCSV(path, parsed, &error)) << error.toStdString();
    expectNear(parsed.processed, sampleTable().processed);
}

TEST(WaveformExporterTest, MissingHeaderIsRejected) {
    ProcessedTable parsed;
    QString error;
    EXPECT_FALSE(WaveformExporter::parseProcessedCSV("Statistics\nMax,1\n", parsed, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(WaveformExporter::parseProcessedCSV(
        "Data\nTime,Processed_Signal,Frequency,FFT_Magnitude\n1,abc,,\n", parsed, &error));
}

TEST(WaveformExporterTest, AveragedWaveformFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    Waveform wf;
    wf.time = {0.0, 0.5};
    wf.voltage = {1.25, -2.0};
    const QString path = dir.filePath("wave.csv");
    WaveformExporter exporter;
    ASSERT_TRUE(exporter.exportWaveformCSV(path, wf));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString text = QTextStream(&file).readAll();
    EXPECT_EQ(text, "Time (s),Voltage (V)\n0,1.25\n0.5,-2\n");
}

TEST(WaveformExporterTest, TimestampedNames) {
    const QDateTime ts(QDate(2024, 3, 5), QTime(14, 7, 9));
    EXPECT_EQ(WaveformExporter::processedBaseName(ts), "processed_20240305_140709");
    EXPECT_EQ(WaveformExporter::averagedFileName("BASE", 1000.0, 0.5, ts), "BASE_1000Hz_0.5V_avg_20240305_140709.csv");
    EXPECT_EQ(WaveformExporter::averagedFileName("READ", 250.0, 0.0, ts), "READ_250Hz_0V_avg_20240305_140709.csv");
}

TEST(WaveformExporterTest, FractionalFrequencyIsTruncatedInName) {
    const QDateTime ts(QDate(2024, 3, 5), QTime(14, 7, 9));
    EXPECT_EQ(WaveformExporter::averagedFileName("BASE", 999.7, 0.5, ts), "BASE_999Hz_0.5V_avg_20240305_140709.csv");
    EXPECT_EQ(WaveformExporter::averagedFileName("READ", 1000.5, 0.0, ts), "READ_1000Hz_0V_avg_20240305_140709.csv");
}

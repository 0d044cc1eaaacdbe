#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QFileInfo>
#include "FakeInstruments.h"
#include "InstrumentSession.h"
#include "MeasurementController.h"

namespace {

InstrumentSettings benchSettings() {
    InstrumentSettings settings;
    settings.scopeAddress = "TCPIP0::10.0.0.2::4000::SOCKET";
    settings.generatorPort = "FAKE_GEN";
    settings.sourceMeterPort = "FAKE_SMU";
    return settings;
}

}

TEST(InstrumentSessionTest, ConnectsAllThreeInstruments) {
    auto bench = std::make_shared<FakeBench>();
    InstrumentSession session(std::make_unique<FakeInstrumentFactory>(bench));
    MeasurementError error;
    ASSERT_TRUE(session.connectAll(benchSettings(), &error));
    EXPECT_TRUE(session.isScopeConnected());
    EXPECT_TRUE(session.isGeneratorConnected());
    EXPECT_TRUE(session.isOutputSwitchConnected());
    EXPECT_EQ(bench->events, QStringList({"scope.open", "generator.open", "output.open"}));
}

TEST(InstrumentSessionTest, ScopeFailureIsTransportError) {
    auto bench = std::make_shared<FakeBench>();
    bench->scopeOpenFails = true;
    InstrumentSession session(std::make_unique<FakeInstrumentFactory>(bench));
    MeasurementError error;
    EXPECT_FALSE(session.connectAll(benchSettings(), &error));
    EXPECT_EQ(error.kind, MeasurementErrorKind::TransportError);
    EXPECT_TRUE(error.message.contains("scope unreachable"));
    EXPECT_FALSE(session.isScopeConnected());
    EXPECT_FALSE(session.isGeneratorConnected());
}

TEST(InstrumentSessionTest, GeneratorFailureClosesTheScope) {
    auto bench = std::make_shared<FakeBench>();
    bench->generatorOpenFails = true;
    InstrumentSession session(std::make_unique<FakeInstrumentFactory>(bench));
    MeasurementError error;
    EXPECT_FALSE(session.connectAll(benchSettings(), &error));
    EXPECT_EQ(error.kind, MeasurementErrorKind::TransportError);
    EXPECT_FALSE(session.isScopeConnected());
    EXPECT_EQ(bench->events, QStringList({"scope.open", "generator.open", "scope.close"}));
}

TEST(InstrumentSessionTest, MissingSourceMeterIsNotFatal) {
    auto bench = std::make_shared<FakeBench>();
    bench->outputOpenFails = true;
    InstrumentSession session(std::make_unique<FakeInstrumentFactory>(bench));
    QStringList logs;
    QObject::connect(&session, &InstrumentSession::logMessage, [&logs](const QString &m) { logs << m; });
    MeasurementError error;
    ASSERT_TRUE(session.connectAll(benchSettings(), &error));
    EXPECT_TRUE(session.isScopeConnected());
    EXPECT_FALSE(session.isOutputSwitchConnected());
    EXPECT_EQ(session.outputSwitch(), nullptr);
    EXPECT_TRUE(logs.last().contains("without output control"));

    InstrumentSettings noSmu = benchSettings();
    noSmu.sourceMeterPort = "  ";
    bench->events.clear();
    ASSERT_TRUE(session.connectAll(noSmu, &error));
    EXPECT_FALSE(bench->events.contains("output.open"));
}

TEST(InstrumentSessionTest, ReconnectKeepsReferenceDisconnectClearsIt) {
    auto bench = std::make_shared<FakeBench>();
    InstrumentSession session(std::make_unique<FakeInstrumentFactory>(bench));
    MeasurementError error;
    ASSERT_TRUE(session.connectAll(benchSettings(), &error));
    session.reference().setSamples({1.0, 2.0}, "ref.csv");

    bench->events.clear();
    ASSERT_TRUE(session.connectAll(benchSettings(), &error));
    EXPECT_TRUE(session.reference().isLoaded());
    EXPECT_EQ(bench->events.mid(0, 3), QStringList({"output.close", "generator.close", "scope.close"}));

    session.disconnectAll();
    EXPECT_FALSE(session.reference().isLoaded());
    EXPECT_FALSE(session.isScopeConnected());
    EXPECT_EQ(session.scope(), nullptr);
}

TEST(InstrumentSessionTest, UnknownBackendIsNotReady) {
    InstrumentSession session;
    InstrumentSettings settings = benchSettings();
    settings.backend = "telepathy";
    MeasurementError error;
    EXPECT_FALSE(session.connectAll(settings, &error));
    EXPECT_EQ(error.kind, MeasurementErrorKind::NotReady);
    EXPECT_TRUE(error.message.contains("telepathy"));
}

TEST(InstrumentSessionTest, ReferenceLoadFailureKeepsNothing) {
    InstrumentSession session;
    MeasurementError error;
    EXPECT_FALSE(session.loadReference("/nonexistent/ref.csv", &error));
    EXPECT_TRUE(error.isError());
    EXPECT_FALSE(session.reference().isLoaded());
}

TEST(InstrumentSessionTest, SimulatedBackendRunsAFullCycle) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    InstrumentSession session;
    MeasurementConfig config;
    config.instruments = benchSettings();
    config.instruments.backend = "simulated";
    config.acquisition.averages = 2;
    config.outputDirectory = dir.path();

    MeasurementError error;
    ASSERT_TRUE(session.connectAll(config.instruments, &error)) << error.toString().toStdString();
    session.reference().setSamples(QVector<double>(2500, 1.0), "flat.csv");

    MeasurementController controller(session);
    controller.setSleepFunction([](int) {});
    CycleResult result;
    ASSERT_TRUE(controller.runCycle(config, result, &error)) << error.toString().toStdString();

    EXPECT_GE(result.normalized.length, 2498);
    EXPECT_TRUE(result.conditioned.smoothed);
    EXPECT_EQ(result.conditioned.values.size(),
              result.normalized.length - SignalConditioner::SMOOTHING_WINDOW + 1);
    EXPECT_EQ(result.spectrum.magnitudes.size(), result.conditioned.values.size() / 2);
    // The simulated SMU adds 50 mV while on: (0.05 - 1) / (0.0045 * 1)
    EXPECT_NEAR(result.conditioned.statistics.mean, (0.05 - 1.0) / 0.0045, 5.0);
    EXPECT_TRUE(QFileInfo::exists(result.csvPath));
}

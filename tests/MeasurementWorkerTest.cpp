#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QTemporaryDir>
#include <QFile>
#include "FakeInstruments.h"
#include "MeasurementWorker.h"

namespace {

class MeasurementWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        bench = std::make_shared<FakeBench>();
        worker = std::make_unique<MeasurementWorker>(std::make_unique<FakeInstrumentFactory>(bench));
        QObject::connect(worker.get(), &MeasurementWorker::cycleFinished,
                         [this](const CycleResult &r) { finished << r; });
        QObject::connect(worker.get(), &MeasurementWorker::cycleFailed,
                         [this](const MeasurementError &e) { failures << e; });

        config.acquisition.averages = 1;
        config.acquisition.interCaptureDelayMs = 0;
        config.acquisition.settlingDelayMs = 0;
        config.outputDirectory = dir.path();
    }

    QString writeReference() {
        const QString path = dir.filePath("ref.csv");
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) return QString();
        file.write("Time (s),Voltage (V)\n0,1\n1,1\n2,1\n");
        return path;
    }

    QTemporaryDir dir;
    std::shared_ptr<FakeBench> bench;
    std::unique_ptr<MeasurementWorker> worker;
    MeasurementConfig config;
    QVector<CycleResult> finished;
    QVector<MeasurementError> failures;
};

}

TEST_F(MeasurementWorkerTest, ConnectionOutcomeIsSignalled) {
    QVector<bool> states;
    QObject::connect(worker.get(), &MeasurementWorker::connectionChanged,
                     [&states](bool connected, bool) { states << connected; });
    int failed = 0;
    QObject::connect(worker.get(), &MeasurementWorker::connectionFailed,
                     [&failed](const MeasurementError &) { ++failed; });

    bench->scopeOpenFails = true;
    worker->connectInstruments(config.instruments);
    bench->scopeOpenFails = false;
    worker->connectInstruments(config.instruments);
    EXPECT_EQ(states, QVector<bool>({false, true}));
    EXPECT_EQ(failed, 1);
}

TEST_F(MeasurementWorkerTest, ReferenceIsReportedWithItsAverage) {
    QString name;
    int points = 0;
    QObject::connect(worker.get(), &MeasurementWorker::referenceLoaded,
                     [&](const QString &n, int p, double) { name = n; points = p; });
    worker->loadReference(writeReference());
    EXPECT_EQ(name, "ref.csv");
    EXPECT_EQ(points, 3);
}

TEST_F(MeasurementWorkerTest, QueuedCycleRunsOnceAndRejectsOverlap) {
    worker->connectInstruments(config.instruments);
    worker->loadReference(writeReference());

    ASSERT_TRUE(worker->requestCycle(config));
    EXPECT_TRUE(worker->isBusy());
    EXPECT_FALSE(worker->requestCycle(config));

    QCoreApplication::processEvents();
    ASSERT_EQ(finished.size(), 1);
    EXPECT_TRUE(failures.isEmpty());
    EXPECT_FALSE(worker->isBusy());
    EXPECT_EQ(finished.first().normalized.length, 3);
    EXPECT_EQ(bench->reads, 2);
}

TEST_F(MeasurementWorkerTest, FailedCycleReleasesTheReservation) {
    ASSERT_TRUE(worker->requestCycle(config));
    QCoreApplication::processEvents();
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures.first().kind, MeasurementErrorKind::NotReady);
    EXPECT_FALSE(worker->isBusy());
    EXPECT_TRUE(worker->requestCycle(config));
    QCoreApplication::processEvents();
}

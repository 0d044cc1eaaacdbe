#pragma once
#include <QObject>
#include <QString>
#include <atomic>
#include <memory>
#include "MeasurementConfig.h"
#include "MeasurementController.h"
#include "MeasurementError.h"

class InstrumentSession;
class InstrumentFactory;

// Lives on the measurement thread and owns the instrument session there.
// The GUI talks to it only through queued calls and receives results as signals.
class MeasurementWorker : public QObject {
    Q_OBJECT
public:
    explicit MeasurementWorker(std::unique_ptr<InstrumentFactory> factory = nullptr, QObject *parent = nullptr);
    ~MeasurementWorker();

    // Callable from any thread. Returns false, and queues nothing, while a cycle
    // is already requested or running.
    bool requestCycle(const MeasurementConfig &config);
    bool isBusy() const { return cycleReserved.load(); }

public slots:
    void connectInstruments(const InstrumentSettings &settings);
    void disconnectInstruments();
    void loadReference(const QString &path);
    void runCycle(const MeasurementConfig &config);

signals:
    void connectionChanged(bool connected, bool outputControl);
    void connectionFailed(const MeasurementError &error);
    void referenceLoaded(const QString &name, int points, double average);
    void referenceFailed(const MeasurementError &error);
    void referenceCleared();
    void cycleFinished(const CycleResult &result);
    void cycleFailed(const MeasurementError &error);
    void stateChanged(MeasurementController::State state);
    void logMessage(const QString &message);
    void statusMessage(const QString &message);

private:
    InstrumentSession *session;
    MeasurementController *controller;
    std::atomic<bool> cycleReserved{false};
};

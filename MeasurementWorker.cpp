#include "MeasurementWorker.h"
#include "InstrumentSession.h"
#include <QMetaObject>
#include <QDebug>

MeasurementWorker::MeasurementWorker(std::unique_ptr<InstrumentFactory> factory, QObject *parent)
    : QObject(parent)
{
    // Children follow the worker into its thread on moveToThread()
    session = new InstrumentSession(std::move(factory), this);
    controller = new MeasurementController(*session, this);

    connect(session, &InstrumentSession::logMessage, this, &MeasurementWorker::logMessage);
    connect(controller, &MeasurementController::logMessage, this, &MeasurementWorker::logMessage);
    connect(controller, &MeasurementController::statusMessage, this, &MeasurementWorker::statusMessage);
    connect(controller, &MeasurementController::stateChanged, this, &MeasurementWorker::stateChanged);
}

MeasurementWorker::~MeasurementWorker() {
    session->disconnectAll();
}

bool MeasurementWorker::requestCycle(const MeasurementConfig &config) {
    bool expected = false;
    if (!cycleReserved.compare_exchange_strong(expected, true)) {
        qWarning() << "[MeasurementWorker] Run request rejected, a cycle is already in progress";
        return false;
    }
    QMetaObject::invokeMethod(this, [this, config]() { runCycle(config); }, Qt::QueuedConnection);
    return true;
}

void MeasurementWorker::connectInstruments(const InstrumentSettings &settings) {
    emit statusMessage("Connecting...");
    MeasurementError error;
    if (!session->connectAll(settings, &error)) {
        emit connectionChanged(false, false);
        emit connectionFailed(error);
        emit statusMessage("Connection failed");
        return;
    }
    emit connectionChanged(true, session->isOutputSwitchConnected());
    emit statusMessage("Connected");
}

void MeasurementWorker::disconnectInstruments() {
    session->disconnectAll();
    emit connectionChanged(false, false);
    emit referenceCleared();
    emit statusMessage("Disconnected");
}

void MeasurementWorker::loadReference(const QString &path) {
    MeasurementError error;
    if (!session->loadReference(path, &error)) {
        emit logMessage(QString("Error loading reference: %1").arg(error.message));
        emit referenceFailed(error);
        return;
    }
    const ReferenceSignal &ref = session->reference();
    emit referenceLoaded(ref.sourceName(), int(ref.samples().size()), ref.average());
}

void MeasurementWorker::runCycle(const MeasurementConfig &config) {
    // Direct callers (not via requestCycle) take the reservation here
    cycleReserved.store(true);
    CycleResult result;
    MeasurementError error;
    const bool ok = controller->runCycle(config, result, &error);
    cycleReserved.store(false);
    if (ok) {
        emit cycleFinished(result);
    } else {
        emit cycleFailed(error);
    }
}

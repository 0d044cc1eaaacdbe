#include "MeasurementController.h"
#include "InstrumentSession.h"
#include "WaveformExporter.h"
#include <QDir>
#include <QStringList>
#include <QMetaEnum>
#include <QThread>
#include <QDebug>

MeasurementController::MeasurementController(InstrumentSession &session, QObject *parent)
    : QObject(parent), session(session)
{
    sleep = [](int ms) { QThread::msleep(ms); };
    artifactWriter = [this](CycleResult &result, const MeasurementConfig &config, MeasurementError *error) {
        return writeArtifacts(result, config, error);
    };
}

bool MeasurementController::isActive(State state) {
    switch (state) {
    case State::ConfiguringGenerator:
    case State::CapturingBase:
    case State::CapturingRead:
    case State::Normalizing:
        return true;
    case State::Idle:
    case State::Done:
    case State::Error:
        break;
    }
    return false;
}

QString MeasurementController::stateName(State state) {
    return QString::fromLatin1(QMetaEnum::fromType<State>().valueToKey(static_cast<int>(state)));
}

void MeasurementController::setSleepFunction(SleepFunction fn) {
    if (fn) sleep = std::move(fn);
}

void MeasurementController::setArtifactWriter(ArtifactWriter writer) {
    if (writer) artifactWriter = std::move(writer);
}

bool MeasurementController::runCycle(const MeasurementConfig &config, CycleResult &result, MeasurementError *error) {
    State current = cycleState.load();
    if (isActive(current)) {
        const QString msg = QString("A cycle is already running (%1)").arg(stateName(current));
        qWarning() << "[MeasurementController]" << msg;
        setMeasurementError(error, MeasurementErrorKind::NotReady, msg);
        return false;
    }
    if (!checkReady(error)) {
        return false;
    }
    if (!cycleState.compare_exchange_strong(current, State::ConfiguringGenerator)) {
        setMeasurementError(error, MeasurementErrorKind::NotReady, "A cycle is already running");
        return false;
    }
    emit stateChanged(State::ConfiguringGenerator);

    CycleResult cycle;
    cycle.timestamp = QDateTime::currentDateTime();
    log("--- Starting full cycle ---");

    MeasurementError acquireError;
    const bool acquired = acquire(config, cycle, &acquireError);

    // The output never stays on after a cycle, whatever happened above
    MeasurementError offError;
    const bool switchedOff = switchOutput(false, &offError);
    if (!switchedOff) {
        qCritical() << "[MeasurementController] Output could not be switched off:" << offError.message;
        log(QString("WARNING: output could not be switched off: %1").arg(offError.message));
    }
    if (!acquired) return fail(acquireError, error);
    if (!switchedOff) return fail(offError, error);

    enterState(State::Normalizing);
    MeasurementError processError;
    if (!process(cycle, &processError)) return fail(processError, error);

    MeasurementError writeError;
    if (!artifactWriter(cycle, config, &writeError)) {
        if (!writeError.isError()) {
            writeError = MeasurementError(MeasurementErrorKind::PersistenceFailed, "result files could not be written");
        }
        return fail(writeError, error);
    }

    result = cycle;
    enterState(State::Done);
    log("--- Cycle Complete ---");
    emit statusMessage("Cycle complete");
    return true;
}

bool MeasurementController::checkReady(MeasurementError *error) const {
    QStringList missing;
    if (!session.isScopeConnected()) missing << "scope not connected";
    if (!session.isGeneratorConnected()) missing << "generator not connected";
    if (!session.reference().isLoaded()) missing << "no reference loaded";
    if (missing.isEmpty()) return true;

    const QString msg = QString("Not ready: %1").arg(missing.join(", "));
    qWarning() << "[MeasurementController]" << msg;
    setMeasurementError(error, MeasurementErrorKind::NotReady, msg);
    return false;
}

bool MeasurementController::acquire(const MeasurementConfig &config, CycleResult &cycle, MeasurementError *error) {
    const AcquisitionSettings &acq = config.acquisition;

    emit statusMessage("Configuring generator...");
    if (!configureGenerator(config.generator, error)) return false;
    if (!switchOutput(false, error)) return false;
    sleep(acq.settlingDelayMs);

    enterState(State::CapturingBase);
    if (!captureAveraged("BASE", acq, cycle.base, error)) return false;

    if (!switchOutput(true, error)) return false;
    sleep(acq.settlingDelayMs);

    enterState(State::CapturingRead);
    return captureAveraged("READ", acq, cycle.read, error);
}

bool MeasurementController::configureGenerator(const GeneratorSettings &gen, MeasurementError *error) {
    GeneratorDriver *generator = session.generator();
    if (!generator || !generator->isConnected()) {
        setMeasurementError(error, MeasurementErrorKind::ConfigurationFailed, "generator not connected");
        return false;
    }
    const double duty = gen.dutyFraction();
    for (int channel = 1; channel <= 2; ++channel) {
        if (!generator->setWaveform(gen.shape, gen.frequencyHz, gen.amplitudeVpp, 0.0, gen.offsetV, channel)
            || !generator->setDutyCycle(duty, channel)
            || !generator->setAmplitude(gen.amplitudeVpp, channel)) {
            setMeasurementError(error, MeasurementErrorKind::ConfigurationFailed,
                                QString("Generator channel %1 rejected configuration: %2")
                                    .arg(channel).arg(generator->errorString()));
            return false;
        }
    }
    log(QString("Generator set: %1 %2 Hz, %3 Vpp, offset %4 V, duty %5%")
            .arg(waveShapeToString(gen.shape))
            .arg(gen.frequencyHz)
            .arg(gen.amplitudeVpp)
            .arg(gen.offsetV)
            .arg(duty * 100.0));
    return true;
}

bool MeasurementController::captureOnce(const QString &source, Waveform &waveform, MeasurementError *error) {
    ScopeDriver *scope = session.scope();
    if (!scope || !scope->isConnected()) {
        setMeasurementError(error, MeasurementErrorKind::TransportError, "scope not connected");
        return false;
    }
    CalibrationParameters cal;
    QVector<int> codes;
    if (!scope->setSource(source)
        || !scope->setDataFormat(1, "RPB")
        || !scope->queryCalibration(cal)
        || !scope->readRawSamples(codes)) {
        setMeasurementError(error, MeasurementErrorKind::TransportError,
                            QString("Scope read failed: %1").arg(scope->errorString()));
        return false;
    }
    waveform = Waveform::fromRawCodes(codes, cal);
    return true;
}

bool MeasurementController::captureAveraged(const QString &label, const AcquisitionSettings &acq,
                                            Waveform &averaged, MeasurementError *error) {
    log(QString("Capturing %1 (%2 avg)...").arg(label).arg(acq.averages));
    emit statusMessage(QString("Capturing %1...").arg(label));

    const QString source = acq.scopeSource;
    AveragingCapture capture([this, source](Waveform &wf, MeasurementError *err) {
        return captureOnce(source, wf, err);
    }, sleep);
    capture.setLabel(label);
    if (!capture.run(acq.averages, acq.interCaptureDelayMs, averaged, error)) {
        return false;
    }
    log(QString("%1 captured: %2 points").arg(label).arg(averaged.size()));
    return true;
}

bool MeasurementController::switchOutput(bool enabled, MeasurementError *error) {
    OutputSwitchDriver *output = session.outputSwitch();
    const QString label = enabled ? "ON" : "OFF";
    if (!output || !output->isConnected()) {
        log(QString("Source meter not connected, skipping output %1").arg(label));
        return true;
    }
    if (!output->setOutput(enabled)) {
        setMeasurementError(error, MeasurementErrorKind::TransportError,
                            QString("Source meter output %1 failed: %2").arg(label, output->errorString()));
        return false;
    }
    log(QString("Source meter output %1").arg(label));
    return true;
}

bool MeasurementController::process(CycleResult &cycle, MeasurementError *error) {
    const ReferenceSignal &reference = session.reference();
    if (!DifferentialNormalizer::normalize(cycle.base.voltage, cycle.read.voltage, reference.samples(),
                                           cycle.normalized, error)) {
        return false;
    }
    const QVector<double> time = cycle.read.time.mid(0, cycle.normalized.length);
    if (!SignalConditioner::condition(cycle.normalized.values, time, cycle.conditioned, error)) {
        return false;
    }
    cycle.spectrum = SpectralAnalyzer::analyze(cycle.conditioned.values, cycle.conditioned.time);

    const SummaryStatistics &stats = cycle.conditioned.statistics;
    log(QString("Processed %1 points (REF_AVG %2), max %3, min %4, avg %5")
            .arg(cycle.conditioned.values.size())
            .arg(cycle.normalized.referenceAverage, 0, 'g', 6)
            .arg(stats.max, 0, 'g', 6)
            .arg(stats.min, 0, 'g', 6)
            .arg(stats.mean, 0, 'g', 6));
    return true;
}

bool MeasurementController::writeArtifacts(CycleResult &cycle, const MeasurementConfig &config, MeasurementError *error) {
    const QDir dir(config.outputDirectory);
    WaveformExporter exporter;
    QString reason;

    const QString baseName = WaveformExporter::processedBaseName(cycle.timestamp);
    ProcessedTable table;
    table.statistics = cycle.conditioned.statistics.toKeyValues();
    table.time = cycle.conditioned.time;
    table.processed = cycle.conditioned.values;
    table.frequency = cycle.spectrum.frequencies;
    table.magnitude = cycle.spectrum.magnitudes;
    const QString csvPath = dir.filePath(baseName + ".csv");
    if (!exporter.exportProcessedCSV(csvPath, table, &reason)) {
        setMeasurementError(error, MeasurementErrorKind::PersistenceFailed, reason);
        return false;
    }
    cycle.csvPath = csvPath;
    cycle.imagePath = dir.filePath(baseName + ".png");
    log(QString("Saved Data: %1").arg(csvPath));

    const GeneratorSettings &gen = config.generator;
    const QString basePath = dir.filePath(
        WaveformExporter::averagedFileName("BASE", gen.frequencyHz, gen.offsetV, cycle.timestamp));
    const QString readPath = dir.filePath(
        WaveformExporter::averagedFileName("READ", gen.frequencyHz, gen.offsetV, cycle.timestamp));
    if (!exporter.exportWaveformCSV(basePath, cycle.base, &reason)
        || !exporter.exportWaveformCSV(readPath, cycle.read, &reason)) {
        setMeasurementError(error, MeasurementErrorKind::PersistenceFailed, reason);
        return false;
    }
    cycle.baseCsvPath = basePath;
    cycle.readCsvPath = readPath;
    log(QString("Saved averaged captures: %1, %2").arg(basePath, readPath));
    return true;
}

void MeasurementController::enterState(State next) {
    cycleState.store(next);
    qDebug() << "[MeasurementController] State ->" << stateName(next);
    emit stateChanged(next);
}

bool MeasurementController::fail(const MeasurementError &cause, MeasurementError *error) {
    qWarning().noquote() << "[MeasurementController] Cycle failed in" << stateName(cycleState.load())
                         << "-" << cause.toString();
    log(QString("ERROR: %1").arg(cause.toString()));
    setMeasurementError(error, cause.kind, cause.message);
    enterState(State::Error);
    return false;
}

void MeasurementController::log(const QString &message) {
    qInfo().noquote() << "[MeasurementController]" << message;
    emit logMessage(message);
}

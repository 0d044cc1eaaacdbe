#include "InstrumentSession.h"
#include <QDebug>

InstrumentSession::InstrumentSession(std::unique_ptr<InstrumentFactory> factory, QObject *parent)
    : QObject(parent), injectedFactory(std::move(factory))
{
}

InstrumentSession::~InstrumentSession() {
    disconnectAll();
}

bool InstrumentSession::connectAll(const InstrumentSettings &settings, MeasurementError *error) {
    closeInstruments();

    std::unique_ptr<InstrumentFactory> ownFactory;
    InstrumentFactory *factory = injectedFactory.get();
    if (!factory) {
        ownFactory = createInstrumentFactory(settings.backend);
        factory = ownFactory.get();
    }
    if (!factory) {
        setMeasurementError(error, MeasurementErrorKind::NotReady,
                            QString("unknown instrument backend '%1'").arg(settings.backend));
        return false;
    }

    std::unique_ptr<ScopeDriver> scope = factory->createScope();
    if (!scope->open(settings.scopeAddress, settings.scopeTimeoutMs)) {
        const QString msg = QString("Scope connection failed (%1): %2").arg(settings.scopeAddress, scope->errorString());
        qWarning() << "[InstrumentSession]" << msg;
        setMeasurementError(error, MeasurementErrorKind::TransportError, msg);
        return false;
    }
    log(QString("Scope connected: %1").arg(scope->identity()));

    std::unique_ptr<GeneratorDriver> generator = factory->createGenerator();
    if (!generator->open(settings.generatorPort)) {
        const QString msg = QString("Generator connection failed (%1): %2").arg(settings.generatorPort, generator->errorString());
        qWarning() << "[InstrumentSession]" << msg;
        scope->close();
        setMeasurementError(error, MeasurementErrorKind::TransportError, msg);
        return false;
    }
    log(QString("Generator connected on %1").arg(settings.generatorPort));

    std::unique_ptr<OutputSwitchDriver> output;
    if (settings.sourceMeterPort.trimmed().isEmpty()) {
        log("No source meter port configured, running without output control");
    } else {
        output = factory->createOutputSwitch();
        if (output->open(settings.sourceMeterPort, settings.sourceMeterTimeoutMs)) {
            log(QString("Source meter connected: %1").arg(output->identity()));
        } else {
            qWarning() << "[InstrumentSession] Source meter unavailable on" << settings.sourceMeterPort
                       << ":" << output->errorString();
            log(QString("Source meter unavailable (%1), running without output control").arg(output->errorString()));
            output.reset();
        }
    }

    scopeDriver = std::move(scope);
    generatorDriver = std::move(generator);
    outputDriver = std::move(output);
    return true;
}

void InstrumentSession::disconnectAll() {
    const bool hadInstruments = closeInstruments();
    referenceSignal.clear();
    if (hadInstruments) log("Instruments disconnected");
}

bool InstrumentSession::closeInstruments() {
    const bool hadInstruments = scopeDriver || generatorDriver || outputDriver;
    if (outputDriver) {
        outputDriver->close();
        outputDriver.reset();
    }
    if (generatorDriver) {
        generatorDriver->close();
        generatorDriver.reset();
    }
    if (scopeDriver) {
        scopeDriver->close();
        scopeDriver.reset();
    }
    return hadInstruments;
}

bool InstrumentSession::loadReference(const QString &path, MeasurementError *error) {
    if (!referenceSignal.loadFromFile(path, error)) {
        return false;
    }
    log(QString("Loaded reference: %1 points from %2 (avg %3)")
            .arg(referenceSignal.samples().size())
            .arg(referenceSignal.sourceName())
            .arg(referenceSignal.average(), 0, 'g', 6));
    return true;
}

bool InstrumentSession::isScopeConnected() const {
    return scopeDriver && scopeDriver->isConnected();
}

bool InstrumentSession::isGeneratorConnected() const {
    return generatorDriver && generatorDriver->isConnected();
}

bool InstrumentSession::isOutputSwitchConnected() const {
    return outputDriver && outputDriver->isConnected();
}

void InstrumentSession::log(const QString &message) {
    qInfo().noquote() << "[InstrumentSession]" << message;
    emit logMessage(message);
}

#pragma once
#include <QObject>
#include <QString>
#include <memory>
#include "InstrumentDrivers.h"
#include "ReferenceSignal.h"
#include "MeasurementError.h"

// Owns the instrument handles and the loaded reference for one bench session.
// Handles exist only between connectAll() and disconnectAll().
class InstrumentSession : public QObject {
    Q_OBJECT
public:
    // factory may be null; connectAll() then builds one from settings.backend
    explicit InstrumentSession(std::unique_ptr<InstrumentFactory> factory = nullptr, QObject *parent = nullptr);
    ~InstrumentSession();

    // Scope and generator are required, the output switch is optional
    // Reconnecting keeps the loaded reference
    bool connectAll(const InstrumentSettings &settings, MeasurementError *error);
    // Closes every handle and clears the reference
    void disconnectAll();

    bool loadReference(const QString &path, MeasurementError *error);

    bool isScopeConnected() const;
    bool isGeneratorConnected() const;
    bool isOutputSwitchConnected() const;

    ScopeDriver *scope() const { return scopeDriver.get(); }
    GeneratorDriver *generator() const { return generatorDriver.get(); }
    OutputSwitchDriver *outputSwitch() const { return outputDriver.get(); }

    const ReferenceSignal &reference() const { return referenceSignal; }
    ReferenceSignal &reference() { return referenceSignal; }

signals:
    void logMessage(const QString &message);

private:
    bool closeInstruments();
    void log(const QString &message);

    std::unique_ptr<InstrumentFactory> injectedFactory;
    std::unique_ptr<ScopeDriver> scopeDriver;
    std::unique_ptr<GeneratorDriver> generatorDriver;
    std::unique_ptr<OutputSwitchDriver> outputDriver;
    ReferenceSignal referenceSignal;
};

#pragma once
#include <QString>
#include <QVector>
#include <memory>
#include "Waveform.h"
#include "MeasurementConfig.h"

// Capability interfaces for the three bench instruments.
// Every call reports success through its return value; on failure errorString()
// describes the transport problem. Implementations block the calling thread.

class ScopeDriver {
public:
    virtual ~ScopeDriver() = default;

    virtual bool open(const QString &address, int timeoutMs) = 0;
    virtual void close() = 0;
    virtual bool isConnected() const = 0;
    virtual QString identity() const = 0;

    virtual bool setSource(const QString &channel) = 0;
    virtual bool setDataFormat(int width, const QString &encoding) = 0;
    virtual bool queryCalibration(CalibrationParameters &calibration) = 0;
    virtual bool readRawSamples(QVector<int> &codes) = 0;

    virtual QString errorString() const = 0;
};

class GeneratorDriver {
public:
    virtual ~GeneratorDriver() = default;

    virtual bool open(const QString &port) = 0;
    virtual void close() = 0;
    virtual bool isConnected() const = 0;

    virtual bool setWaveform(WaveShape shape, double frequencyHz, double amplitudeVpp,
                             double phaseDeg, double offsetV, int channel) = 0;
    virtual bool setDutyCycle(double fraction, int channel) = 0;
    virtual bool setAmplitude(double volts, int channel) = 0;

    virtual QString errorString() const = 0;
};

// Output-enable of the source-measure unit
class OutputSwitchDriver {
public:
    virtual ~OutputSwitchDriver() = default;

    virtual bool open(const QString &port, int timeoutMs) = 0;
    virtual void close() = 0;
    virtual bool isConnected() const = 0;
    virtual QString identity() const = 0;

    virtual bool setOutput(bool enabled) = 0;

    virtual QString errorString() const = 0;
};

// Selects the driver implementations for a session
class InstrumentFactory {
public:
    virtual ~InstrumentFactory() = default;
    virtual std::unique_ptr<ScopeDriver> createScope() = 0;
    virtual std::unique_ptr<GeneratorDriver> createGenerator() = 0;
    virtual std::unique_ptr<OutputSwitchDriver> createOutputSwitch() = 0;
};

// "hardware" or "simulated"; returns nullptr for an unknown backend name
std::unique_ptr<InstrumentFactory> createInstrumentFactory(const QString &backend);

#pragma once
#include <memory>
#include "InstrumentDrivers.h"

// Shared state of the simulated bench: the scope sees what the generator
// drives plus a DC step while the SMU output is on.
struct SimulatedBench {
    WaveShape shape = WaveShape::Sine;
    double frequencyHz = 1000.0;
    double amplitudeVpp = 0.0;
    double offsetV = 0.0;
    double dutyFraction = 0.5;
    bool outputEnabled = false;

    double outputStepV = 0.05;
    double noiseV = 0.005;
    int recordLength = 2500;
    double sampleIntervalS = 1.0e-6;

    double voltageAt(double t) const;
};

class SimulatedScope : public ScopeDriver {
public:
    explicit SimulatedScope(std::shared_ptr<SimulatedBench> bench);

    bool open(const QString &address, int timeoutMs) override;
    void close() override;
    bool isConnected() const override { return connected; }
    QString identity() const override;

    bool setSource(const QString &channel) override;
    bool setDataFormat(int width, const QString &encoding) override;
    bool queryCalibration(CalibrationParameters &calibration) override;
    bool readRawSamples(QVector<int> &codes) override;

    QString errorString() const override { return lastError; }

private:
    CalibrationParameters calibration() const;

    std::shared_ptr<SimulatedBench> bench;
    bool connected = false;
    QString source = QStringLiteral("MATH");
    QString lastError;
};

class SimulatedGenerator : public GeneratorDriver {
public:
    explicit SimulatedGenerator(std::shared_ptr<SimulatedBench> bench);

    bool open(const QString &port) override;
    void close() override { connected = false; }
    bool isConnected() const override { return connected; }

    bool setWaveform(WaveShape shape, double frequencyHz, double amplitudeVpp,
                     double phaseDeg, double offsetV, int channel) override;
    bool setDutyCycle(double fraction, int channel) override;
    bool setAmplitude(double volts, int channel) override;

    QString errorString() const override { return lastError; }

private:
    bool checkReady(int channel);

    std::shared_ptr<SimulatedBench> bench;
    bool connected = false;
    QString lastError;
};

class SimulatedOutputSwitch : public OutputSwitchDriver {
public:
    explicit SimulatedOutputSwitch(std::shared_ptr<SimulatedBench> bench);

    bool open(const QString &port, int timeoutMs) override;
    void close() override { connected = false; }
    bool isConnected() const override { return connected; }
    QString identity() const override;

    bool setOutput(bool enabled) override;

    QString errorString() const override { return lastError; }

private:
    std::shared_ptr<SimulatedBench> bench;
    bool connected = false;
    QString lastError;
};

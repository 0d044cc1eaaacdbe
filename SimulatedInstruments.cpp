#include "SimulatedInstruments.h"
#include <QRandomGenerator>
#include <QDebug>
#include <cmath>
#include <algorithm>

namespace {
const double PI = 3.14159265358979323846;
}

double SimulatedBench::voltageAt(double t) const {
    const double phase = std::fmod(frequencyHz * t, 1.0);
    double carrier = 0.0;
    if (shape == WaveShape::Sine) {
        carrier = 0.5 * amplitudeVpp * std::sin(2.0 * PI * phase);
    } else {
        carrier = (phase < dutyFraction ? 0.5 : -0.5) * amplitudeVpp;
    }
    return carrier + offsetV + (outputEnabled ? outputStepV : 0.0);
}

// --- Scope ---

SimulatedScope::SimulatedScope(std::shared_ptr<SimulatedBench> b) : bench(std::move(b)) {}

bool SimulatedScope::open(const QString &address, int) {
    connected = true;
    qInfo() << "[SimulatedScope] Opened (address ignored:" << address << ")";
    return true;
}

void SimulatedScope::close() {
    connected = false;
}

QString SimulatedScope::identity() const {
    return QStringLiteral("DiffScope,Simulated Scope,0,1.0");
}

bool SimulatedScope::setSource(const QString &channel) {
    source = channel;
    return connected;
}

bool SimulatedScope::setDataFormat(int width, const QString &encoding) {
    if (width != 1 || encoding.compare("RPB", Qt::CaseInsensitive) != 0) {
        lastError = QStringLiteral("Simulated scope only produces 1-byte RPB data");
        return false;
    }
    return connected;
}

CalibrationParameters SimulatedScope::calibration() const {
    CalibrationParameters cal;
    cal.xIncrement = bench->sampleIntervalS;
    cal.xOrigin = 0.0;
    cal.yMultiplier = 0.01;
    cal.yOffset = 128.0;
    cal.yZero = 0.0;
    return cal;
}

bool SimulatedScope::queryCalibration(CalibrationParameters &cal) {
    if (!connected) {
        lastError = QStringLiteral("Simulated scope not open");
        return false;
    }
    cal = calibration();
    return true;
}

bool SimulatedScope::readRawSamples(QVector<int> &codes) {
    if (!connected) {
        lastError = QStringLiteral("Simulated scope not open");
        return false;
    }
    const CalibrationParameters cal = calibration();
    QRandomGenerator *rng = QRandomGenerator::global();
    // Occasional short records, like a scope re-arming mid-transfer
    const int length = bench->recordLength - int(rng->bounded(3));
    codes.resize(length);
    for (int i = 0; i < length; ++i) {
        const double t = i * cal.xIncrement + cal.xOrigin;
        const double noise = (rng->generateDouble() - 0.5) * 2.0 * bench->noiseV;
        const double v = bench->voltageAt(t) + noise;
        codes[i] = std::clamp(qRound((v - cal.yZero) / cal.yMultiplier + cal.yOffset), 0, 255);
    }
    return true;
}

// --- Generator ---

SimulatedGenerator::SimulatedGenerator(std::shared_ptr<SimulatedBench> b) : bench(std::move(b)) {}

bool SimulatedGenerator::open(const QString &port) {
    connected = true;
    qInfo() << "[SimulatedGenerator] Opened (port ignored:" << port << ")";
    return true;
}

bool SimulatedGenerator::checkReady(int channel) {
    if (!connected) {
        lastError = QStringLiteral("Simulated generator not open");
        return false;
    }
    if (channel != 1 && channel != 2) {
        lastError = QStringLiteral("Invalid generator channel %1").arg(channel);
        return false;
    }
    return true;
}

bool SimulatedGenerator::setWaveform(WaveShape shape, double frequencyHz, double amplitudeVpp,
                                     double, double offsetV, int channel) {
    if (!checkReady(channel)) return false;
    // Channel 1 is the one wired to the scope
    if (channel == 1) {
        bench->shape = shape;
        bench->frequencyHz = frequencyHz;
        bench->amplitudeVpp = amplitudeVpp;
        bench->offsetV = offsetV;
    }
    return true;
}

bool SimulatedGenerator::setDutyCycle(double fraction, int channel) {
    if (!checkReady(channel)) return false;
    if (channel == 1) bench->dutyFraction = fraction;
    return true;
}

bool SimulatedGenerator::setAmplitude(double volts, int channel) {
    if (!checkReady(channel)) return false;
    if (channel == 1) bench->amplitudeVpp = volts;
    return true;
}

// --- Output switch ---

SimulatedOutputSwitch::SimulatedOutputSwitch(std::shared_ptr<SimulatedBench> b) : bench(std::move(b)) {}

bool SimulatedOutputSwitch::open(const QString &port, int) {
    connected = true;
    qInfo() << "[SimulatedOutputSwitch] Opened (port ignored:" << port << ")";
    return true;
}

QString SimulatedOutputSwitch::identity() const {
    return QStringLiteral("DiffScope,Simulated SMU,0,1.0");
}

bool SimulatedOutputSwitch::setOutput(bool enabled) {
    if (!connected) {
        lastError = QStringLiteral("Simulated SMU not open");
        return false;
    }
    bench->outputEnabled = enabled;
    return true;
}

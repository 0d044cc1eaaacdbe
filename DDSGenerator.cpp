#include "DDSGenerator.h"
#include "SerialHandler.h"
#include <QDebug>
#include <cmath>

namespace {
// Register numbers for channel 1; channel 2 is the next register
const int REG_WAVEFORM = 21;
const int REG_FREQUENCY = 23;
const int REG_AMPLITUDE = 25;
const int REG_OFFSET = 27;
const int REG_DUTY = 29;
const int REG_PHASE = 31;

const double MAX_FREQUENCY_HZ = 60.0e6;
const double MAX_AMPLITUDE_V = 20.0;
const double MAX_OFFSET_V = 9.99;

QByteArray registerWrite(int reg, int channel, const QByteArray &value) {
    return ":w" + QByteArray::number(reg + channel - 1) + "=" + value + ".";
}

bool validChannel(int channel) {
    return channel == 1 || channel == 2;
}
}

DDSGenerator::DDSGenerator(QObject *parent)
    : QObject(parent), serialHandler(new SerialHandler(this))
{
    serialHandler->setLineTerminator("\n");
    serialHandler->setTimeout(REPLY_TIMEOUT_MS);
    connect(serialHandler, &SerialHandler::errorOccurred, this, [this](const QString &msg) { lastError = msg; });
}

DDSGenerator::~DDSGenerator() {
    close();
}

bool DDSGenerator::open(const QString &port) {
    connected = false;
    if (port.trimmed().isEmpty()) {
        lastError = tr("Generator port is empty");
        return false;
    }
    if (!serialHandler->connectPort(port.trimmed(), BAUD_RATE)) {
        lastError = serialHandler->errorString();
        return false;
    }
    // Handshake: read the model register, any ":r00=" reply means the unit is alive
    QByteArray reply;
    if (!serialHandler->query(":r00=0.", reply) || !reply.startsWith(":r00=")) {
        lastError = tr("Koolertron not responding on %1").arg(port);
        qWarning() << "[DDSGenerator]" << lastError << "reply:" << reply;
        serialHandler->disconnectPort();
        return false;
    }
    connected = true;
    qInfo() << "[DDSGenerator] Connected on" << port << "model register" << reply;
    return true;
}

void DDSGenerator::close() {
    serialHandler->disconnectPort();
    connected = false;
}

bool DDSGenerator::isConnected() const {
    return connected && serialHandler->isOpen();
}

bool DDSGenerator::setWaveform(WaveShape shape, double frequencyHz, double amplitudeVpp,
                               double phaseDeg, double offsetV, int channel) {
    if (!checkChannel(channel)) return false;
    return sendCommand(waveformCommand(shape, channel), "waveform")
        && sendCommand(frequencyCommand(frequencyHz, channel), "frequency")
        && sendCommand(amplitudeCommand(amplitudeVpp, channel), "amplitude")
        && sendCommand(offsetCommand(offsetV, channel), "offset")
        && sendCommand(phaseCommand(phaseDeg, channel), "phase");
}

bool DDSGenerator::setDutyCycle(double fraction, int channel) {
    if (!checkChannel(channel)) return false;
    return sendCommand(dutyCommand(fraction, channel), "duty cycle");
}

bool DDSGenerator::setAmplitude(double volts, int channel) {
    if (!checkChannel(channel)) return false;
    return sendCommand(amplitudeCommand(volts, channel), "amplitude");
}

QByteArray DDSGenerator::waveformCommand(WaveShape shape, int channel) {
    if (!validChannel(channel)) return QByteArray();
    // 0 = sine, 1 = square; pulse uses the square output shaped by the duty register
    const int code = (shape == WaveShape::Sine) ? 0 : 1;
    return registerWrite(REG_WAVEFORM, channel, QByteArray::number(code));
}

QByteArray DDSGenerator::frequencyCommand(double frequencyHz, int channel) {
    if (!validChannel(channel) || !std::isfinite(frequencyHz)
        || frequencyHz < 0.0 || frequencyHz > MAX_FREQUENCY_HZ)
        return QByteArray();
    // centi-hertz, unit selector 0 (Hz)
    const qint64 centiHz = qRound64(frequencyHz * 100.0);
    return registerWrite(REG_FREQUENCY, channel, QByteArray::number(centiHz) + ",0");
}

QByteArray DDSGenerator::amplitudeCommand(double volts, int channel) {
    if (!validChannel(channel) || !std::isfinite(volts) || volts < 0.0 || volts > MAX_AMPLITUDE_V)
        return QByteArray();
    return registerWrite(REG_AMPLITUDE, channel, QByteArray::number(qRound(volts * 1000.0)));
}

QByteArray DDSGenerator::offsetCommand(double offsetV, int channel) {
    if (!validChannel(channel) || !std::isfinite(offsetV) || std::fabs(offsetV) > MAX_OFFSET_V)
        return QByteArray();
    // 10 mV steps around a 1000 code zero
    return registerWrite(REG_OFFSET, channel, QByteArray::number(qRound(offsetV * 100.0) + 1000));
}

QByteArray DDSGenerator::dutyCommand(double fraction, int channel) {
    if (!validChannel(channel) || !std::isfinite(fraction) || fraction < 0.0 || fraction > 1.0)
        return QByteArray();
    return registerWrite(REG_DUTY, channel, QByteArray::number(qRound(fraction * 1000.0)));
}

QByteArray DDSGenerator::phaseCommand(double phaseDeg, int channel) {
    if (!validChannel(channel) || !std::isfinite(phaseDeg))
        return QByteArray();
    double wrapped = std::fmod(phaseDeg, 360.0);
    if (wrapped < 0.0) wrapped += 360.0;
    int decidegrees = qRound(wrapped * 10.0);
    if (decidegrees >= 3600) decidegrees = 0;
    return registerWrite(REG_PHASE, channel, QByteArray::number(decidegrees));
}

bool DDSGenerator::sendCommand(const QByteArray &cmd, const char *what) {
    if (cmd.isEmpty()) {
        lastError = tr("Generator %1 value out of range").arg(QString::fromLatin1(what));
        qWarning() << "[DDSGenerator]" << lastError;
        return false;
    }
    if (!isConnected()) {
        lastError = tr("Generator not connected");
        return false;
    }
    QByteArray reply;
    if (!serialHandler->query(cmd, reply)) {
        lastError = tr("Generator %1 command failed: %2").arg(QString::fromLatin1(what), serialHandler->errorString());
        return false;
    }
    if (!reply.startsWith(":ok")) {
        lastError = tr("Generator rejected %1 command %2 (reply %3)")
                        .arg(QString::fromLatin1(what), QString::fromLatin1(cmd), QString::fromLatin1(reply));
        qWarning() << "[DDSGenerator]" << lastError;
        return false;
    }
    return true;
}

bool DDSGenerator::checkChannel(int channel) {
    if (validChannel(channel)) return true;
    lastError = tr("Invalid generator channel %1").arg(channel);
    qWarning() << "[DDSGenerator]" << lastError;
    return false;
}

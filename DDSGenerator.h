#pragma once
#include <QObject>
#include <QByteArray>
#include "InstrumentDrivers.h"

class SerialHandler;

// Koolertron (JDS6600 family) two-channel DDS generator on a serial port.
// Register writes look like ":w21=0." and are acknowledged with ":ok".
class DDSGenerator : public QObject, public GeneratorDriver {
    Q_OBJECT
public:
    static constexpr qint32 BAUD_RATE = 115200;
    static constexpr int REPLY_TIMEOUT_MS = 2000;

    explicit DDSGenerator(QObject *parent = nullptr);
    ~DDSGenerator() override;

    bool open(const QString &port) override;
    void close() override;
    bool isConnected() const override;

    bool setWaveform(WaveShape shape, double frequencyHz, double amplitudeVpp,
                     double phaseDeg, double offsetV, int channel) override;
    bool setDutyCycle(double fraction, int channel) override;
    bool setAmplitude(double volts, int channel) override;

    QString errorString() const override { return lastError; }

    // Register command builders; an empty result means the argument is out of range
    static QByteArray waveformCommand(WaveShape shape, int channel);
    static QByteArray frequencyCommand(double frequencyHz, int channel);
    static QByteArray amplitudeCommand(double volts, int channel);
    static QByteArray offsetCommand(double offsetV, int channel);
    static QByteArray dutyCommand(double fraction, int channel);
    static QByteArray phaseCommand(double phaseDeg, int channel);

private:
    bool sendCommand(const QByteArray &cmd, const char *what);
    bool checkChannel(int channel);

    SerialHandler *serialHandler;
    bool connected = false;
    QString lastError;
};

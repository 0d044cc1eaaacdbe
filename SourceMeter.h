#pragma once
#include <QObject>
#include "InstrumentDrivers.h"

class SerialHandler;

// Keithley 2400-style source-measure unit driven over RS-232 with SCPI
class SourceMeter : public QObject, public OutputSwitchDriver {
    Q_OBJECT
public:
    static constexpr qint32 BAUD_RATE = 9600;

    explicit SourceMeter(QObject *parent = nullptr);
    ~SourceMeter() override;

    bool open(const QString &port, int timeoutMs) override;
    void close() override;
    bool isConnected() const override;
    QString identity() const override { return idn; }

    bool setOutput(bool enabled) override;

    QString errorString() const override { return lastError; }

    static QByteArray outputCommand(bool enabled);

private:
    SerialHandler *serialHandler;
    QString idn;
    QString lastError;
};

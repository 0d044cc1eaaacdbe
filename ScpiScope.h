#pragma once
#include <QObject>
#include <QByteArray>
#include "InstrumentDrivers.h"

class QTcpSocket;

// Tektronix-style oscilloscope on a raw SCPI socket (port 4000 by default).
// Waveform data comes back from CURVE? as an IEEE 488.2 definite-length block.
class ScpiScope : public QObject, public ScopeDriver {
    Q_OBJECT
public:
    static constexpr quint16 DEFAULT_PORT = 4000;

    enum class BlockStatus { Complete, Incomplete, Malformed };

    explicit ScpiScope(QObject *parent = nullptr);
    ~ScpiScope() override;

    bool open(const QString &address, int timeoutMs) override;
    void close() override;
    bool isConnected() const override;
    QString identity() const override { return idn; }

    bool setSource(const QString &channel) override;
    bool setDataFormat(int width, const QString &encoding) override;
    bool queryCalibration(CalibrationParameters &calibration) override;
    bool readRawSamples(QVector<int> &codes) override;

    QString errorString() const override { return lastError; }

    // Accepts "TCPIP0::host::port::SOCKET", "host:port" or a bare host
    static bool parseAddress(const QString &address, QString &host, quint16 &port);
    // "#<n><len><payload>"; consumed is set to the bytes used when Complete
    static BlockStatus parseDefiniteLengthBlock(const QByteArray &buffer, QByteArray &payload, int &consumed);
    // RPB = unsigned, RIB = signed; width 2 is big-endian
    static bool decodeCodes(const QByteArray &payload, int width, const QString &encoding, QVector<int> &codes);

private:
    bool write(const QByteArray &cmd);
    bool query(const QByteArray &cmd, QByteArray &reply);
    bool queryDouble(const QByteArray &cmd, double &value);
    bool waitForData(int msecs);
    void fail(const QString &msg);

    QTcpSocket *socket;
    QByteArray rxBuffer;
    int timeoutMs = 10000;
    int dataWidth = 1;
    QString dataEncoding = QStringLiteral("RPB");
    QString idn;
    QString lastError;
};

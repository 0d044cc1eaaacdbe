#include "ScpiScope.h"
#include <QTcpSocket>
#include <QElapsedTimer>
#include <QStringList>
#include <QDebug>

ScpiScope::ScpiScope(QObject *parent)
    : QObject(parent), socket(new QTcpSocket(this))
{
}

ScpiScope::~ScpiScope() {
    close();
}

bool ScpiScope::open(const QString &address, int timeout) {
    close();
    lastError.clear();
    timeoutMs = timeout;
    QString host;
    quint16 port = DEFAULT_PORT;
    if (!parseAddress(address, host, port)) {
        fail(tr("Unsupported scope address '%1' (expected TCPIP0::<host>::<port>::SOCKET)").arg(address));
        return false;
    }
    socket->connectToHost(host, port);
    if (!socket->waitForConnected(timeoutMs)) {
        fail(tr("Cannot reach scope at %1:%2: %3").arg(host).arg(port).arg(socket->errorString()));
        socket->abort();
        return false;
    }
    // Bare values in query replies, no command headers
    QByteArray reply;
    if (!write("HEADER OFF") || !query("*IDN?", reply)) {
        socket->abort();
        return false;
    }
    idn = QString::fromLatin1(reply).trimmed();
    qInfo() << "[ScpiScope] Connected to" << host << port << ":" << idn;
    return true;
}

void ScpiScope::close() {
    if (socket->state() != QAbstractSocket::UnconnectedState) {
        socket->disconnectFromHost();
        if (socket->state() != QAbstractSocket::UnconnectedState)
            socket->waitForDisconnected(1000);
        qDebug() << "[ScpiScope] Disconnected";
    }
    rxBuffer.clear();
    idn.clear();
}

bool ScpiScope::isConnected() const {
    return socket->state() == QAbstractSocket::ConnectedState;
}

bool ScpiScope::setSource(const QString &channel) {
    const QString src = channel.trimmed().toUpper();
    static const QStringList valid = {"CH1", "CH2", "CH3", "CH4", "MATH"};
    if (!valid.contains(src)) {
        fail(tr("Invalid scope source '%1'").arg(channel));
        return false;
    }
    return write("DATA:SOURCE " + src.toLatin1());
}

bool ScpiScope::setDataFormat(int width, const QString &encoding) {
    const QString enc = encoding.trimmed().toUpper();
    if ((width != 1 && width != 2) || (enc != "RPB" && enc != "RIB")) {
        fail(tr("Unsupported data format width=%1 encoding=%2").arg(width).arg(encoding));
        return false;
    }
    if (!write("DATA:WIDTH " + QByteArray::number(width)) || !write("DATA:ENC " + enc.toLatin1()))
        return false;
    dataWidth = width;
    dataEncoding = enc;
    return true;
}

bool ScpiScope::queryCalibration(CalibrationParameters &calibration) {
    CalibrationParameters cal;
    if (!queryDouble("WFMPRE:XINCR?", cal.xIncrement)
        || !queryDouble("WFMPRE:XZERO?", cal.xOrigin)
        || !queryDouble("WFMPRE:YMULT?", cal.yMultiplier)
        || !queryDouble("WFMPRE:YOFF?", cal.yOffset)
        || !queryDouble("WFMPRE:YZERO?", cal.yZero))
        return false;
    calibration = cal;
    return true;
}

bool ScpiScope::readRawSamples(QVector<int> &codes) {
    rxBuffer.clear();
    if (!write("CURVE?")) return false;

    QElapsedTimer timer;
    timer.start();
    QByteArray payload;
    int consumed = 0;
    while (true) {
        const BlockStatus status = parseDefiniteLengthBlock(rxBuffer, payload, consumed);
        if (status == BlockStatus::Complete) break;
        if (status == BlockStatus::Malformed) {
            fail(tr("Malformed CURVE? block header: %1").arg(QString::fromLatin1(rxBuffer.left(16).toHex())));
            rxBuffer.clear();
            return false;
        }
        if (!waitForData(int(timeoutMs - timer.elapsed()))) {
            fail(tr("Timeout reading waveform (%1 bytes received)").arg(rxBuffer.size()));
            rxBuffer.clear();
            return false;
        }
    }
    rxBuffer.remove(0, consumed);
    // Block is followed by the message terminator
    if (rxBuffer.startsWith('\n')) rxBuffer.remove(0, 1);

    if (!decodeCodes(payload, dataWidth, dataEncoding, codes)) {
        fail(tr("Waveform payload of %1 bytes does not match width %2").arg(payload.size()).arg(dataWidth));
        return false;
    }
    qDebug() << "[ScpiScope] CURVE? returned" << codes.size() << "samples";
    return true;
}

bool ScpiScope::parseAddress(const QString &address, QString &host, quint16 &port) {
    const QString addr = address.trimmed();
    if (addr.isEmpty()) return false;

    if (addr.startsWith("TCPIP", Qt::CaseInsensitive)) {
        const QStringList parts = addr.split("::");
        if (parts.size() != 4 || parts[3].compare("SOCKET", Qt::CaseInsensitive) != 0)
            return false;
        bool ok = false;
        const uint p = parts[2].toUInt(&ok);
        if (!ok || p == 0 || p > 65535 || parts[1].isEmpty()) return false;
        host = parts[1];
        port = quint16(p);
        return true;
    }

    const int colon = addr.lastIndexOf(':');
    if (colon >= 0) {
        bool ok = false;
        const uint p = addr.mid(colon + 1).toUInt(&ok);
        if (!ok || p == 0 || p > 65535 || colon == 0) return false;
        host = addr.left(colon);
        port = quint16(p);
        return true;
    }

    host = addr;
    port = DEFAULT_PORT;
    return true;
}

ScpiScope::BlockStatus ScpiScope::parseDefiniteLengthBlock(const QByteArray &buffer, QByteArray &payload, int &consumed) {
    if (buffer.size() < 2) return BlockStatus::Incomplete;
    if (buffer[0] != '#') return BlockStatus::Malformed;
    const char digitsChar = buffer[1];
    if (digitsChar < '1' || digitsChar > '9') return BlockStatus::Malformed;
    const int digits = digitsChar - '0';
    if (buffer.size() < 2 + digits) return BlockStatus::Incomplete;
    bool ok = false;
    const int length = buffer.mid(2, digits).toInt(&ok);
    if (!ok || length < 0) return BlockStatus::Malformed;
    const int headerSize = 2 + digits;
    if (buffer.size() < headerSize + length) return BlockStatus::Incomplete;
    payload = buffer.mid(headerSize, length);
    consumed = headerSize + length;
    return BlockStatus::Complete;
}

bool ScpiScope::decodeCodes(const QByteArray &payload, int width, const QString &encoding, QVector<int> &codes) {
    if (width != 1 && width != 2) return false;
    if (payload.size() % width != 0) return false;
    const bool isSigned = encoding.compare("RIB", Qt::CaseInsensitive) == 0;
    const int n = payload.size() / width;
    codes.resize(n);
    for (int i = 0; i < n; ++i) {
        if (width == 1) {
            const quint8 raw = static_cast<quint8>(payload[i]);
            codes[i] = isSigned ? int(static_cast<qint8>(raw)) : int(raw);
        } else {
            const quint8 hi = static_cast<quint8>(payload[2 * i]);
            const quint8 lo = static_cast<quint8>(payload[2 * i + 1]);
            const quint16 raw = quint16((hi << 8) | lo);
            codes[i] = isSigned ? int(static_cast<qint16>(raw)) : int(raw);
        }
    }
    return true;
}

bool ScpiScope::write(const QByteArray &cmd) {
    if (!isConnected()) {
        fail(tr("Scope not connected"));
        return false;
    }
    const QByteArray frame = cmd + '\n';
    if (socket->write(frame) != frame.size() || !socket->waitForBytesWritten(timeoutMs)) {
        fail(tr("Write '%1' failed: %2").arg(QString::fromLatin1(cmd), socket->errorString()));
        return false;
    }
    return true;
}

bool ScpiScope::query(const QByteArray &cmd, QByteArray &reply) {
    rxBuffer.clear();
    if (!write(cmd)) return false;
    QElapsedTimer timer;
    timer.start();
    while (true) {
        const int idx = rxBuffer.indexOf('\n');
        if (idx >= 0) {
            reply = rxBuffer.left(idx).trimmed();
            rxBuffer.remove(0, idx + 1);
            return true;
        }
        if (!waitForData(int(timeoutMs - timer.elapsed()))) {
            fail(tr("Timeout waiting for reply to '%1'").arg(QString::fromLatin1(cmd)));
            return false;
        }
    }
}

bool ScpiScope::queryDouble(const QByteArray &cmd, double &value) {
    QByteArray reply;
    if (!query(cmd, reply)) return false;
    bool ok = false;
    const double v = reply.toDouble(&ok);
    if (!ok) {
        fail(tr("Non-numeric reply to '%1': %2").arg(QString::fromLatin1(cmd), QString::fromLatin1(reply)));
        return false;
    }
    value = v;
    return true;
}

bool ScpiScope::waitForData(int msecs) {
    if (msecs <= 0 || !isConnected()) return false;
    if (!socket->waitForReadyRead(msecs)) return false;
    rxBuffer.append(socket->readAll());
    return true;
}

void ScpiScope::fail(const QString &msg) {
    lastError = msg;
    qWarning() << "[ScpiScope]" << msg;
}

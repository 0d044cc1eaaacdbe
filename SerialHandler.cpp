#include "SerialHandler.h"
#include <QElapsedTimer>
#include <QDebug>

SerialHandler::SerialHandler(QObject *parent) : QObject(parent) {
    serial = new QSerialPort(this);
    connect(serial, &QSerialPort::errorOccurred, this, &SerialHandler::handleError);
}

SerialHandler::~SerialHandler() {
    disconnectPort();
}

bool SerialHandler::connectPort(const QString &portName, qint32 baudRate) {
    if (serial->isOpen()) serial->close();
    rxBuffer.clear();
    lastError.clear();
    serial->setPortName(portName);
    serial->setBaudRate(baudRate);
    serial->setDataBits(QSerialPort::Data8);
    serial->setParity(QSerialPort::NoParity);
    serial->setStopBits(QSerialPort::OneStop);
    serial->setFlowControl(QSerialPort::NoFlowControl);
    if (serial->open(QIODevice::ReadWrite)) {
        qDebug() << "[SerialHandler] Serial port opened successfully:" << portName << "@" << baudRate;
        return true;
    }
    fail(tr("Failed to open serial port %1: %2").arg(portName, serial->errorString()));
    return false;
}

void SerialHandler::disconnectPort() {
    if (serial->isOpen()) {
        serial->close();
        qDebug() << "[SerialHandler] Serial port closed:" << serial->portName();
    }
    rxBuffer.clear();
}

bool SerialHandler::isOpen() const {
    return serial->isOpen();
}

bool SerialHandler::sendLine(const QByteArray &cmd) {
    if (!serial->isOpen()) {
        fail(tr("Serial port not open"));
        return false;
    }
    const QByteArray frame = cmd + lineTerminator;
    if (serial->write(frame) != frame.size()) {
        fail(tr("Write to %1 failed: %2").arg(serial->portName(), serial->errorString()));
        return false;
    }
    // bytesToWrite() is zero when the backend wrote synchronously
    if (serial->bytesToWrite() > 0 && !serial->waitForBytesWritten(timeoutMs)) {
        fail(tr("Timeout writing to %1").arg(serial->portName()));
        return false;
    }
    qDebug() << "[SerialHandler] Sent:" << cmd;
    return true;
}

bool SerialHandler::readLine(QByteArray &line) {
    if (!serial->isOpen()) {
        fail(tr("Serial port not open"));
        return false;
    }
    QElapsedTimer timer;
    timer.start();
    while (true) {
        const int idx = rxBuffer.indexOf(lineTerminator);
        if (idx >= 0) {
            line = rxBuffer.left(idx);
            rxBuffer.remove(0, idx + lineTerminator.size());
            while (line.endsWith('\r') || line.endsWith('\n')) line.chop(1);
            qDebug() << "[SerialHandler] Received:" << line;
            return true;
        }
        const qint64 remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0 || !serial->waitForReadyRead(int(remaining))) {
            fail(tr("Timeout waiting for reply on %1").arg(serial->portName()));
            return false;
        }
        rxBuffer.append(serial->readAll());
    }
}

bool SerialHandler::query(const QByteArray &cmd, QByteArray &reply) {
    // Stale bytes from an earlier timed-out exchange would be taken as this reply
    rxBuffer.clear();
    if (serial->isOpen()) serial->clear(QSerialPort::Input);
    if (!sendLine(cmd)) return false;
    return readLine(reply);
}

void SerialHandler::handleError(QSerialPort::SerialPortError error) {
    if (error != QSerialPort::NoError && error != QSerialPort::TimeoutError) {
        qWarning() << "[SerialHandler] Port error" << int(error) << serial->errorString();
        lastError = serial->errorString();
        // Device unplugged: the handle is dead, isOpen() must report it
        if (error == QSerialPort::ResourceError && serial->isOpen()) serial->close();
        emit errorOccurred(lastError);
    }
}

void SerialHandler::fail(const QString &msg) {
    lastError = msg;
    qWarning() << "[SerialHandler]" << msg;
    emit errorOccurred(msg);
}

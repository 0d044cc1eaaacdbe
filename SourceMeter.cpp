#include "SourceMeter.h"
#include "SerialHandler.h"
#include <QDebug>

SourceMeter::SourceMeter(QObject *parent)
    : QObject(parent), serialHandler(new SerialHandler(this))
{
    serialHandler->setLineTerminator("\r");
    connect(serialHandler, &SerialHandler::errorOccurred, this, [this](const QString &msg) { lastError = msg; });
}

SourceMeter::~SourceMeter() {
    close();
}

bool SourceMeter::open(const QString &port, int timeoutMs) {
    idn.clear();
    serialHandler->setTimeout(timeoutMs);
    if (!serialHandler->connectPort(port.trimmed(), BAUD_RATE)) {
        lastError = serialHandler->errorString();
        return false;
    }
    QByteArray reply;
    if (!serialHandler->query("*IDN?", reply)) {
        lastError = tr("Source meter did not answer *IDN?: %1").arg(serialHandler->errorString());
        serialHandler->disconnectPort();
        return false;
    }
    idn = QString::fromLatin1(reply).trimmed();
    qInfo() << "[SourceMeter] Connected:" << idn;
    return true;
}

void SourceMeter::close() {
    serialHandler->disconnectPort();
}

bool SourceMeter::isConnected() const {
    return serialHandler->isOpen();
}

bool SourceMeter::setOutput(bool enabled) {
    const QByteArray cmd = outputCommand(enabled);
    if (!serialHandler->sendLine(cmd)) {
        lastError = tr("Source meter %1 failed: %2").arg(QString::fromLatin1(cmd), serialHandler->errorString());
        return false;
    }
    qDebug() << "[SourceMeter]" << cmd;
    return true;
}

QByteArray SourceMeter::outputCommand(bool enabled) {
    return enabled ? QByteArray(":OUTP ON") : QByteArray(":OUTP OFF");
}

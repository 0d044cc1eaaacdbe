#pragma once
#include <QObject>
#include <QSerialPort>
#include <QByteArray>

// Blocking, line-oriented serial link shared by the generator and SMU drivers.
// Must be used from the thread that created it.
class SerialHandler : public QObject {
    Q_OBJECT
public:
    explicit SerialHandler(QObject *parent = nullptr);
    ~SerialHandler();

    bool connectPort(const QString &portName, qint32 baudRate);
    void disconnectPort();
    bool isOpen() const;

    void setLineTerminator(const QByteArray &terminator) { lineTerminator = terminator; }
    void setTimeout(int ms) { timeoutMs = ms; }

    // Writes cmd + terminator and waits until it has left the buffer
    bool sendLine(const QByteArray &cmd);
    // Reads one terminated line, terminator and trailing CR/LF stripped
    bool readLine(QByteArray &line);
    bool query(const QByteArray &cmd, QByteArray &reply);

    QString errorString() const { return lastError; }

signals:
    void errorOccurred(const QString &msg);

private slots:
    void handleError(QSerialPort::SerialPortError error);

private:
    void fail(const QString &msg);

    QSerialPort *serial;
    QByteArray rxBuffer;
    QByteArray lineTerminator = "\n";
    int timeoutMs = 2000;
    QString lastError;
};

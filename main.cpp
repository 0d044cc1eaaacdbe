#include <QApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QSettings>
#include <QTextStream>
#include <QDebug>
#include <cstdio>
#include "MainWindow.h"
#include "MeasurementConfig.h"
#include "MeasurementController.h"
#include "MeasurementError.h"
#include "Waveform.h"

namespace {

QFile logFile;
QMutex logMutex;

const char *severityName(QtMsgType type) {
    switch (type) {
    case QtDebugMsg: return "DEBUG";
    case QtInfoMsg: return "INFO";
    case QtWarningMsg: return "WARN";
    case QtCriticalMsg: return "CRIT";
    case QtFatalMsg: return "FATAL";
    }
    return "LOG";
}

// Timestamped lines to stderr and to diffscope.log
void messageHandler(QtMsgType type, const QMessageLogContext &, const QString &msg) {
    const QString line = QString("%1 %2 %3\n")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz"))
        .arg(QString::fromLatin1(severityName(type)), -5)
        .arg(msg);
    const QByteArray bytes = line.toLocal8Bit();

    QMutexLocker locker(&logMutex);
    fputs(bytes.constData(), stderr);
    fflush(stderr);
    if (logFile.isOpen()) {
        logFile.write(bytes);
        logFile.flush();
    }
}

void openLogFile() {
    QSettings settings;
    MeasurementConfig config;
    config.load(settings);
    QDir dir;
    if (!dir.mkpath(config.outputDirectory)) {
        qWarning() << "[main] Cannot create output directory" << config.outputDirectory;
        return;
    }
    logFile.setFileName(QDir(config.outputDirectory).filePath("diffscope.log"));
    if (!logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "[main] Cannot open log file" << logFile.fileName() << logFile.errorString();
    }
}

}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setOrganizationName("DiffScope");
    QApplication::setApplicationName("DiffScope");

    qInstallMessageHandler(messageHandler);
    openLogFile();
    qInfo() << "[main] DiffScope starting";

    qRegisterMetaType<MeasurementError>("MeasurementError");
    qRegisterMetaType<InstrumentSettings>("InstrumentSettings");
    qRegisterMetaType<MeasurementConfig>("MeasurementConfig");
    qRegisterMetaType<Waveform>("Waveform");
    qRegisterMetaType<CycleResult>("CycleResult");
    qRegisterMetaType<MeasurementController::State>("MeasurementController::State");

    QPalette darkPalette;
    darkPalette.setColor(QPalette::Window, QColor(53,53,53));
    darkPalette.setColor(QPalette::WindowText, Qt::white);
    darkPalette.setColor(QPalette::Base, QColor(35,35,35));
    darkPalette.setColor(QPalette::AlternateBase, QColor(53,53,53));
    darkPalette.setColor(QPalette::Text, Qt::white);
    darkPalette.setColor(QPalette::Button, QColor(53,53,53));
    darkPalette.setColor(QPalette::ButtonText, Qt::white);
    darkPalette.setColor(QPalette::Highlight, QColor(42,130,218));
    darkPalette.setColor(QPalette::HighlightedText, Qt::black);
    qApp->setPalette(darkPalette);

    MainWindow w;
    w.show();

    const int rc = app.exec();
    qInfo() << "[main] DiffScope exiting with code" << rc;
    return rc;
}

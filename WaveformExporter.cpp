#include "WaveformExporter.h"
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QTextStream>
#include <QStringList>
#include <QRegularExpression>
#include <QDebug>

namespace {
const char *DATA_HEADER = "Time,Processed_Signal,Frequency,FFT_Magnitude";

QString number(double v) {
    return QString::number(v, 'g', 12);
}

QString cell(const QVector<double> &column, int i) {
    return i < column.size() ? number(column[i]) : QString();
}

bool appendCell(const QString &text, QVector<double> &column) {
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) return true;
    bool ok = false;
    const double v = trimmed.toDouble(&ok);
    if (!ok) return false;
    column.append(v);
    return true;
}
}

WaveformExporter::WaveformExporter(QObject *parent) : QObject(parent) {}

WaveformExporter::~WaveformExporter() {}

QString WaveformExporter::formatProcessedCSV(const ProcessedTable &table) {
    QString text;
    QTextStream out(&text);
    out << "Statistics\n";
    for (const auto &kv : table.statistics) {
        out << kv.first << "," << number(kv.second) << "\n";
    }
    out << "\nData\n";
    out << DATA_HEADER << "\n";
    const int rows = qMax(table.time.size(), table.frequency.size());
    for (int i = 0; i < rows; ++i) {
        out << cell(table.time, i) << ","
            << cell(table.processed, i) << ","
            << cell(table.frequency, i) << ","
            << cell(table.magnitude, i) << "\n";
    }
    out.flush();
    return text;
}

bool WaveformExporter::parseProcessedCSV(const QString &text, ProcessedTable &table, QString *errorString) {
    const QStringList lines = text.split(QRegularExpression("\r\n|\n"));
    ProcessedTable result;
    enum class Section { None, Statistics, Data, Rows } section = Section::None;

    for (int i = 0; i < lines.size(); ++i) {
        const QString line = lines[i];
        if (section == Section::Rows) {
            if (line.isEmpty()) continue;
            const QStringList cells = line.split(',');
            if (cells.size() != 4) {
                if (errorString) *errorString = QString("line %1: expected 4 fields, got %2").arg(i + 1).arg(cells.size());
                return false;
            }
            if (!appendCell(cells[0], result.time) || !appendCell(cells[1], result.processed)
                || !appendCell(cells[2], result.frequency) || !appendCell(cells[3], result.magnitude)) {
                if (errorString) *errorString = QString("line %1: non-numeric field").arg(i + 1);
                return false;
            }
            continue;
        }
        const QString trimmed = line.trimmed();
        if (trimmed == "Statistics") {
            section = Section::Statistics;
        } else if (trimmed == "Data") {
            section = Section::Data;
        } else if (section == Section::Data && trimmed == DATA_HEADER) {
            section = Section::Rows;
        } else if (section == Section::Statistics && !trimmed.isEmpty()) {
            const int comma = trimmed.indexOf(',');
            bool ok = false;
            const double v = comma > 0 ? trimmed.mid(comma + 1).toDouble(&ok) : 0.0;
            if (!ok) {
                if (errorString) *errorString = QString("line %1: malformed statistic '%2'").arg(i + 1).arg(trimmed);
                return false;
            }
            result.statistics.append(qMakePair(trimmed.left(comma), v));
        }
    }
    if (section != Section::Rows) {
        if (errorString) *errorString = "data table header not found";
        return false;
    }
    table = result;
    return true;
}

bool WaveformExporter::exportProcessedCSV(const QString &fileName, const ProcessedTable &table, QString *errorString) {
    if (!writeText(fileName, formatProcessedCSV(table), errorString)) return false;
    qDebug() << "[WaveformExporter] Saved processed data:" << fileName
             << "(" << table.time.size() << "samples," << table.frequency.size() << "bins )";
    return true;
}

bool WaveformExporter::exportWaveformCSV(const QString &fileName, const Waveform &waveform, QString *errorString) {
    QString text;
    QTextStream out(&text);
    out << "Time (s),Voltage (V)\n";
    const int rows = qMin(waveform.time.size(), waveform.voltage.size());
    for (int i = 0; i < rows; ++i) {
        out << number(waveform.time[i]) << "," << number(waveform.voltage[i]) << "\n";
    }
    out.flush();
    if (!writeText(fileName, text, errorString)) return false;
    qDebug() << "[WaveformExporter] Saved averaged waveform:" << fileName << "(" << rows << "points )";
    return true;
}

bool WaveformExporter::importProcessedCSV(const QString &fileName, ProcessedTable &table, QString *errorString) {
    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorString) *errorString = QString("cannot open %1: %2").arg(fileName, file.errorString());
        return false;
    }
    QTextStream in(&file);
    return parseProcessedCSV(in.readAll(), table, errorString);
}

QString WaveformExporter::timestampString(const QDateTime &timestamp) {
    return timestamp.toString("yyyyMMdd_HHmmss");
}

QString WaveformExporter::processedBaseName(const QDateTime &timestamp) {
    return "processed_" + timestampString(timestamp);
}

QString WaveformExporter::averagedFileName(const QString &label, double frequencyHz, double offsetV, const QDateTime &timestamp) {
    return QString("%1_%2Hz_%3V_avg_%4.csv")
        .arg(label)
        .arg(qint64(frequencyHz))
        .arg(QString::number(offsetV, 'g', 6))
        .arg(timestampString(timestamp));
}

bool WaveformExporter::writeText(const QString &fileName, const QString &text, QString *errorString) {
    const QFileInfo info(fileName);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorString) *errorString = QString("cannot create directory %1").arg(info.absolutePath());
        qWarning() << "[WaveformExporter] Cannot create directory" << info.absolutePath();
        return false;
    }
    QFile file(fileName);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        if (errorString) *errorString = QString("cannot write %1: %2").arg(fileName, file.errorString());
        qWarning() << "[WaveformExporter] Failed to open file for writing:" << fileName << file.errorString();
        return false;
    }
    QTextStream out(&file);
    out << text;
    out.flush();
    file.close();
    if (file.error() != QFileDevice::NoError) {
        if (errorString) *errorString = QString("write to %1 failed: %2").arg(fileName, file.errorString());
        return false;
    }
    emit fileWritten(fileName);
    return true;
}

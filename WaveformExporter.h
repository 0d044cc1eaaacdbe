#pragma once
#include <QObject>
#include <QVector>
#include <QPair>
#include <QString>
#include <QDateTime>
#include "Waveform.h"

// Contents of a processed-result CSV: statistics block followed by a ragged data table
struct ProcessedTable {
    QVector<QPair<QString, double>> statistics;
    QVector<double> time;
    QVector<double> processed;
    QVector<double> frequency;
    QVector<double> magnitude;
};

class WaveformExporter : public QObject {
    Q_OBJECT
public:
    explicit WaveformExporter(QObject *parent = nullptr);
    ~WaveformExporter();

    // Statistics block, blank line, "Data", then Time,Processed_Signal,Frequency,FFT_Magnitude.
    // One row per index up to max(time, frequency) length; missing cells are left empty.
    bool exportProcessedCSV(const QString &fileName, const ProcessedTable &table, QString *errorString = nullptr);

    // Averaged capture as "Time (s),Voltage (V)"
    bool exportWaveformCSV(const QString &fileName, const Waveform &waveform, QString *errorString = nullptr);

    static QString formatProcessedCSV(const ProcessedTable &table);
    static bool parseProcessedCSV(const QString &text, ProcessedTable &table, QString *errorString = nullptr);
    static bool importProcessedCSV(const QString &fileName, ProcessedTable &table, QString *errorString = nullptr);

    static QString timestampString(const QDateTime &timestamp);
    static QString processedBaseName(const QDateTime &timestamp);
    static QString averagedFileName(const QString &label, double frequencyHz, double offsetV, const QDateTime &timestamp);

signals:
    void fileWritten(const QString &fileName);

private:
    bool writeText(const QString &fileName, const QString &text, QString *errorString);
};

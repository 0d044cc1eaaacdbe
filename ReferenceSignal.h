#pragma once
#include <QVector>
#include <QString>
#include "MeasurementError.h"

// Voltage samples from a previously saved capture, used as the normalization baseline.
// Replaced wholesale on every load.
class ReferenceSignal {
public:
    bool loadFromFile(const QString &path, MeasurementError *error);
    void setSamples(const QVector<double> &values, const QString &sourceFile);
    void clear();

    bool isLoaded() const { return !data.isEmpty(); }
    const QVector<double> &samples() const { return data; }
    QString sourceName() const { return source; }
    int columnUsed() const { return column; }
    double average() const;

    // Delimiter is sniffed from the first line. Column choice: 5th column for
    // files with >= 5 columns, 2nd for >= 2, else the 1st.
    static bool parseCsv(const QString &text, QVector<double> &values, int &selectedColumn, MeasurementError *error);
    static QChar detectDelimiter(const QString &line);

private:
    QVector<double> data;
    QString source;
    int column = -1;
};

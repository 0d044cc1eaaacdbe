#include "ReferenceSignal.h"
#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QRegularExpression>
#include <QStringList>
#include <QDebug>

namespace {

QStringList splitRow(const QString &line, QChar delimiter) {
    QStringList cells;
    if (delimiter == QLatin1Char(' ')) {
        static const QRegularExpression whitespace("\\s+");
        cells = line.split(whitespace, Qt::SkipEmptyParts);
    } else {
        cells = line.split(delimiter);
    }
    for (QString &cell : cells) {
        cell = cell.trimmed();
        if (cell.size() >= 2 && cell.startsWith('"') && cell.endsWith('"'))
            cell = cell.mid(1, cell.size() - 2).trimmed();
    }
    return cells;
}

bool allNumeric(const QStringList &cells) {
    for (const QString &cell : cells) {
        bool ok = false;
        cell.toDouble(&ok);
        if (!ok) return false;
    }
    return !cells.isEmpty();
}

}

bool ReferenceSignal::loadFromFile(const QString &path, MeasurementError *error) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setMeasurementError(error, MeasurementErrorKind::InsufficientData,
                            QString("cannot open reference %1: %2").arg(path, file.errorString()));
        return false;
    }
    QTextStream in(&file);
    const QString text = in.readAll();

    QVector<double> values;
    int col = -1;
    if (!parseCsv(text, values, col, error)) {
        qWarning() << "[ReferenceSignal] Failed to load" << path;
        return false;
    }
    setSamples(values, QFileInfo(path).fileName());
    column = col;
    qInfo() << "[ReferenceSignal] Loaded reference (column" << col + 1 << "):" << values.size()
            << "points from" << path << "avg" << average();
    return true;
}

void ReferenceSignal::setSamples(const QVector<double> &values, const QString &sourceFile) {
    data = values;
    source = sourceFile;
    column = -1;
}

void ReferenceSignal::clear() {
    data.clear();
    source.clear();
    column = -1;
}

double ReferenceSignal::average() const {
    if (data.isEmpty()) return 0.0;
    double sum = 0.0;
    for (double v : data) sum += v;
    return sum / data.size();
}

QChar ReferenceSignal::detectDelimiter(const QString &line) {
    const QChar candidates[] = {QLatin1Char(','), QLatin1Char(';'), QLatin1Char('\t')};
    QChar best = QLatin1Char(' ');
    int bestCount = 0;
    for (QChar c : candidates) {
        const int count = line.count(c);
        if (count > bestCount) {
            best = c;
            bestCount = count;
        }
    }
    return best;
}

bool ReferenceSignal::parseCsv(const QString &text, QVector<double> &values, int &selectedColumn, MeasurementError *error) {
    QStringList lines = text.split(QRegularExpression("\r\n|\n|\r"));
    int first = 0;
    while (first < lines.size() && lines[first].trimmed().isEmpty()) ++first;
    if (first >= lines.size()) {
        setMeasurementError(error, MeasurementErrorKind::InsufficientData, "reference file is empty");
        return false;
    }

    const QChar delimiter = detectDelimiter(lines[first]);
    const QStringList headerCells = splitRow(lines[first], delimiter);
    const int columns = headerCells.size();
    int column = 0;
    if (columns >= 5) column = 4;
    else if (columns >= 2) column = 1;

    const bool hasHeader = !allNumeric(headerCells);
    QVector<double> parsed;
    for (int i = hasHeader ? first + 1 : first; i < lines.size(); ++i) {
        if (lines[i].trimmed().isEmpty()) continue;
        const QStringList cells = splitRow(lines[i], delimiter);
        bool ok = false;
        const double v = column < cells.size() ? cells[column].toDouble(&ok) : 0.0;
        if (!ok) {
            setMeasurementError(error, MeasurementErrorKind::InsufficientData,
                                QString("reference line %1: column %2 is missing or not numeric")
                                    .arg(i + 1).arg(column + 1));
            return false;
        }
        parsed.append(v);
    }
    if (parsed.isEmpty()) {
        setMeasurementError(error, MeasurementErrorKind::InsufficientData, "reference file has no data rows");
        return false;
    }
    values = parsed;
    selectedColumn = column;
    return true;
}

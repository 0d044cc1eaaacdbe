#include "SignalConditioner.h"
#include <QDebug>
#include <algorithm>
#include <numeric>
#include <cmath>

QVector<QPair<QString, double>> SummaryStatistics::toKeyValues() const {
    return {
        {QStringLiteral("Max"), max},
        {QStringLiteral("Min"), min},
        {QStringLiteral("Range"), range},
        {QStringLiteral("Avg"), mean},
        {QStringLiteral("Std"), std},
        {QStringLiteral("Q1"), q1},
        {QStringLiteral("Median"), median},
        {QStringLiteral("Q3"), q3}
    };
}

bool SignalConditioner::condition(const QVector<double> &signal, const QVector<double> &time,
                                  ConditionedSignal &result, MeasurementError *error, int window) {
    if (signal.isEmpty()) {
        setMeasurementError(error, MeasurementErrorKind::InsufficientData, "no samples to condition");
        return false;
    }
    ConditionedSignal out;
    if (window > 0 && signal.size() > window) {
        out.values = movingAverage(signal, window);
        out.smoothed = true;
    } else {
        qWarning() << "[SignalConditioner] Data length" << signal.size() << "<=" << window << ", skipping smoothing";
        out.values = signal;
        out.smoothed = false;
    }
    out.time = time.mid(0, out.values.size());
    out.statistics = computeStatistics(out.values);
    result = out;
    return true;
}

QVector<double> SignalConditioner::movingAverage(const QVector<double> &signal, int window) {
    if (window <= 0 || signal.size() < window) return QVector<double>();
    const int n = signal.size() - window + 1;
    QVector<double> out(n);
    for (int i = 0; i < n; ++i) {
        double sum = 0.0;
        for (int j = 0; j < window; ++j) {
            sum += signal[i + j];
        }
        out[i] = sum / window;
    }
    return out;
}

SummaryStatistics SignalConditioner::computeStatistics(const QVector<double> &values) {
    SummaryStatistics stats;
    if (values.isEmpty()) return stats;

    const auto minmax = std::minmax_element(values.begin(), values.end());
    stats.min = *minmax.first;
    stats.max = *minmax.second;
    stats.range = stats.max - stats.min;
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();

    double sq = 0.0;
    for (double v : values) sq += (v - stats.mean) * (v - stats.mean);
    stats.std = std::sqrt(sq / values.size());

    QVector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    stats.q1 = percentile(sorted, 25.0);
    stats.median = percentile(sorted, 50.0);
    stats.q3 = percentile(sorted, 75.0);
    return stats;
}

double SignalConditioner::percentile(const QVector<double> &sorted, double p) {
    if (sorted.isEmpty()) return 0.0;
    const double rank = (p / 100.0) * (sorted.size() - 1);
    const int lower = int(std::floor(rank));
    const int upper = std::min(lower + 1, int(sorted.size()) - 1);
    const double frac = rank - lower;
    return sorted[lower] + (sorted[upper] - sorted[lower]) * frac;
}

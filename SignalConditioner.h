#pragma once
#include <QVector>
#include <QString>
#include <QPair>
#include "MeasurementError.h"

struct SummaryStatistics {
    double max = 0.0;
    double min = 0.0;
    double range = 0.0;
    double mean = 0.0;
    double std = 0.0; // population standard deviation
    double q1 = 0.0;
    double median = 0.0;
    double q3 = 0.0;

    // Ordered (name, value) pairs as written to the statistics block
    QVector<QPair<QString, double>> toKeyValues() const;
};

struct ConditionedSignal {
    QVector<double> values;
    QVector<double> time;
    bool smoothed = false;
    SummaryStatistics statistics;
};

class SignalConditioner {
public:
    static const int SMOOTHING_WINDOW = 256;

    // Smooths with a valid-mode moving average and computes statistics on the result.
    // Inputs no longer than the window are passed through unsmoothed.
    static bool condition(const QVector<double> &signal, const QVector<double> &time,
                          ConditionedSignal &result, MeasurementError *error,
                          int window = SMOOTHING_WINDOW);

    // Output length is input length - window + 1
    static QVector<double> movingAverage(const QVector<double> &signal, int window);
    static SummaryStatistics computeStatistics(const QVector<double> &values);
    // Linear interpolation between closest ranks, p in [0, 100]
    static double percentile(const QVector<double> &sorted, double p);
};

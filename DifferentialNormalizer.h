#pragma once
#include <QVector>
#include "MeasurementError.h"

struct NormalizedSignal {
    QVector<double> values;
    QVector<double> readMinusBase;
    double referenceAverage = 0.0;
    int length = 0;
};

// value[i] = (read[i] - base[i] - REF_AVG) / (0.0045 * REF_AVG)
// All inputs are cut to their common minimum length first.
class DifferentialNormalizer {
public:
    static constexpr double NORMALIZATION_FACTOR = 0.0045;
    // Stand-in denominator when REF_AVG is exactly zero.
    // A tiny but non-zero REF_AVG still divides through unguarded.
    static constexpr double ZERO_DENOMINATOR_EPSILON = 1e-9;

    static bool normalize(const QVector<double> &base, const QVector<double> &read,
                          const QVector<double> &reference, NormalizedSignal &result,
                          MeasurementError *error);
};

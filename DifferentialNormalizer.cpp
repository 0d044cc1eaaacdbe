#include "DifferentialNormalizer.h"
#include <QDebug>
#include <algorithm>

bool DifferentialNormalizer::normalize(const QVector<double> &base, const QVector<double> &read,
                                       const QVector<double> &reference, NormalizedSignal &result,
                                       MeasurementError *error) {
    const int n = std::min({base.size(), read.size(), reference.size()});
    if (n <= 0) {
        setMeasurementError(error, MeasurementErrorKind::InsufficientData,
                            QString("nothing to normalize (base=%1, read=%2, reference=%3 samples)")
                                .arg(base.size()).arg(read.size()).arg(reference.size()));
        return false;
    }
    if (base.size() != n || read.size() != n || reference.size() != n) {
        qDebug() << "[DifferentialNormalizer] Truncating to" << n << "samples (base" << base.size()
                 << "read" << read.size() << "reference" << reference.size() << ")";
    }

    double refSum = 0.0;
    for (int i = 0; i < n; ++i) refSum += reference[i];
    const double refAvg = refSum / n;

    double denom = NORMALIZATION_FACTOR * refAvg;
    if (denom == 0.0) {
        qWarning() << "[DifferentialNormalizer] Reference average is zero, using epsilon denominator";
        denom = ZERO_DENOMINATOR_EPSILON;
    }

    NormalizedSignal out;
    out.length = n;
    out.referenceAverage = refAvg;
    out.readMinusBase.resize(n);
    out.values.resize(n);
    for (int i = 0; i < n; ++i) {
        out.readMinusBase[i] = read[i] - base[i];
        out.values[i] = (out.readMinusBase[i] - refAvg) / denom;
    }
    result = out;
    return true;
}

#pragma once
#include <QVector>
#include <complex>

struct SpectrumResult {
    QVector<double> frequencies;
    QVector<double> magnitudes;

    bool isEmpty() const { return magnitudes.isEmpty(); }
};

class SpectralAnalyzer {
public:
    // Positive-frequency half [0, N/2) of |DFT(signal)|.
    // Sample spacing is time[1] - time[0]; N <= 1 gives an empty result.
    static SpectrumResult analyze(const QVector<double> &signal, const QVector<double> &time);

    // time[1] - time[0], or 1.0 when that is unusable
    static double sampleSpacing(const QVector<double> &time);

    // Full forward transform, O(N log N) for any N (radix-2, Bluestein otherwise)
    static QVector<std::complex<double>> fft(const QVector<double> &signal);
};

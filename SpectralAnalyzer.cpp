#include "SpectralAnalyzer.h"
#include <QDebug>
#include <cmath>
#include <utility>

namespace {
const double PI = 3.14159265358979323846;

using Complex = std::complex<double>;

bool isPowerOfTwo(int n) {
    return n > 0 && (n & (n - 1)) == 0;
}

// In-place iterative Cooley-Tukey; a.size() must be a power of two
void radix2(QVector<Complex> &a, bool inverse) {
    const int n = a.size();
    Complex *p = a.data();
    for (int i = 1, j = 0; i < n; ++i) {
        int bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(p[i], p[j]);
    }
    QVector<Complex> twiddle;
    for (int len = 2; len <= n; len <<= 1) {
        const int half = len / 2;
        const double sign = inverse ? 1.0 : -1.0;
        twiddle.resize(half);
        for (int j = 0; j < half; ++j) {
            const double angle = sign * 2.0 * PI * j / len;
            twiddle[j] = Complex(std::cos(angle), std::sin(angle));
        }
        for (int i = 0; i < n; i += len) {
            for (int j = 0; j < half; ++j) {
                const Complex u = p[i + j];
                const Complex v = p[i + j + half] * twiddle[j];
                p[i + j] = u + v;
                p[i + j + half] = u - v;
            }
        }
    }
    if (inverse) {
        for (int i = 0; i < n; ++i) p[i] /= double(n);
    }
}

// Bluestein: any length as a circular convolution of power-of-two size
QVector<Complex> bluestein(const QVector<Complex> &x) {
    const int n = x.size();
    int m = 1;
    while (m < 2 * n - 1) m <<= 1;

    // exp(-i*pi*k^2/n); k^2 is reduced mod 2n to keep the angle small
    QVector<Complex> chirp(n);
    for (int k = 0; k < n; ++k) {
        const qint64 k2 = (qint64(k) * k) % (2 * qint64(n));
        const double angle = PI * double(k2) / n;
        chirp[k] = Complex(std::cos(angle), -std::sin(angle));
    }

    QVector<Complex> a(m, Complex(0.0, 0.0));
    QVector<Complex> b(m, Complex(0.0, 0.0));
    for (int k = 0; k < n; ++k) a[k] = x[k] * chirp[k];
    b[0] = std::conj(chirp[0]);
    for (int k = 1; k < n; ++k) {
        b[k] = std::conj(chirp[k]);
        b[m - k] = b[k];
    }

    radix2(a, false);
    radix2(b, false);
    for (int i = 0; i < m; ++i) a[i] *= b[i];
    radix2(a, true);

    QVector<Complex> out(n);
    for (int k = 0; k < n; ++k) out[k] = a[k] * chirp[k];
    return out;
}
}

SpectrumResult SpectralAnalyzer::analyze(const QVector<double> &signal, const QVector<double> &time) {
    SpectrumResult result;
    const int n = signal.size();
    if (n <= 1) return result;

    const double d = sampleSpacing(time);
    const QVector<Complex> bins = fft(signal);
    const int half = n / 2;
    result.frequencies.resize(half);
    result.magnitudes.resize(half);
    for (int k = 0; k < half; ++k) {
        result.frequencies[k] = k / (n * d);
        result.magnitudes[k] = std::abs(bins[k]);
    }
    return result;
}

double SpectralAnalyzer::sampleSpacing(const QVector<double> &time) {
    if (time.size() < 2) {
        qWarning() << "[SpectralAnalyzer] Time axis has" << time.size() << "points, assuming unit spacing";
        return 1.0;
    }
    const double d = time[1] - time[0];
    if (!std::isfinite(d) || d <= 0.0) {
        qWarning() << "[SpectralAnalyzer] Unusable sample spacing" << d << ", assuming unit spacing";
        return 1.0;
    }
    return d;
}

QVector<std::complex<double>> SpectralAnalyzer::fft(const QVector<double> &signal) {
    const int n = signal.size();
    QVector<Complex> data(n);
    for (int i = 0; i < n; ++i) data[i] = Complex(signal[i], 0.0);
    if (n <= 1) return data;

    if (isPowerOfTwo(n)) {
        radix2(data, false);
        return data;
    }
    return bluestein(data);
}

#pragma once
#include <QVector>
#include <QMetaType>

// Scale factors reported by the scope for one acquisition (WFMPRE block)
struct CalibrationParameters {
    double xIncrement = 1.0;
    double xOrigin = 0.0;
    double yMultiplier = 1.0;
    double yOffset = 0.0;
    double yZero = 0.0;
};

// Calibrated acquisition: time[i] and voltage[i] always have the same size
struct Waveform {
    QVector<double> time;
    QVector<double> voltage;

    int size() const { return voltage.size(); }
    bool isEmpty() const { return voltage.isEmpty(); }

    // voltage = (raw - yOffset) * yMultiplier + yZero, time = i * xIncrement + xOrigin
    static Waveform fromRawCodes(const QVector<int> &codes, const CalibrationParameters &cal);
};

Q_DECLARE_METATYPE(Waveform)

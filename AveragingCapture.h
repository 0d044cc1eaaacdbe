#pragma once
#include <QVector>
#include <QString>
#include <functional>
#include "Waveform.h"
#include "MeasurementError.h"

// Repeats single acquisitions and averages them pointwise.
// Captures are cropped to the shortest one (tail truncation, no resampling);
// the returned time axis is that of the first capture.
class AveragingCapture {
public:
    static const int DEFAULT_COUNT = 10;
    static const int DEFAULT_DELAY_MS = 30;

    using CaptureFunction = std::function<bool(Waveform &, MeasurementError *)>;
    using SleepFunction = std::function<void(int)>;

    explicit AveragingCapture(CaptureFunction capture, SleepFunction sleep = SleepFunction());

    void setLabel(const QString &name) { label = name; }

    bool run(int count, int delayMs, Waveform &averaged, MeasurementError *error) const;

    // Pure averaging step, exposed for reuse and tests
    static bool averageWaveforms(const QVector<Waveform> &captures, Waveform &averaged, MeasurementError *error);

private:
    CaptureFunction captureOnce;
    SleepFunction sleep;
    QString label = QStringLiteral("capture");
};

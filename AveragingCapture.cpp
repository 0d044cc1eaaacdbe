#include "AveragingCapture.h"
#include <QThread>
#include <QDebug>
#include <algorithm>

AveragingCapture::AveragingCapture(CaptureFunction capture, SleepFunction sleepFn)
    : captureOnce(std::move(capture)), sleep(std::move(sleepFn))
{
    if (!sleep) {
        sleep = [](int ms) { QThread::msleep(ms); };
    }
}

bool AveragingCapture::run(int count, int delayMs, Waveform &averaged, MeasurementError *error) const {
    if (count < 1) {
        setMeasurementError(error, MeasurementErrorKind::CaptureFailed,
                            QString("%1: averaging count must be at least 1").arg(label));
        return false;
    }
    QVector<Waveform> captures;
    captures.reserve(count);
    for (int i = 0; i < count; ++i) {
        Waveform wf;
        MeasurementError captureError;
        if (!captureOnce(wf, &captureError)) {
            const MeasurementErrorKind kind = captureError.isError() ? captureError.kind
                                                                     : MeasurementErrorKind::CaptureFailed;
            setMeasurementError(error, kind,
                                QString("%1: acquisition %2/%3 failed: %4")
                                    .arg(label).arg(i + 1).arg(count).arg(captureError.message));
            qWarning() << "[AveragingCapture]" << label << "acquisition" << i + 1 << "failed:" << captureError.message;
            return false;
        }
        if (wf.isEmpty()) {
            setMeasurementError(error, MeasurementErrorKind::CaptureFailed,
                                QString("%1: acquisition %2/%3 returned no data").arg(label).arg(i + 1).arg(count));
            qWarning() << "[AveragingCapture]" << label << "acquisition" << i + 1 << "returned no data";
            return false;
        }
        captures.append(wf);
        if (delayMs > 0) sleep(delayMs);
    }
    return averageWaveforms(captures, averaged, error);
}

bool AveragingCapture::averageWaveforms(const QVector<Waveform> &captures, Waveform &averaged, MeasurementError *error) {
    if (captures.isEmpty()) {
        setMeasurementError(error, MeasurementErrorKind::CaptureFailed, "no acquisitions to average");
        return false;
    }
    int minLength = captures.first().size();
    int maxLength = minLength;
    for (const Waveform &wf : captures) {
        minLength = std::min(minLength, wf.size());
        maxLength = std::max(maxLength, wf.size());
    }
    if (minLength == 0) {
        setMeasurementError(error, MeasurementErrorKind::CaptureFailed, "an acquisition returned no data");
        return false;
    }
    if (minLength != maxLength) {
        qWarning() << "[AveragingCapture] Captured lengths varied (" << minLength << "to" << maxLength
                   << "); cropping to" << minLength << "samples";
    }

    QVector<double> sum(minLength, 0.0);
    for (const Waveform &wf : captures) {
        for (int i = 0; i < minLength; ++i) {
            sum[i] += wf.voltage[i];
        }
    }
    const double n = captures.size();
    Waveform result;
    result.voltage.resize(minLength);
    for (int i = 0; i < minLength; ++i) {
        result.voltage[i] = sum[i] / n;
    }
    result.time = captures.first().time.mid(0, minLength);
    averaged = result;
    return true;
}

#include "Waveform.h"

Waveform Waveform::fromRawCodes(const QVector<int> &codes, const CalibrationParameters &cal) {
    Waveform wf;
    const int n = codes.size();
    wf.time.resize(n);
    wf.voltage.resize(n);
    for (int i = 0; i < n; ++i) {
        wf.voltage[i] = (codes[i] - cal.yOffset) * cal.yMultiplier + cal.yZero;
        wf.time[i] = i * cal.xIncrement + cal.xOrigin;
    }
    return wf;
}

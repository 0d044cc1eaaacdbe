#pragma once
#include <QString>
#include <QMetaType>

class QSettings;

// Generator output shape. PULSE is driven as a square wave with the configured duty cycle.
enum class WaveShape {
    Sine,
    Square,
    Pulse
};

WaveShape waveShapeFromString(const QString &name, bool *ok = nullptr);
QString waveShapeToString(WaveShape shape);

struct InstrumentSettings {
    QString backend = QStringLiteral("hardware"); // "hardware" or "simulated"
    QString scopeAddress = QStringLiteral("TCPIP0::192.168.1.50::4000::SOCKET");
    int scopeTimeoutMs = 10000;
#ifdef Q_OS_WIN
    QString generatorPort = QStringLiteral("COM3");
#else
    QString generatorPort = QStringLiteral("/dev/ttyUSB0");
#endif
    QString sourceMeterPort; // empty: no SMU, run in degraded mode
    int sourceMeterTimeoutMs = 5000;
};

struct AcquisitionSettings {
    QString scopeSource = QStringLiteral("MATH");
    int averages = 10;
    int interCaptureDelayMs = 30;
    int settlingDelayMs = 500;
};

struct GeneratorSettings {
    WaveShape shape = WaveShape::Sine;
    double frequencyHz = 1000.0;
    double amplitudeVpp = 1.0;
    double offsetV = 0.0;
    double dutyPercent = 50.0;

    // duty percent clamped to [0, 100] and scaled to [0, 1]
    double dutyFraction() const;
};

struct MeasurementConfig {
    InstrumentSettings instruments;
    AcquisitionSettings acquisition;
    GeneratorSettings generator;
    QString outputDirectory = QStringLiteral("measurements");

    void load(QSettings &settings);
    void save(QSettings &settings) const;
};

Q_DECLARE_METATYPE(InstrumentSettings)
Q_DECLARE_METATYPE(MeasurementConfig)

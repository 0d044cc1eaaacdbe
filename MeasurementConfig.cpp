#include "MeasurementConfig.h"
#include <QSettings>
#include <QDebug>
#include <algorithm>

WaveShape waveShapeFromString(const QString &name, bool *ok) {
    const QString upper = name.trimmed().toUpper();
    if (ok) *ok = true;
    if (upper == "SIN" || upper == "SINE") return WaveShape::Sine;
    if (upper == "SQUARE") return WaveShape::Square;
    if (upper == "PULSE") return WaveShape::Pulse;
    if (ok) *ok = false;
    return WaveShape::Sine;
}

QString waveShapeToString(WaveShape shape) {
    switch (shape) {
    case WaveShape::Sine: return QStringLiteral("SIN");
    case WaveShape::Square: return QStringLiteral("SQUARE");
    case WaveShape::Pulse: return QStringLiteral("PULSE");
    }
    return QStringLiteral("SIN");
}

double GeneratorSettings::dutyFraction() const {
    return std::max(0.0, std::min(1.0, dutyPercent / 100.0));
}

void MeasurementConfig::load(QSettings &settings) {
    const MeasurementConfig defaults;

    settings.beginGroup("instruments");
    instruments.backend = settings.value("backend", defaults.instruments.backend).toString();
    instruments.scopeAddress = settings.value("scopeAddress", defaults.instruments.scopeAddress).toString();
    instruments.scopeTimeoutMs = settings.value("scopeTimeoutMs", defaults.instruments.scopeTimeoutMs).toInt();
    instruments.generatorPort = settings.value("generatorPort", defaults.instruments.generatorPort).toString();
    instruments.sourceMeterPort = settings.value("sourceMeterPort", defaults.instruments.sourceMeterPort).toString();
    instruments.sourceMeterTimeoutMs = settings.value("sourceMeterTimeoutMs", defaults.instruments.sourceMeterTimeoutMs).toInt();
    settings.endGroup();

    settings.beginGroup("acquisition");
    acquisition.scopeSource = settings.value("scopeSource", defaults.acquisition.scopeSource).toString();
    acquisition.averages = std::max(1, settings.value("averages", defaults.acquisition.averages).toInt());
    acquisition.interCaptureDelayMs = std::max(0, settings.value("interCaptureDelayMs", defaults.acquisition.interCaptureDelayMs).toInt());
    acquisition.settlingDelayMs = std::max(0, settings.value("settlingDelayMs", defaults.acquisition.settlingDelayMs).toInt());
    settings.endGroup();

    settings.beginGroup("generator");
    bool shapeOk = false;
    const QString shapeName = settings.value("shape", waveShapeToString(defaults.generator.shape)).toString();
    generator.shape = waveShapeFromString(shapeName, &shapeOk);
    if (!shapeOk) {
        qWarning() << "[MeasurementConfig] Unknown waveform shape" << shapeName << "- using SIN";
    }
    generator.frequencyHz = settings.value("frequencyHz", defaults.generator.frequencyHz).toDouble();
    generator.amplitudeVpp = settings.value("amplitudeVpp", defaults.generator.amplitudeVpp).toDouble();
    generator.offsetV = settings.value("offsetV", defaults.generator.offsetV).toDouble();
    generator.dutyPercent = settings.value("dutyPercent", defaults.generator.dutyPercent).toDouble();
    settings.endGroup();

    settings.beginGroup("output");
    outputDirectory = settings.value("directory", defaults.outputDirectory).toString();
    settings.endGroup();
}

void MeasurementConfig::save(QSettings &settings) const {
    settings.beginGroup("instruments");
    settings.setValue("backend", instruments.backend);
    settings.setValue("scopeAddress", instruments.scopeAddress);
    settings.setValue("scopeTimeoutMs", instruments.scopeTimeoutMs);
    settings.setValue("generatorPort", instruments.generatorPort);
    settings.setValue("sourceMeterPort", instruments.sourceMeterPort);
    settings.setValue("sourceMeterTimeoutMs", instruments.sourceMeterTimeoutMs);
    settings.endGroup();

    settings.beginGroup("acquisition");
    settings.setValue("scopeSource", acquisition.scopeSource);
    settings.setValue("averages", acquisition.averages);
    settings.setValue("interCaptureDelayMs", acquisition.interCaptureDelayMs);
    settings.setValue("settlingDelayMs", acquisition.settlingDelayMs);
    settings.endGroup();

    settings.beginGroup("generator");
    settings.setValue("shape", waveShapeToString(generator.shape));
    settings.setValue("frequencyHz", generator.frequencyHz);
    settings.setValue("amplitudeVpp", generator.amplitudeVpp);
    settings.setValue("offsetV", generator.offsetV);
    settings.setValue("dutyPercent", generator.dutyPercent);
    settings.endGroup();

    settings.beginGroup("output");
    settings.setValue("directory", outputDirectory);
    settings.endGroup();
}

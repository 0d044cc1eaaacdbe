#pragma once
#include <QObject>
#include <QDateTime>
#include <QString>
#include <atomic>
#include <functional>
#include "Waveform.h"
#include "MeasurementConfig.h"
#include "MeasurementError.h"
#include "DifferentialNormalizer.h"
#include "SignalConditioner.h"
#include "SpectralAnalyzer.h"
#include "AveragingCapture.h"

class InstrumentSession;

// Everything one completed cycle produced
struct CycleResult {
    QDateTime timestamp;
    Waveform base;
    Waveform read;
    NormalizedSignal normalized;
    ConditionedSignal conditioned;
    SpectrumResult spectrum;
    QString csvPath;
    QString baseCsvPath;
    QString readCsvPath;
    QString imagePath; // beside csvPath; the GUI renders the plot there
};

Q_DECLARE_METATYPE(CycleResult)

// Runs one differential measurement cycle against the session's instruments:
// program the generator, capture BASE with the output off, capture READ with
// the output on, switch the output off again, then normalize, condition,
// analyze and persist. Blocks the calling thread for the whole cycle.
class MeasurementController : public QObject {
    Q_OBJECT
public:
    enum class State {
        Idle,
        ConfiguringGenerator,
        CapturingBase,
        CapturingRead,
        Normalizing,
        Done,
        Error
    };
    Q_ENUM(State)

    using SleepFunction = AveragingCapture::SleepFunction;
    using ArtifactWriter = std::function<bool(CycleResult &, const MeasurementConfig &, MeasurementError *)>;

    explicit MeasurementController(InstrumentSession &session, QObject *parent = nullptr);

    State state() const { return cycleState.load(); }
    // True while a cycle is in flight; Idle, Done and Error accept a new run
    static bool isActive(State state);
    static QString stateName(State state);

    void setSleepFunction(SleepFunction fn);
    // Replaces the CSV writer; the default writes into config.outputDirectory
    void setArtifactWriter(ArtifactWriter writer);

    bool runCycle(const MeasurementConfig &config, CycleResult &result, MeasurementError *error);

    bool writeArtifacts(CycleResult &result, const MeasurementConfig &config, MeasurementError *error);

signals:
    void stateChanged(MeasurementController::State state);
    void logMessage(const QString &message);
    void statusMessage(const QString &message);

private:
    bool checkReady(MeasurementError *error) const;
    bool configureGenerator(const GeneratorSettings &generator, MeasurementError *error);
    bool captureOnce(const QString &source, Waveform &waveform, MeasurementError *error);
    bool captureAveraged(const QString &label, const AcquisitionSettings &acquisition,
                         Waveform &averaged, MeasurementError *error);
    bool switchOutput(bool enabled, MeasurementError *error);
    bool acquire(const MeasurementConfig &config, CycleResult &result, MeasurementError *error);
    bool process(CycleResult &result, MeasurementError *error);

    void enterState(State next);
    bool fail(const MeasurementError &cause, MeasurementError *error);
    void log(const QString &message);

    InstrumentSession &session;
    std::atomic<State> cycleState{State::Idle};
    SleepFunction sleep;
    ArtifactWriter artifactWriter;
};

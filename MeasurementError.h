#pragma once
#include <QString>
#include <QMetaType>

// Failure categories reported by the acquisition pipeline and the cycle controller
enum class MeasurementErrorKind {
    None,
    NotReady,            // preconditions unmet, user must act
    TransportError,      // instrument I/O failed
    ConfigurationFailed, // generator rejected its programming
    CaptureFailed,       // an averaging pass produced no data
    InsufficientData,    // processing input too short or unreadable
    PersistenceFailed    // result files could not be written
};

struct MeasurementError {
    MeasurementErrorKind kind = MeasurementErrorKind::None;
    QString message;

    MeasurementError() = default;
    MeasurementError(MeasurementErrorKind k, const QString &msg) : kind(k), message(msg) {}

    bool isError() const { return kind != MeasurementErrorKind::None; }
    QString kindName() const { return kindToString(kind); }
    QString toString() const { return kindName() + ": " + message; }

    static QString kindToString(MeasurementErrorKind kind) {
        switch (kind) {
        case MeasurementErrorKind::None: return QStringLiteral("None");
        case MeasurementErrorKind::NotReady: return QStringLiteral("NotReady");
        case MeasurementErrorKind::TransportError: return QStringLiteral("TransportError");
        case MeasurementErrorKind::ConfigurationFailed: return QStringLiteral("ConfigurationFailed");
        case MeasurementErrorKind::CaptureFailed: return QStringLiteral("CaptureFailed");
        case MeasurementErrorKind::InsufficientData: return QStringLiteral("InsufficientData");
        case MeasurementErrorKind::PersistenceFailed: return QStringLiteral("PersistenceFailed");
        }
        return QStringLiteral("Unknown");
    }
};

// Fills *error when the caller asked for it
inline void setMeasurementError(MeasurementError *error, MeasurementErrorKind kind, const QString &message) {
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}

Q_DECLARE_METATYPE(MeasurementError)

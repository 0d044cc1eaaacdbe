#pragma once
#include <QObject>
#include <QVector>
#include <QString>
#include <QPointer>

class QCustomPlot;
class QCPAxisRect;
class QWidget;

// Two stacked panels: processed signal over time, and its magnitude spectrum
class PlotManager : public QObject {
    Q_OBJECT
public:
    explicit PlotManager(QObject *parent = nullptr);
    ~PlotManager();

    // Ownership passes to whichever layout the widget is added to
    QWidget* plotWidget() const;

    void setSignal(const QVector<double>& time, const QVector<double>& values);
    void setSpectrum(const QVector<double>& frequencies, const QVector<double>& magnitudes);
    void setTitle(const QString& title);

    bool savePng(const QString& fileName, int width = 1000, int height = 800);

private:
    void styleAxisRect(QCPAxisRect *rect);

    QPointer<QCustomPlot> plot;
    QCPAxisRect *signalRect = nullptr;
    QCPAxisRect *spectrumRect = nullptr;
};

#pragma once
#include <QDialog>
#include <QString>
#include "MeasurementController.h"

class PlotManager;
class QLabel;

// Statistics line over the two-panel plot of one cycle's result
class ResultsDialog : public QDialog {
    Q_OBJECT
public:
    explicit ResultsDialog(const CycleResult &result, QWidget *parent = nullptr);

    bool saveImage(const QString &fileName);

    // "Max: x | Min: y | ..." in statistics block order
    static QString statisticsLine(const SummaryStatistics &stats);

private:
    PlotManager *plotManager;
    QLabel *statsLabel;
};

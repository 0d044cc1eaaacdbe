#include "ResultsDialog.h"
#include "PlotManager.h"
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFileInfo>
#include <QStringList>

ResultsDialog::ResultsDialog(const CycleResult &result, QWidget *parent)
    : QDialog(parent), plotManager(new PlotManager(this))
{
    const QString baseName = QFileInfo(result.csvPath).completeBaseName();
    setWindowTitle(baseName.isEmpty() ? QString("Processed Result") : QString("Result: %1").arg(baseName));
    resize(1000, 800);

    QVBoxLayout *mainLayout = new QVBoxLayout(this);

    statsLabel = new QLabel(statisticsLine(result.conditioned.statistics));
    statsLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    statsLabel->setStyleSheet("font-family: Consolas, monospace; font-size: 10pt;");
    mainLayout->addWidget(statsLabel);

    plotManager->setSignal(result.conditioned.time, result.conditioned.values);
    plotManager->setSpectrum(result.spectrum.frequencies, result.spectrum.magnitudes);
    if (!result.conditioned.smoothed) {
        plotManager->setTitle("Processed Signal (unsmoothed, capture shorter than window)");
    }
    mainLayout->addWidget(plotManager->plotWidget(), 1);

    QHBoxLayout *buttonLayout = new QHBoxLayout();
    QPushButton *closeButton = new QPushButton("Close");
    buttonLayout->addStretch();
    buttonLayout->addWidget(closeButton);
    mainLayout->addLayout(buttonLayout);

    connect(closeButton, &QPushButton::clicked, this, &QDialog::accept);
}

bool ResultsDialog::saveImage(const QString &fileName) {
    return plotManager->savePng(fileName);
}

QString ResultsDialog::statisticsLine(const SummaryStatistics &stats) {
    QStringList parts;
    for (const auto &kv : stats.toKeyValues()) {
        parts << QString("%1: %2").arg(kv.first).arg(kv.second, 0, 'f', 4);
    }
    return parts.join(" | ");
}

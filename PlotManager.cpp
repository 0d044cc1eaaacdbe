#include "PlotManager.h"
#include <QWidget>
#include <QFileInfo>
#include <QDir>
#include "qcustomplot.h"
#include <QLinearGradient>
#include <QDebug>
#include <QFont>
#include <QBrush>
#include <algorithm>

PlotManager::PlotManager(QObject *parent)
    : QObject(parent), plot(new QCustomPlot)
{
    plot->plotLayout()->clear();

    signalRect = new QCPAxisRect(plot);
    spectrumRect = new QCPAxisRect(plot);
    plot->plotLayout()->addElement(0, 0, signalRect);
    plot->plotLayout()->addElement(1, 0, spectrumRect);
    styleAxisRect(signalRect);
    styleAxisRect(spectrumRect);

    signalRect->axis(QCPAxis::atBottom)->setLabel("Time (s)");
    signalRect->axis(QCPAxis::atLeft)->setLabel("Processed Signal");
    spectrumRect->axis(QCPAxis::atBottom)->setLabel("Frequency (Hz)");
    spectrumRect->axis(QCPAxis::atLeft)->setLabel("Magnitude");

    QCPGraph *signalGraph = plot->addGraph(signalRect->axis(QCPAxis::atBottom), signalRect->axis(QCPAxis::atLeft));
    signalGraph->setPen(QPen(Qt::blue, 2));
    signalGraph->setName("Smoothed");

    QCPGraph *spectrumGraph = plot->addGraph(spectrumRect->axis(QCPAxis::atBottom), spectrumRect->axis(QCPAxis::atLeft));
    spectrumGraph->setPen(QPen(Qt::red, 2));
    spectrumGraph->setName("FFT");

    plot->setInteractions(QCP::iRangeDrag | QCP::iRangeZoom);
    plot->setMinimumSize(600, 480);
}

PlotManager::~PlotManager() {
    // Once placed in a layout the parent widget owns the plot
    if (plot && !plot->parent()) delete plot.data();
}

QWidget* PlotManager::plotWidget() const {
    return plot;
}

void PlotManager::styleAxisRect(QCPAxisRect *rect) {
    QLinearGradient gradient(0, 0, 0, 1);
    gradient.setColorAt(0, Qt::white);
    gradient.setColorAt(1, QColor(211, 211, 211));
    gradient.setCoordinateMode(QGradient::ObjectBoundingMode);
    rect->setBackground(QBrush(gradient));
    rect->axis(QCPAxis::atLeft)->grid()->setVisible(true);
    rect->axis(QCPAxis::atBottom)->grid()->setVisible(true);
    rect->setupFullAxesBox(true);
}

void PlotManager::setSignal(const QVector<double>& time, const QVector<double>& values) {
    const int n = std::min(int(time.size()), int(values.size()));
    plot->graph(0)->setData(time.mid(0, n), values.mid(0, n));
    plot->graph(0)->rescaleAxes();
    plot->replot();
}

void PlotManager::setSpectrum(const QVector<double>& frequencies, const QVector<double>& magnitudes) {
    const int n = std::min(int(frequencies.size()), int(magnitudes.size()));
    plot->graph(1)->setData(frequencies.mid(0, n), magnitudes.mid(0, n));
    plot->graph(1)->rescaleAxes();
    plot->replot();
}

void PlotManager::setTitle(const QString& title) {
    if (plot->plotLayout()->rowCount() > 2) {
        plot->plotLayout()->removeAt(0);
        plot->plotLayout()->simplify();
    }
    plot->plotLayout()->insertRow(0);
    QCPTextElement *text = new QCPTextElement(plot, title, QFont("Arial", 10, QFont::Bold));
    plot->plotLayout()->addElement(0, 0, text);
    plot->replot();
}

bool PlotManager::savePng(const QString& fileName, int width, int height) {
    const QFileInfo info(fileName);
    if (!QDir().mkpath(info.absolutePath())) {
        qWarning() << "[PlotManager] Cannot create directory" << info.absolutePath();
        return false;
    }
    if (!plot->savePng(fileName, width, height)) {
        qWarning() << "[PlotManager] Failed to save plot image:" << fileName;
        return false;
    }
    qDebug() << "[PlotManager] Saved plot image:" << fileName;
    return true;
}

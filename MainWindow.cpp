#include "MainWindow.h"
#include "MeasurementWorker.h"
#include "ResultsDialog.h"
#include "WaveformExporter.h"
#include <QApplication>
#include <QCloseEvent>
#include <QSettings>
#include <QStatusBar>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QDebug>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent),
      worker(new MeasurementWorker())
{
    QSettings settings;
    config.load(settings);

    setupUi();
    applyConfigToUi(config);

    worker->moveToThread(&workerThread);
    connect(&workerThread, &QThread::finished, worker, &QObject::deleteLater);
    setupConnections();
    workerThread.setObjectName("MeasurementThread");
    workerThread.start();

    updateSerialPortList();
    updateUiState();
    qDebug() << "[MainWindow] Ready, output directory" << config.outputDirectory;
}

MainWindow::~MainWindow()
{
    workerThread.quit();
    workerThread.wait();
}

void MainWindow::setupUi()
{
    setWindowTitle("DiffScope");
    QWidget *centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);
    QVBoxLayout *mainLayout = new QVBoxLayout(centralWidget);

    // --- Instruments ---
    QGroupBox *instrumentGroup = new QGroupBox("Instruments");
    QGridLayout *instrumentLayout = new QGridLayout(instrumentGroup);
    backendCombo = new QComboBox();
    backendCombo->addItems({"hardware", "simulated"});
    scopeAddressEdit = new QLineEdit();
    scopeAddressEdit->setToolTip("TCPIP0::<host>::<port>::SOCKET or <host>:<port>");
    generatorPortCombo = new QComboBox();
    generatorPortCombo->setEditable(true);
    sourceMeterPortCombo = new QComboBox();
    sourceMeterPortCombo->setEditable(true);
    sourceMeterPortCombo->setToolTip("Leave empty to run without output control");
    refreshPortsBtn = new QPushButton("Refresh Ports");
    connectBtn = new QPushButton("Connect");
    disconnectBtn = new QPushButton("Disconnect");

    instrumentLayout->addWidget(new QLabel("Backend:"), 0, 0);
    instrumentLayout->addWidget(backendCombo, 0, 1);
    instrumentLayout->addWidget(new QLabel("Scope address:"), 1, 0);
    instrumentLayout->addWidget(scopeAddressEdit, 1, 1, 1, 2);
    instrumentLayout->addWidget(new QLabel("Generator port:"), 2, 0);
    instrumentLayout->addWidget(generatorPortCombo, 2, 1);
    instrumentLayout->addWidget(refreshPortsBtn, 2, 2);
    instrumentLayout->addWidget(new QLabel("Source meter port:"), 3, 0);
    instrumentLayout->addWidget(sourceMeterPortCombo, 3, 1);
    QHBoxLayout *connectLayout = new QHBoxLayout();
    connectLayout->addWidget(connectBtn);
    connectLayout->addWidget(disconnectBtn);
    instrumentLayout->addLayout(connectLayout, 4, 0, 1, 3);
    mainLayout->addWidget(instrumentGroup);

    // --- Generator ---
    QGroupBox *generatorGroup = new QGroupBox("Generator");
    QGridLayout *generatorLayout = new QGridLayout(generatorGroup);
    shapeCombo = new QComboBox();
    shapeCombo->addItems({"SIN", "SQUARE", "PULSE"});
    frequencySpin = new QDoubleSpinBox();
    frequencySpin->setRange(0.01, 60.0e6);
    frequencySpin->setDecimals(2);
    frequencySpin->setSuffix(" Hz");
    amplitudeSpin = new QDoubleSpinBox();
    amplitudeSpin->setRange(0.0, 20.0);
    amplitudeSpin->setDecimals(3);
    amplitudeSpin->setSuffix(" Vpp");
    offsetSpin = new QDoubleSpinBox();
    offsetSpin->setRange(-9.99, 9.99);
    offsetSpin->setDecimals(2);
    offsetSpin->setSuffix(" V");
    dutySpin = new QDoubleSpinBox();
    dutySpin->setRange(0.0, 100.0);
    dutySpin->setDecimals(1);
    dutySpin->setSuffix(" %");

    generatorLayout->addWidget(new QLabel("Shape:"), 0, 0);
    generatorLayout->addWidget(shapeCombo, 0, 1);
    generatorLayout->addWidget(new QLabel("Frequency:"), 0, 2);
    generatorLayout->addWidget(frequencySpin, 0, 3);
    generatorLayout->addWidget(new QLabel("Amplitude:"), 1, 0);
    generatorLayout->addWidget(amplitudeSpin, 1, 1);
    generatorLayout->addWidget(new QLabel("Offset:"), 1, 2);
    generatorLayout->addWidget(offsetSpin, 1, 3);
    generatorLayout->addWidget(new QLabel("Duty:"), 2, 0);
    generatorLayout->addWidget(dutySpin, 2, 1);
    mainLayout->addWidget(generatorGroup);

    // --- Acquisition ---
    QGroupBox *acquisitionGroup = new QGroupBox("Acquisition");
    QGridLayout *acquisitionLayout = new QGridLayout(acquisitionGroup);
    sourceCombo = new QComboBox();
    sourceCombo->addItems({"CH1", "CH2", "CH3", "CH4", "MATH"});
    averagesSpin = new QSpinBox();
    averagesSpin->setRange(1, 1000);
    outputDirEdit = new QLineEdit();
    browseOutputBtn = new QPushButton("Browse...");
    loadReferenceBtn = new QPushButton("Load Reference");
    runCycleBtn = new QPushButton("Run Full Cycle");
    runCycleBtn->setStyleSheet("font-weight: bold;");
    referenceLabel = new QLabel("Reference: none");

    acquisitionLayout->addWidget(new QLabel("Scope source:"), 0, 0);
    acquisitionLayout->addWidget(sourceCombo, 0, 1);
    acquisitionLayout->addWidget(new QLabel("Averages:"), 0, 2);
    acquisitionLayout->addWidget(averagesSpin, 0, 3);
    acquisitionLayout->addWidget(new QLabel("Output folder:"), 1, 0);
    acquisitionLayout->addWidget(outputDirEdit, 1, 1, 1, 2);
    acquisitionLayout->addWidget(browseOutputBtn, 1, 3);
    acquisitionLayout->addWidget(loadReferenceBtn, 2, 0);
    acquisitionLayout->addWidget(referenceLabel, 2, 1, 1, 3);
    acquisitionLayout->addWidget(runCycleBtn, 3, 0, 1, 4);
    mainLayout->addWidget(acquisitionGroup);

    // --- State and log ---
    QHBoxLayout *stateLayout = new QHBoxLayout();
    stateLabel = new QLabel("State: Idle");
    statusLabel = new QLabel("Disconnected");
    stateLayout->addWidget(stateLabel);
    stateLayout->addStretch();
    stateLayout->addWidget(statusLabel);
    mainLayout->addLayout(stateLayout);

    logView = new QTextEdit();
    logView->setReadOnly(true);
    logView->setStyleSheet("font-family: Consolas, monospace; font-size: 9pt;");
    mainLayout->addWidget(logView, 1);

    resize(720, 820);
}

void MainWindow::setupConnections()
{
    connect(connectBtn, &QPushButton::clicked, this, &MainWindow::onConnectClicked);
    connect(disconnectBtn, &QPushButton::clicked, this, &MainWindow::onDisconnectClicked);
    connect(loadReferenceBtn, &QPushButton::clicked, this, &MainWindow::onLoadReferenceClicked);
    connect(runCycleBtn, &QPushButton::clicked, this, &MainWindow::onRunCycleClicked);
    connect(browseOutputBtn, &QPushButton::clicked, this, &MainWindow::onBrowseOutputClicked);
    connect(refreshPortsBtn, &QPushButton::clicked, this, &MainWindow::updateSerialPortList);

    // GUI -> worker, queued across the thread boundary
    connect(this, &MainWindow::connectRequested, worker, &MeasurementWorker::connectInstruments);
    connect(this, &MainWindow::disconnectRequested, worker, &MeasurementWorker::disconnectInstruments);
    connect(this, &MainWindow::referenceRequested, worker, &MeasurementWorker::loadReference);

    // worker -> GUI
    connect(worker, &MeasurementWorker::connectionChanged, this, &MainWindow::handleConnectionChanged);
    connect(worker, &MeasurementWorker::connectionFailed, this, &MainWindow::handleConnectionFailed);
    connect(worker, &MeasurementWorker::referenceLoaded, this, &MainWindow::handleReferenceLoaded);
    connect(worker, &MeasurementWorker::referenceFailed, this, &MainWindow::handleReferenceFailed);
    connect(worker, &MeasurementWorker::referenceCleared, this, &MainWindow::handleReferenceCleared);
    connect(worker, &MeasurementWorker::cycleFinished, this, &MainWindow::handleCycleFinished);
    connect(worker, &MeasurementWorker::cycleFailed, this, &MainWindow::handleCycleFailed);
    connect(worker, &MeasurementWorker::stateChanged, this, &MainWindow::handleStateChanged);
    connect(worker, &MeasurementWorker::logMessage, this, &MainWindow::appendLog);
    connect(worker, &MeasurementWorker::statusMessage, this, &MainWindow::showStatus);
}

void MainWindow::updateUiState()
{
    const bool connected = isConnected;
    const bool running = isRunning;

    backendCombo->setEnabled(!connected && !running);
    scopeAddressEdit->setEnabled(!connected && !running);
    generatorPortCombo->setEnabled(!connected && !running);
    sourceMeterPortCombo->setEnabled(!connected && !running);
    refreshPortsBtn->setEnabled(!connected && !running);
    connectBtn->setEnabled(!connected && !running);
    disconnectBtn->setEnabled(connected && !running);

    loadReferenceBtn->setEnabled(!running);
    runCycleBtn->setEnabled(connected && referenceLoaded && !running);
    runCycleBtn->setText(running ? "Running..." : "Run Full Cycle");
}

void MainWindow::showStatus(const QString &msg)
{
    statusLabel->setText(msg);
    statusBar()->showMessage(msg, 3000);
}

void MainWindow::appendLog(const QString &message)
{
    logView->append(QString("[%1] %2").arg(QDateTime::currentDateTime().toString("hh:mm:ss"), message));
}

void MainWindow::updateSerialPortList()
{
    const QString currentGenerator = generatorPortCombo->currentText();
    const QString currentSourceMeter = sourceMeterPortCombo->currentText();

    generatorPortCombo->clear();
    sourceMeterPortCombo->clear();
    sourceMeterPortCombo->addItem(QString());
    const auto ports = QSerialPortInfo::availablePorts();
    for (const QSerialPortInfo &port : ports) {
        generatorPortCombo->addItem(port.systemLocation());
        sourceMeterPortCombo->addItem(port.systemLocation());
    }
    generatorPortCombo->setCurrentText(currentGenerator);
    sourceMeterPortCombo->setCurrentText(currentSourceMeter);
    qDebug() << "[MainWindow] Found" << ports.size() << "serial ports";
}

void MainWindow::applyConfigToUi(const MeasurementConfig &cfg)
{
    backendCombo->setCurrentText(cfg.instruments.backend);
    scopeAddressEdit->setText(cfg.instruments.scopeAddress);
    generatorPortCombo->setCurrentText(cfg.instruments.generatorPort);
    sourceMeterPortCombo->setCurrentText(cfg.instruments.sourceMeterPort);

    shapeCombo->setCurrentText(waveShapeToString(cfg.generator.shape));
    frequencySpin->setValue(cfg.generator.frequencyHz);
    amplitudeSpin->setValue(cfg.generator.amplitudeVpp);
    offsetSpin->setValue(cfg.generator.offsetV);
    dutySpin->setValue(cfg.generator.dutyPercent);

    sourceCombo->setCurrentText(cfg.acquisition.scopeSource);
    averagesSpin->setValue(cfg.acquisition.averages);
    outputDirEdit->setText(cfg.outputDirectory);
}

MeasurementConfig MainWindow::configFromUi() const
{
    MeasurementConfig cfg = config;
    cfg.instruments.backend = backendCombo->currentText();
    cfg.instruments.scopeAddress = scopeAddressEdit->text().trimmed();
    cfg.instruments.generatorPort = generatorPortCombo->currentText().trimmed();
    cfg.instruments.sourceMeterPort = sourceMeterPortCombo->currentText().trimmed();

    cfg.generator.shape = waveShapeFromString(shapeCombo->currentText());
    cfg.generator.frequencyHz = frequencySpin->value();
    cfg.generator.amplitudeVpp = amplitudeSpin->value();
    cfg.generator.offsetV = offsetSpin->value();
    cfg.generator.dutyPercent = dutySpin->value();

    cfg.acquisition.scopeSource = sourceCombo->currentText();
    cfg.acquisition.averages = averagesSpin->value();
    cfg.outputDirectory = outputDirEdit->text().trimmed();
    return cfg;
}

void MainWindow::saveSettings()
{
    config = configFromUi();
    QSettings settings;
    config.save(settings);
}

// --- SLOT IMPLEMENTATIONS ---

void MainWindow::onConnectClicked()
{
    const MeasurementConfig cfg = configFromUi();
    if (cfg.instruments.scopeAddress.isEmpty() || cfg.instruments.generatorPort.isEmpty()) {
        QMessageBox::warning(this, "Connection Error", "Scope address and generator port are required.");
        return;
    }
    saveSettings();
    connectBtn->setEnabled(false);
    appendLog(QString("Connecting (%1 backend)...").arg(cfg.instruments.backend));
    emit connectRequested(cfg.instruments);
}

void MainWindow::onDisconnectClicked()
{
    emit disconnectRequested();
}

void MainWindow::onLoadReferenceClicked()
{
    const QString fileName = QFileDialog::getOpenFileName(this, "Load Reference CSV", outputDirEdit->text(),
                                                          "CSV Files (*.csv);;All Files (*)");
    if (fileName.isEmpty()) return;
    emit referenceRequested(fileName);
}

void MainWindow::onBrowseOutputClicked()
{
    const QString dir = QFileDialog::getExistingDirectory(this, "Output Folder", outputDirEdit->text());
    if (!dir.isEmpty()) outputDirEdit->setText(dir);
}

void MainWindow::onRunCycleClicked()
{
    saveSettings();
    if (!worker->requestCycle(config)) {
        QMessageBox::warning(this, "Not Ready", "A measurement cycle is already running.");
        return;
    }
    isRunning = true;
    updateUiState();
}

void MainWindow::handleConnectionChanged(bool connected, bool outputControl)
{
    isConnected = connected;
    if (connected && !outputControl) {
        appendLog("Running without source meter output control");
    }
    updateUiState();
}

void MainWindow::handleConnectionFailed(const MeasurementError &error)
{
    appendLog(QString("Connection Error: %1").arg(error.message));
    QMessageBox::critical(this, "Connection Error", error.message);
    updateUiState();
}

void MainWindow::handleReferenceLoaded(const QString &name, int points, double average)
{
    referenceLoaded = true;
    referenceLabel->setText(QString("Reference: %1 (%2 points, avg %3)").arg(name).arg(points).arg(average, 0, 'g', 6));
    updateUiState();
}

void MainWindow::handleReferenceCleared()
{
    referenceLoaded = false;
    referenceLabel->setText("Reference: none");
    updateUiState();
}

void MainWindow::handleReferenceFailed(const MeasurementError &error)
{
    QMessageBox::critical(this, "Reference Error", error.message);
}

void MainWindow::handleCycleFinished(const CycleResult &result)
{
    isRunning = false;
    updateUiState();

    ResultsDialog *dialog = new ResultsDialog(result, this);
    dialog->setAttribute(Qt::WA_DeleteOnClose);
    // Settings may have changed while the cycle ran; the image goes beside its CSV
    QString imagePath = result.imagePath;
    if (imagePath.isEmpty()) {
        imagePath = QFileInfo(result.csvPath).dir().filePath(
            WaveformExporter::processedBaseName(result.timestamp) + ".png");
    }
    if (dialog->saveImage(imagePath)) {
        appendLog(QString("Saved Image: %1").arg(imagePath));
    } else {
        appendLog(QString("Could not save image %1").arg(imagePath));
    }
    dialog->show();
}

void MainWindow::handleCycleFailed(const MeasurementError &error)
{
    isRunning = false;
    updateUiState();
    QMessageBox::critical(this, "Cycle Failed", QString("%1\n\n%2").arg(error.kindName(), error.message));
}

void MainWindow::handleStateChanged(MeasurementController::State state)
{
    stateLabel->setText(QString("State: %1").arg(MeasurementController::stateName(state)));
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    saveSettings();
    if (isRunning) {
        // No cancellation mid-cycle; the destructor waits for the worker thread
        appendLog("Waiting for the running cycle to finish...");
    }
    QMainWindow::closeEvent(event);
}

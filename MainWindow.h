#pragma once
#include <QMainWindow>
#include <QSerialPortInfo>
#include <QThread>
#include <QPushButton>
#include <QComboBox>
#include <QLabel>
#include <QLineEdit>
#include <QSpinBox>
#include <QDoubleSpinBox>
#include <QTextEdit>
#include <QGroupBox>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGridLayout>
#include <QFileDialog>
#include <QMessageBox>
#include "MeasurementConfig.h"
#include "MeasurementController.h"
#include "MeasurementError.h"

class MeasurementWorker;
class QCloseEvent;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

signals:
    void connectRequested(const InstrumentSettings &settings);
    void disconnectRequested();
    void referenceRequested(const QString &path);

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onConnectClicked();
    void onDisconnectClicked();
    void onLoadReferenceClicked();
    void onRunCycleClicked();
    void onBrowseOutputClicked();
    void updateSerialPortList();

    void handleConnectionChanged(bool connected, bool outputControl);
    void handleConnectionFailed(const MeasurementError &error);
    void handleReferenceLoaded(const QString &name, int points, double average);
    void handleReferenceCleared();
    void handleReferenceFailed(const MeasurementError &error);
    void handleCycleFinished(const CycleResult &result);
    void handleCycleFailed(const MeasurementError &error);
    void handleStateChanged(MeasurementController::State state);
    void appendLog(const QString &message);
    void showStatus(const QString &msg);

private:
    void setupUi();
    void setupConnections();
    void updateUiState();
    void applyConfigToUi(const MeasurementConfig &config);
    MeasurementConfig configFromUi() const;
    void saveSettings();

    QThread workerThread;
    MeasurementWorker *worker;
    MeasurementConfig config;

    bool isConnected = false;
    bool isRunning = false;
    bool referenceLoaded = false;

    // Instruments
    QComboBox *backendCombo;
    QLineEdit *scopeAddressEdit;
    QComboBox *generatorPortCombo;
    QComboBox *sourceMeterPortCombo;
    QPushButton *refreshPortsBtn;
    QPushButton *connectBtn;
    QPushButton *disconnectBtn;

    // Generator
    QComboBox *shapeCombo;
    QDoubleSpinBox *frequencySpin;
    QDoubleSpinBox *amplitudeSpin;
    QDoubleSpinBox *offsetSpin;
    QDoubleSpinBox *dutySpin;

    // Acquisition
    QComboBox *sourceCombo;
    QSpinBox *averagesSpin;
    QLineEdit *outputDirEdit;
    QPushButton *browseOutputBtn;

    QPushButton *loadReferenceBtn;
    QPushButton *runCycleBtn;
    QLabel *referenceLabel;
    QLabel *stateLabel;
    QLabel *statusLabel;
    QTextEdit *logView;
};

#pragma once

#include <QMainWindow>

class QListWidget;
class QListWidgetItem;
class QPushButton;
class QLabel;
class QCheckBox;
class QProgressBar;
class QTimer;

#include "../common/Utils.h"
#include "../core/GestureEngine.h"
#include "../network/TrackerClient.h"

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);

    void initialize(); // called after injection

    void setGestureEngine(GestureEngine *eng) { engine_ = eng; }
    void setTrackerClient(TrackerClient *client) { tracker_ = client; }

private slots:
    void onGestureSelected(QListWidgetItem *item);
    void onNewQuestionClicked();
    void onCalibrateClicked();
    void onTrackingToggled(bool checked);

    void onStatusChanged(DetectionStatus status);
    void onCandidateRaised(const RawCandidate &candidate);
    void onAnswerConfirmed(const FinalSignal &answer);
    void onCalibrationProgress(int percent);
    void onCalibrationFinished();
    void onConnectionStatusChanged(const QString &status);
    void onFrameReceived();

private:
    void setupUi();
    void loadGestures();
    void showGuide(GestureType type);

private:
    QListWidget *gestureList_ = nullptr;
    QLabel *guideLabel_ = nullptr;
    QLabel *detectionLabel_ = nullptr;
    QLabel *answerLabel_ = nullptr;
    QPushButton *newQuestionButton_ = nullptr;
    QPushButton *calibrateButton_ = nullptr;
    QProgressBar *calibrationBar_ = nullptr;
    QCheckBox *trackingCheckBox_ = nullptr;
    QLabel *statusLabel_ = nullptr;
    QLabel *fpsLabel_ = nullptr;
    QTimer *answerClearTimer_ = nullptr;

    GestureEngine *engine_ = nullptr;
    TrackerClient *tracker_ = nullptr;

    Utils::FPSTimer fpsTimer_;
    int framesSinceFpsUpdate_ = 0;
};

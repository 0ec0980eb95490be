#include "MainWindow.h"

#include <QCheckBox>
#include <QDebug>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QProgressBar>
#include <QPushButton>
#include <QSplitter>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>
#include <QWidget>

#include "../common/Constants.h"

// -------------------------------
// Constructor
// -------------------------------
MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setupUi();
    loadGestures();
}

// ---------------------------------------
// Called after dependencies are injected
// ---------------------------------------
void MainWindow::initialize()
{
    if (!engine_ || !tracker_)
    {
        qWarning() << "[MW] ERROR: engine_/tracker_ not set before initialize()!";
        return;
    }

    connect(engine_, &GestureEngine::statusChanged,
            this, &MainWindow::onStatusChanged);

    connect(engine_, &GestureEngine::candidateRaised,
            this, &MainWindow::onCandidateRaised);

    connect(engine_, &GestureEngine::answerConfirmed,
            this, &MainWindow::onAnswerConfirmed);

    connect(engine_, &GestureEngine::calibrationProgress,
            this, &MainWindow::onCalibrationProgress);

    connect(engine_, &GestureEngine::calibrationFinished,
            this, &MainWindow::onCalibrationFinished);

    connect(tracker_, &TrackerClient::connectionStatusChanged,
            this, &MainWindow::onConnectionStatusChanged);

    connect(tracker_, &TrackerClient::frameReceived,
            this, &MainWindow::onFrameReceived);

    // local UI connections
    connect(gestureList_, &QListWidget::itemClicked,
            this, &MainWindow::onGestureSelected);

    connect(newQuestionButton_, &QPushButton::clicked,
            this, &MainWindow::onNewQuestionClicked);

    connect(calibrateButton_, &QPushButton::clicked,
            this, &MainWindow::onCalibrateClicked);

    connect(trackingCheckBox_, &QCheckBox::toggled,
            this, &MainWindow::onTrackingToggled);

    connect(answerClearTimer_, &QTimer::timeout,
            answerLabel_, &QLabel::clear);

    gestureList_->setCurrentRow(static_cast<int>(engine_->activeGesture()));
    showGuide(engine_->activeGesture());
    onStatusChanged(engine_->status());

    qDebug() << "[MW] initialize(): connections established.";
}

void MainWindow::setupUi()
{
    auto *central = new QWidget(this);
    auto *mainLayout = new QHBoxLayout(central);

    auto *gestureGroup = new QGroupBox(tr("Answer with"), central);
    auto *gestureLayout = new QVBoxLayout(gestureGroup);

    gestureList_ = new QListWidget(gestureGroup);
    gestureLayout->addWidget(gestureList_);

    auto *sessionGroup = new QGroupBox(tr("Question"), central);
    auto *sessionLayout = new QVBoxLayout(sessionGroup);

    guideLabel_ = new QLabel(sessionGroup);
    guideLabel_->setWordWrap(true);

    detectionLabel_ = new QLabel(sessionGroup);

    answerLabel_ = new QLabel(sessionGroup);
    answerLabel_->setAlignment(Qt::AlignCenter);
    QFont answerFont = answerLabel_->font();
    answerFont.setPointSize(answerFont.pointSize() * 3);
    answerFont.setBold(true);
    answerLabel_->setFont(answerFont);

    newQuestionButton_ = new QPushButton(tr("New question"), sessionGroup);
    calibrateButton_ = new QPushButton(tr("Calibrate"), sessionGroup);

    calibrationBar_ = new QProgressBar(sessionGroup);
    calibrationBar_->setRange(0, 100);
    calibrationBar_->setVisible(false);

    trackingCheckBox_ = new QCheckBox(tr("Enable tracking (connect to tracker)"), sessionGroup);

    sessionLayout->addWidget(guideLabel_);
    sessionLayout->addWidget(detectionLabel_);
    sessionLayout->addWidget(answerLabel_, 1);
    sessionLayout->addWidget(newQuestionButton_);
    sessionLayout->addWidget(calibrateButton_);
    sessionLayout->addWidget(calibrationBar_);
    sessionLayout->addWidget(trackingCheckBox_);

    auto *splitter = new QSplitter(Qt::Horizontal, central);
    splitter->addWidget(gestureGroup);
    splitter->addWidget(sessionGroup);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 2);

    mainLayout->addWidget(splitter);
    setCentralWidget(central);

    statusLabel_ = new QLabel(tr("Ready"), this);
    statusBar()->addWidget(statusLabel_);
    fpsLabel_ = new QLabel(this);
    statusBar()->addPermanentWidget(fpsLabel_);

    answerClearTimer_ = new QTimer(this);
    answerClearTimer_->setSingleShot(true);
    answerClearTimer_->setInterval(ANSWER_DISPLAY_MS);

    setWindowTitle(tr("Face Gesture Answers"));
    resize(900, 550);
}

void MainWindow::loadGestures()
{
    const GestureType types[] = {GestureType::Blink, GestureType::Smile,
                                 GestureType::Nod, GestureType::Wave};

    for (GestureType type : types)
    {
        const GestureInfo info = Utils::gestureInfo(type);
        auto *item = new QListWidgetItem(info.name, gestureList_);
        item->setToolTip(info.description);
        item->setData(Qt::UserRole, static_cast<int>(type));
    }
}

void MainWindow::showGuide(GestureType type)
{
    const GestureInfo info = Utils::gestureInfo(type);
    guideLabel_->setText(
        tr("<b>%1</b><br>%2<br>YES: %3<br>NO: %4")
            .arg(info.name, info.description, info.yesAction, info.noAction));
}

void MainWindow::onGestureSelected(QListWidgetItem *item)
{
    if (!item)
        return;

    const auto type = static_cast<GestureType>(item->data(Qt::UserRole).toInt());
    engine_->setActiveGesture(type);
    showGuide(type);
}

void MainWindow::onNewQuestionClicked()
{
    answerClearTimer_->stop();
    answerLabel_->clear();
    engine_->reset();
    statusLabel_->setText(tr("Listening for an answer"));
}

void MainWindow::onCalibrateClicked()
{
    if (!engine_->startCalibration())
        return;

    calibrateButton_->setEnabled(false);
    calibrationBar_->setValue(0);
    calibrationBar_->setVisible(true);
}

void MainWindow::onTrackingToggled(bool checked)
{
    if (checked)
    {
        tracker_->start();
        engine_->reset();
    }
    else
    {
        tracker_->stop();
    }
}

void MainWindow::onStatusChanged(DetectionStatus status)
{
    switch (status)
    {
    case DetectionStatus::Waiting:
        detectionLabel_->setText(tr("Waiting"));
        break;
    case DetectionStatus::Searching:
        detectionLabel_->setText(tr("Looking for a face..."));
        break;
    case DetectionStatus::Detected:
        detectionLabel_->setText(tr("Face detected"));
        break;
    case DetectionStatus::Error:
        detectionLabel_->setText(tr("Error: %1").arg(engine_->lastError()));
        break;
    }
}

void MainWindow::onCandidateRaised(const RawCandidate &candidate)
{
    statusLabel_->setText(tr("Seen %1, confirming...")
                              .arg(Utils::answerKey(candidate.value)));
}

void MainWindow::onAnswerConfirmed(const FinalSignal &answer)
{
    answerLabel_->setText(answer.value == Answer::Yes ? tr("YES") : tr("NO"));
    statusLabel_->setText(tr("Answered with %1")
                              .arg(Utils::gestureInfo(answer.gesture).name));
    answerClearTimer_->start();
}

void MainWindow::onCalibrationProgress(int percent)
{
    calibrationBar_->setValue(percent);
}

void MainWindow::onCalibrationFinished()
{
    calibrationBar_->setVisible(false);
    calibrateButton_->setEnabled(true);
}

void MainWindow::onConnectionStatusChanged(const QString &status)
{
    statusLabel_->setText(status);
}

void MainWindow::onFrameReceived()
{
    const float fps = fpsTimer_.fps();
    if (++framesSinceFpsUpdate_ < 30)
        return;

    framesSinceFpsUpdate_ = 0;
    fpsLabel_->setText(tr("%1 fps").arg(fps, 0, 'f', 0));
}

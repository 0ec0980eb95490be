#include "GestureEngine.h"

#include <QDebug>

#include "../common/Utils.h"
#include "DetectorFactory.h"

GestureEngine::GestureEngine(const EngineConfig &config, QObject *parent)
    : QObject(parent),
      config_(config),
      gate_(config.holdMs),
      calibrator_(config.calibrationStepMs)
{
    connect(&gate_, &ConfirmationGate::finalized,
            this, &GestureEngine::onFinalized);

    connect(&gate_, &ConfirmationGate::pendingChanged,
            this, &GestureEngine::onPendingChanged);

    connect(&calibrator_, &Calibrator::progressChanged,
            this, &GestureEngine::calibrationProgress);

    connect(&calibrator_, &Calibrator::finished,
            this, &GestureEngine::calibrationFinished);

    rebuildDetector();
}

GestureEngine::~GestureEngine() = default;

void GestureEngine::setActiveGesture(GestureType type)
{
    gate_.cancel();

    const bool changed = type != activeType_;
    activeType_ = type;
    rebuildDetector();

    qDebug() << "[Engine] active gesture:" << Utils::gestureKey(activeType_);

    if (changed)
        emit activeGestureChanged(activeType_);
}

void GestureEngine::reset()
{
    gate_.cancel();
    rebuildDetector();

    listening_ = true;
    lastFrameTime_.reset();
    lastError_.clear();

    setStatus(DetectionStatus::Waiting);
}

bool GestureEngine::startCalibration()
{
    return calibrator_.start();
}

void GestureEngine::setError(const QString &message)
{
    qWarning() << "[Engine] upstream error:" << message;

    gate_.cancel();
    lastError_ = message;
    setStatus(DetectionStatus::Error);

    emit errorOccurred(message);
}

void GestureEngine::onFrame(const MeasurementFrame &frame)
{
    if (status_ == DetectionStatus::Error || !listening_)
        return;

    if (!detector_)
    {
        qCritical() << "[Engine] onFrame() without an active detector";
        Q_ASSERT_X(false, "GestureEngine::onFrame", "no active detector");
        return;
    }

    if (!acceptFrameTime(frame.timestampMs))
        return;

    if (!frame.faceDetected)
    {
        setStatus(DetectionStatus::Searching);
        return;
    }

    setStatus(DetectionStatus::Detected);

    const std::optional<RawCandidate> candidate = detector_->consume(frame);
    if (!candidate)
        return;

    qDebug() << "[Engine] candidate" << Utils::answerKey(candidate->value)
             << "from" << Utils::gestureKey(candidate->gesture)
             << "at" << candidate->timestampMs;

    emit candidateRaised(*candidate);
    gate_.submit(*candidate);
}

void GestureEngine::onFinalized(const FinalSignal &result)
{
    // One answer per question
    listening_ = false;
    setStatus(DetectionStatus::Waiting);

    qInfo() << "[Engine] confirmed" << Utils::answerKey(result.value)
            << "via" << Utils::gestureKey(result.gesture);

    emit answerConfirmed(result);
}

void GestureEngine::onPendingChanged(bool pending)
{
    if (detector_)
        detector_->setResponsePending(pending);
}

void GestureEngine::rebuildDetector()
{
    detector_ = DetectorFactory::create(activeType_, config_);
    if (!detector_)
        qCritical() << "[Engine] no detector for gesture" << int(activeType_);
}

void GestureEngine::setStatus(DetectionStatus status)
{
    if (status == status_)
        return;
    status_ = status;
    qDebug() << "[Engine] status:" << Utils::statusKey(status_);
    emit statusChanged(status_);
}

bool GestureEngine::acceptFrameTime(qint64 timestampMs)
{
    if (lastFrameTime_ && timestampMs >= *lastFrameTime_ &&
        timestampMs - *lastFrameTime_ < config_.minFrameIntervalMs)
    {
        return false;
    }

    if (lastFrameTime_ && timestampMs < *lastFrameTime_)
        qWarning() << "[Engine] frame time went backwards:" << *lastFrameTime_
                   << "->" << timestampMs;

    lastFrameTime_ = timestampMs;
    return true;
}

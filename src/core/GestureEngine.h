#pragma once
#include <QObject>
#include <QString>

#include <memory>
#include <optional>

#include "../common/Types.h"
#include "Calibrator.h"
#include "ConfirmationGate.h"
#include "EngineConfig.h"
#include "GestureDetector.h"

/**
 * GestureEngine
 * --------------------
 * Session controller for one user answering one question at a time.
 *
 *  - exactly one gesture detector is active (blink by default)
 *  - frames go to that detector; its candidates go through the
 *    confirmation gate; confirmed answers come out of answerConfirmed()
 *  - once a question is answered, frames are ignored until reset()
 *  - an upstream error (camera, model) stops frame processing until reset()
 *
 * Not thread safe: frames, control calls and timers all run on the
 * thread that owns the engine.
 */

class GestureEngine : public QObject
{
    Q_OBJECT
public:
    explicit GestureEngine(const EngineConfig &config, QObject *parent = nullptr);
    ~GestureEngine() override;

    // Switches detector and drops any state of the previous one
    void setActiveGesture(GestureType type);
    GestureType activeGesture() const { return activeType_; }

    // Starts listening for the answer to a new question
    void reset();

    bool startCalibration();
    bool isCalibrating() const { return calibrator_.isRunning(); }

    // Reported by the tracking side when camera or model fail
    void setError(const QString &message);
    QString lastError() const { return lastError_; }

    DetectionStatus status() const { return status_; }
    bool isListening() const { return listening_; }
    bool hasPendingCandidate() const { return gate_.hasPending(); }

    const GestureDetector *activeDetector() const { return detector_.get(); }
    const EngineConfig &config() const { return config_; }

public slots:
    void onFrame(const MeasurementFrame &frame);

signals:
    void statusChanged(DetectionStatus status);
    void candidateRaised(const RawCandidate &candidate);
    void answerConfirmed(const FinalSignal &answer);
    void activeGestureChanged(GestureType type);
    void calibrationProgress(int percent);
    void calibrationFinished();
    void errorOccurred(const QString &message);

private slots:
    void onFinalized(const FinalSignal &result);
    void onPendingChanged(bool pending);

private:
    void rebuildDetector();
    void setStatus(DetectionStatus status);
    bool acceptFrameTime(qint64 timestampMs);

    const EngineConfig config_;
    GestureType activeType_ = GestureType::Blink;
    std::unique_ptr<GestureDetector> detector_;

    ConfirmationGate gate_;
    Calibrator calibrator_;

    DetectionStatus status_ = DetectionStatus::Waiting;
    bool listening_ = true;
    std::optional<qint64> lastFrameTime_;
    QString lastError_;
};

#include "SmileDetector.h"

#include <QDebug>

#include "../../common/Constants.h"
#include "../../common/Utils.h"

std::optional<RawCandidate> SmileDetector::consume(const MeasurementFrame &frame)
{
    const Landmark *mouthLeft = Utils::landmarkAt(frame, LANDMARK_MOUTH_LEFT);
    const Landmark *mouthRight = Utils::landmarkAt(frame, LANDMARK_MOUTH_RIGHT);
    if (!mouthLeft || !mouthRight)
        return std::nullopt;

    const qint64 now = frame.timestampMs;
    const double mouthWidth = Utils::distance2D(*mouthLeft, *mouthRight);

    if (neutralMouthWidth_ == 0.0)
    {
        neutralMouthWidth_ = mouthWidth;
        qDebug() << "[Smile] neutral mouth width" << neutralMouthWidth_;
        return std::nullopt;
    }

    const double smileThreshold = neutralMouthWidth_ * settings_.thresholdMultiplier;

    if (mouthWidth > smileThreshold)
    {
        if (!isSmiling_)
        {
            isSmiling_ = true;
            smileReported_ = false;
            smileStartTime_ = now;
        }
        else if (!smileReported_ && now - smileStartTime_ >= settings_.minDurationMs)
        {
            smileReported_ = true;
            return makeCandidate(Answer::Yes, now);
        }
        return std::nullopt;
    }

    // Letting go of a smile before it was reported counts as a "no"
    const bool retracted = isSmiling_ && !smileReported_;
    isSmiling_ = false;
    smileReported_ = false;

    if (retracted)
        return makeCandidate(Answer::No, now);
    return std::nullopt;
}

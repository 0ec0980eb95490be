#include "NodDetector.h"

#include <QDebug>
#include <QtMath>

#include "../../common/Constants.h"
#include "../../common/Utils.h"

std::optional<RawCandidate> NodDetector::consume(const MeasurementFrame &frame)
{
    const Landmark *noseTip = Utils::landmarkAt(frame, LANDMARK_NOSE_TIP);
    const Landmark *forehead = Utils::landmarkAt(frame, LANDMARK_FOREHEAD);
    if (!noseTip || !forehead)
        return std::nullopt;

    const qint64 now = frame.timestampMs;
    const double verticalDistance = qAbs(double(noseTip->y) - double(forehead->y));

    if (neutralHeadPitch_ == 0.0)
    {
        neutralHeadPitch_ = verticalDistance;
        qDebug() << "[Nod] neutral head pitch" << neutralHeadPitch_;
        return std::nullopt;
    }

    const double nodThreshold = neutralHeadPitch_ * settings_.thresholdMultiplier;

    if (verticalDistance > nodThreshold && !isNodding_)
    {
        isNodding_ = true;
        nodCount_++;
        lastNodTime_ = now;
    }
    else if (verticalDistance <= nodThreshold * NOD_RELEASE_FACTOR)
    {
        isNodding_ = false;
    }

    if (nodCount_ > 0 && now - lastNodTime_ > settings_.cooldownMs && !responsePending())
    {
        const Answer answer = nodCount_ == 1 ? Answer::Yes : Answer::No;
        nodCount_ = 0;
        return makeCandidate(answer, now);
    }

    return std::nullopt;
}

#include "WaveDetector.h"

#include <QtGlobal>

#include "../../common/Constants.h"
#include "../../common/Utils.h"

WaveDetector::WaveDetector(const DetectorSettings &settings)
    : GestureDetector(settings)
{
    positions_.reserve(qMax(settings_.historySize, WAVE_MIN_HISTORY) + 1);
}

std::optional<RawCandidate> WaveDetector::consume(const MeasurementFrame &frame)
{
    const Landmark *faceLeft = Utils::landmarkAt(frame, LANDMARK_FACE_LEFT_EDGE);
    const Landmark *faceRight = Utils::landmarkAt(frame, LANDMARK_FACE_RIGHT_EDGE);
    if (!faceLeft || !faceRight)
        return std::nullopt;

    const qint64 now = frame.timestampMs;

    Landmark center;
    center.x = (faceLeft->x + faceRight->x) / 2.0f;
    center.y = (faceLeft->y + faceRight->y) / 2.0f;

    positions_.append(center);
    const int cap = qMax(settings_.historySize, WAVE_MIN_HISTORY);
    while (positions_.size() > cap)
        positions_.removeFirst();

    if (positions_.size() < WAVE_MIN_HISTORY)
        return std::nullopt;

    const double movement = totalMovement();

    if (movement > settings_.threshold && !isWaving_)
    {
        isWaving_ = true;
        waveCount_++;
        lastWaveTime_ = now;
    }
    else if (movement < settings_.threshold * WAVE_RELEASE_FACTOR)
    {
        isWaving_ = false;
    }

    if (waveCount_ > 0 && now - lastWaveTime_ > settings_.cooldownMs && !responsePending())
    {
        const Answer answer = waveCount_ == 1 ? Answer::Yes : Answer::No;
        waveCount_ = 0;
        positions_.clear();
        return makeCandidate(answer, now);
    }

    return std::nullopt;
}

double WaveDetector::totalMovement() const
{
    double total = 0.0;
    for (int i = 1; i < positions_.size(); ++i)
        total += Utils::distance2D(positions_[i - 1], positions_[i]);
    return total;
}

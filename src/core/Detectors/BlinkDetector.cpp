#include "BlinkDetector.h"

#include <QDebug>

#include "../../common/Constants.h"
#include "../../common/Utils.h"

std::optional<RawCandidate> BlinkDetector::consume(const MeasurementFrame &frame)
{
    const auto left = Utils::blendshape(frame, QLatin1String(BLENDSHAPE_EYE_BLINK_LEFT));
    const auto right = Utils::blendshape(frame, QLatin1String(BLENDSHAPE_EYE_BLINK_RIGHT));
    if (!left || !right)
        return std::nullopt;

    const qint64 now = frame.timestampMs;
    const double avgBlink = (double(*left) + double(*right)) / 2.0;

    evictOldBlinks(now);

    if (avgBlink > settings_.threshold && !isBlinking_)
    {
        isBlinking_ = true;
        blinkStartTime_ = now;
    }
    else if (avgBlink < settings_.threshold && isBlinking_)
    {
        isBlinking_ = false;

        const qint64 duration = now - blinkStartTime_;
        if (duration > settings_.minDurationMs && duration < settings_.maxDurationMs)
        {
            blinkHistory_.append(now);

            if (blinkHistory_.size() >= 2)
            {
                const qint64 gap = blinkHistory_.last() - blinkHistory_[blinkHistory_.size() - 2];
                if (gap < settings_.doubleSignalWindowMs)
                {
                    blinkHistory_.clear();
                    return makeCandidate(Answer::No, now);
                }
            }

            // A lone blink is settled later, once no partner can follow
            return std::nullopt;
        }

        qDebug() << "[Blink] ignored closure of" << duration << "ms";
    }

    if (!blinkHistory_.isEmpty() && !responsePending() &&
        now - blinkHistory_.first() >= settings_.confirmationDelayMs)
    {
        blinkHistory_.removeFirst();
        return makeCandidate(Answer::Yes, now);
    }

    return std::nullopt;
}

void BlinkDetector::evictOldBlinks(qint64 now)
{
    while (!blinkHistory_.isEmpty() &&
           now - blinkHistory_.first() >= settings_.historyWindowMs)
    {
        blinkHistory_.removeFirst();
    }
}

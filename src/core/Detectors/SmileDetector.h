#pragma once
#include "../GestureDetector.h"

/**
 * SmileDetector
 * --------------------
 * Mouth width relative to a neutral baseline taken from the first usable
 * frame. A smile held for minDuration -> yes. A smile that is let go
 * before that -> no.
 */

class SmileDetector : public GestureDetector
{
public:
    explicit SmileDetector(const DetectorSettings &settings)
        : GestureDetector(settings) {}

    GestureType type() const override { return GestureType::Smile; }

    std::optional<RawCandidate> consume(const MeasurementFrame &frame) override;

    double neutralMouthWidth() const { return neutralMouthWidth_; }
    bool isSmiling() const { return isSmiling_; }

private:
    double neutralMouthWidth_ = 0.0;
    bool isSmiling_ = false;
    bool smileReported_ = false;
    qint64 smileStartTime_ = 0;
};

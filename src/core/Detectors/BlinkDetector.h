#pragma once
#include <QVector>

#include "../GestureDetector.h"

/**
 * BlinkDetector
 * --------------------
 * Single blink -> yes, double blink -> no.
 *
 * A blink is counted when the averaged eyeBlinkLeft/eyeBlinkRight score
 * stays above the threshold for strictly between minDuration and
 * maxDuration. Two blinks closer than doubleSignalWindow give "no" at
 * once; a lone blink gives "yes" once confirmationDelay has passed
 * without a partner.
 */

class BlinkDetector : public GestureDetector
{
public:
    explicit BlinkDetector(const DetectorSettings &settings)
        : GestureDetector(settings) {}

    GestureType type() const override { return GestureType::Blink; }

    std::optional<RawCandidate> consume(const MeasurementFrame &frame) override;

    bool isBlinking() const { return isBlinking_; }
    const QVector<qint64> &blinkHistory() const { return blinkHistory_; }

private:
    void evictOldBlinks(qint64 now);

    bool isBlinking_ = false;
    qint64 blinkStartTime_ = 0;

    // Completion times of counted blinks, oldest first
    QVector<qint64> blinkHistory_;
};

#pragma once
#include <QVector>

#include "../GestureDetector.h"

/**
 * WaveDetector
 * --------------------
 * Uses side-to-side movement of the face centre (midpoint of the two face
 * edge landmarks) as the wave signal. Movement over the recent history
 * crossing the threshold counts one wave. After the cooldown:
 * one wave -> yes, two or more -> no.
 */

class WaveDetector : public GestureDetector
{
public:
    explicit WaveDetector(const DetectorSettings &settings);

    GestureType type() const override { return GestureType::Wave; }

    std::optional<RawCandidate> consume(const MeasurementFrame &frame) override;

    int historyLength() const { return int(positions_.size()); }
    bool isWaving() const { return isWaving_; }
    int waveCount() const { return waveCount_; }

private:
    double totalMovement() const;

    // Oldest first, capped at historySize
    QVector<Landmark> positions_;
    bool isWaving_ = false;
    int waveCount_ = 0;
    qint64 lastWaveTime_ = 0;
};

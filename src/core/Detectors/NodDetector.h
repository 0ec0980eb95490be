#pragma once
#include "../GestureDetector.h"

/**
 * NodDetector
 * --------------------
 * Counts head dips (nose tip to forehead vertical distance rising above
 * baseline * multiplier). When no new nod arrives for the cooldown:
 * one nod -> yes, two or more -> no.
 */

class NodDetector : public GestureDetector
{
public:
    explicit NodDetector(const DetectorSettings &settings)
        : GestureDetector(settings) {}

    GestureType type() const override { return GestureType::Nod; }

    std::optional<RawCandidate> consume(const MeasurementFrame &frame) override;

    double neutralHeadPitch() const { return neutralHeadPitch_; }
    bool isNodding() const { return isNodding_; }
    int nodCount() const { return nodCount_; }

private:
    double neutralHeadPitch_ = 0.0;
    bool isNodding_ = false;
    int nodCount_ = 0;
    qint64 lastNodTime_ = 0;
};

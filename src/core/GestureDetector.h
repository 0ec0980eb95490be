#pragma once
#include <optional>

#include "../common/Types.h"
#include "EngineConfig.h"

/**
 * GestureDetector
 * --------------------
 * Turns a stream of frames into at most one raw yes/no candidate per
 * frame. Each instance owns all of its state; a fresh instance is created
 * whenever the gesture is switched or a new question starts.
 *
 * Durations are measured with frame timestamps only. A frame missing the
 * landmarks or blendshapes a detector needs is skipped without touching
 * its state.
 */

class GestureDetector
{
public:
    explicit GestureDetector(const DetectorSettings &settings)
        : settings_(settings) {}
    virtual ~GestureDetector() = default;

    virtual GestureType type() const = 0;

    virtual std::optional<RawCandidate> consume(const MeasurementFrame &frame) = 0;

    // Set by the owner while the confirmation gate holds a candidate
    void setResponsePending(bool pending) { responsePending_ = pending; }
    bool responsePending() const { return responsePending_; }

    const DetectorSettings &settings() const { return settings_; }

protected:
    RawCandidate makeCandidate(Answer value, qint64 timestampMs) const
    {
        RawCandidate c;
        c.value = value;
        c.gesture = type();
        c.timestampMs = timestampMs;
        return c;
    }

    const DetectorSettings settings_;

private:
    bool responsePending_ = false;
};

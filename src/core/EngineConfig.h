#pragma once
#include <QString>
#include <QtGlobal>

#include "../common/Constants.h"
#include "../common/Types.h"

/**
 * DetectorSettings
 * --------------------
 * One row of the detector table. Each detector reads only the fields
 * that apply to it:
 *
 *  - blink: threshold, min/max duration, double signal window,
 *           confirmation delay, history window
 *  - smile: threshold multiplier, min duration (sustain time)
 *  - nod:   threshold multiplier, cooldown
 *  - wave:  threshold, cooldown, history size
 */
struct DetectorSettings
{
    double threshold = 0.0;
    qint64 minDurationMs = 0;
    qint64 maxDurationMs = 0;
    qint64 doubleSignalWindowMs = 0;
    qint64 confirmationDelayMs = 0;
    qint64 cooldownMs = 0;
    qint64 historyWindowMs = 0;
    double thresholdMultiplier = 1.0;
    int historySize = 0;
};

struct EngineConfig
{
    DetectorSettings blink;
    DetectorSettings smile;
    DetectorSettings nod;
    DetectorSettings wave;

    // Confirmation gate hold window
    int holdMs = 800;

    // Delay between calibration progress steps
    int calibrationStepMs = 500;

    // Frames closer together than this are dropped (~60 Hz)
    qint64 minFrameIntervalMs = 16;

    static EngineConfig defaults();

    const DetectorSettings &settingsFor(GestureType type) const;
    DetectorSettings &settingsFor(GestureType type);
};

struct AppConfig
{
    EngineConfig engine = EngineConfig::defaults();

    // Gesture selected at startup
    GestureType defaultGesture = GestureType::Blink;

    QString trackerHost = QString::fromLatin1(TRACKER_SERVER_IP);
    quint16 trackerPort = TRACKER_SERVER_PORT;
};

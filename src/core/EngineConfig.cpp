#include "EngineConfig.h"

EngineConfig EngineConfig::defaults()
{
    EngineConfig cfg;

    cfg.blink.threshold = 0.5;
    cfg.blink.minDurationMs = 30;
    cfg.blink.maxDurationMs = 350;
    cfg.blink.doubleSignalWindowMs = 500;
    cfg.blink.confirmationDelayMs = 800;
    cfg.blink.historyWindowMs = 2000;

    cfg.smile.thresholdMultiplier = 1.15;
    cfg.smile.minDurationMs = 1200;

    cfg.nod.thresholdMultiplier = 1.2;
    cfg.nod.cooldownMs = 600;

    cfg.wave.threshold = 0.06;
    cfg.wave.cooldownMs = 600;
    cfg.wave.historySize = 15;

    return cfg;
}

const DetectorSettings &EngineConfig::settingsFor(GestureType type) const
{
    switch (type)
    {
    case GestureType::Smile:
        return smile;
    case GestureType::Nod:
        return nod;
    case GestureType::Wave:
        return wave;
    case GestureType::Blink:
        break;
    }
    return blink;
}

DetectorSettings &EngineConfig::settingsFor(GestureType type)
{
    const auto &self = *this;
    return const_cast<DetectorSettings &>(self.settingsFor(type));
}

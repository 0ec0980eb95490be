#include "DetectorFactory.h"

#include "Detectors/BlinkDetector.h"
#include "Detectors/NodDetector.h"
#include "Detectors/SmileDetector.h"
#include "Detectors/WaveDetector.h"

std::unique_ptr<GestureDetector> DetectorFactory::create(GestureType type,
                                                         const EngineConfig &config)
{
    const DetectorSettings &settings = config.settingsFor(type);

    switch (type)
    {
    case GestureType::Blink:
        return std::make_unique<BlinkDetector>(settings);
    case GestureType::Smile:
        return std::make_unique<SmileDetector>(settings);
    case GestureType::Nod:
        return std::make_unique<NodDetector>(settings);
    case GestureType::Wave:
        return std::make_unique<WaveDetector>(settings);
    }
    return nullptr;
}

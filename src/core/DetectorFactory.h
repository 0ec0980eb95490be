#pragma once
#include <memory>

#include "GestureDetector.h"

class DetectorFactory
{
public:
    static std::unique_ptr<GestureDetector> create(GestureType type,
                                                   const EngineConfig &config);
};

#include <QCoreApplication>

#include <gtest/gtest.h>

#include "common/Types.h"

// Timers and queued signals need an application object
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    qRegisterMetaType<MeasurementFrame>();
    qRegisterMetaType<FinalSignal>();
    qRegisterMetaType<RawCandidate>();
    qRegisterMetaType<DetectionStatus>();
    qRegisterMetaType<GestureType>();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

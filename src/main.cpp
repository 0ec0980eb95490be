#include <QApplication>

#include "core/ConfigLoader.h"
#include "core/GestureEngine.h"
#include "network/TrackerClient.h"
#include "ui/MainWindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    QApplication::setApplicationName("FaceGesture");
    QApplication::setOrganizationName("FaceGesture");

    AppConfig config;
    ConfigLoader().load(config);

    GestureEngine engine(config.engine);
    engine.setActiveGesture(config.defaultGesture);

    TrackerClient tracker;
    tracker.setEndpoint(config.trackerHost, config.trackerPort);

    QObject::connect(&tracker, &TrackerClient::frameReceived,
                     &engine, &GestureEngine::onFrame);
    QObject::connect(&tracker, &TrackerClient::trackerError,
                     &engine, &GestureEngine::setError);

    MainWindow w;
    w.setGestureEngine(&engine);
    w.setTrackerClient(&tracker);
    w.initialize();
    w.show();

    return app.exec();
}

#include "ConfigLoader.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include "../common/Utils.h"

namespace
{
    void readPositive(const QJsonObject &obj, const QString &section,
                      const char *key, qint64 &target)
    {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isUndefined())
            return;
        const double d = v.toDouble(-1.0);
        if (!v.isDouble() || d <= 0.0)
        {
            qWarning() << "[Config]" << section << key
                       << "must be a positive number, keeping" << target;
            return;
        }
        target = qint64(d);
    }

    void readPositive(const QJsonObject &obj, const QString &section,
                      const char *key, double &target)
    {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isUndefined())
            return;
        const double d = v.toDouble(-1.0);
        if (!v.isDouble() || d <= 0.0)
        {
            qWarning() << "[Config]" << section << key
                       << "must be a positive number, keeping" << target;
            return;
        }
        target = d;
    }

    void readPositive(const QJsonObject &obj, const QString &section,
                      const char *key, int &target)
    {
        qint64 wide = target;
        readPositive(obj, section, key, wide);
        target = int(wide);
    }
}

ConfigLoader::ConfigLoader(const QString &relativePath)
    : configFile_(relativePath)
{
}

bool ConfigLoader::load(AppConfig &config) const
{
    const QString path = resolveConfigPath();
    if (path.isEmpty())
    {
        qInfo() << "[Config] no" << configFile_ << "found, using defaults";
        return false;
    }
    return loadFromFile(path, config);
}

bool ConfigLoader::loadFromFile(const QString &path, AppConfig &config) const
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
    {
        qWarning() << "[Config] cannot open" << path << ":" << f.errorString();
        return false;
    }

    QString error;
    if (!loadFromJson(f.readAll(), config, &error))
    {
        qWarning() << "[Config]" << path << ":" << error;
        return false;
    }

    qInfo() << "[Config] loaded" << path;
    return true;
}

bool ConfigLoader::loadFromJson(const QByteArray &json, AppConfig &config,
                                QString *error)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError)
    {
        if (error)
            *error = err.errorString();
        return false;
    }
    if (!doc.isObject())
    {
        if (error)
            *error = QStringLiteral("root is not an object");
        return false;
    }

    const QJsonObject root = doc.object();
    EngineConfig &engine = config.engine;

    const QJsonObject detectors = root["detectors"].toObject();
    readDetector(detectors, QStringLiteral("blink"), engine.blink);
    readDetector(detectors, QStringLiteral("smile"), engine.smile);
    readDetector(detectors, QStringLiteral("nod"), engine.nod);
    readDetector(detectors, QStringLiteral("wave"), engine.wave);

    const QJsonObject confirmation = root["confirmation"].toObject();
    readPositive(confirmation, QStringLiteral("confirmation"), "hold_ms", engine.holdMs);

    const QJsonObject calibration = root["calibration"].toObject();
    readPositive(calibration, QStringLiteral("calibration"), "step_ms",
                 engine.calibrationStepMs);

    // 0 disables throttling, so this one is not run through readPositive
    const QJsonObject capture = root["capture"].toObject();
    const QJsonValue interval = capture.value("min_frame_interval_ms");
    if (interval.isDouble() && interval.toDouble() >= 0.0)
        engine.minFrameIntervalMs = qint64(interval.toDouble());
    else if (!interval.isUndefined())
        qWarning() << "[Config] capture min_frame_interval_ms must be >= 0";

    const QJsonObject session = root["session"].toObject();
    if (session.contains("default_gesture"))
    {
        const QString key = session.value("default_gesture").toString();
        if (const auto type = Utils::gestureFromKey(key))
            config.defaultGesture = *type;
        else
            qWarning() << "[Config] unknown default_gesture:" << key;
    }

    const QJsonObject tracker = root["tracker"].toObject();
    config.trackerHost = tracker.value("host").toString(config.trackerHost);
    const int port = tracker.value("port").toInt(config.trackerPort);
    if (port > 0 && port <= 65535)
        config.trackerPort = static_cast<quint16>(port);
    else
        qWarning() << "[Config] tracker port out of range:" << port;

    return true;
}

void ConfigLoader::readDetector(const QJsonObject &obj, const QString &name,
                                DetectorSettings &settings)
{
    if (!obj.contains(name))
        return;

    const QJsonObject d = obj.value(name).toObject();
    const DetectorSettings before = settings;

    readPositive(d, name, "threshold", settings.threshold);
    readPositive(d, name, "min_duration_ms", settings.minDurationMs);
    readPositive(d, name, "max_duration_ms", settings.maxDurationMs);
    readPositive(d, name, "double_signal_window_ms", settings.doubleSignalWindowMs);
    readPositive(d, name, "confirmation_delay_ms", settings.confirmationDelayMs);
    readPositive(d, name, "cooldown_ms", settings.cooldownMs);
    readPositive(d, name, "history_window_ms", settings.historyWindowMs);
    readPositive(d, name, "threshold_multiplier", settings.thresholdMultiplier);
    readPositive(d, name, "history_size", settings.historySize);

    if (settings.maxDurationMs > 0 && settings.minDurationMs >= settings.maxDurationMs)
    {
        qWarning() << "[Config]" << name << "min_duration_ms must be below max_duration_ms,"
                   << "keeping" << before.minDurationMs << "/" << before.maxDurationMs;
        settings.minDurationMs = before.minDurationMs;
        settings.maxDurationMs = before.maxDurationMs;
    }
}

QString ConfigLoader::resolveConfigPath() const
{
    const QFileInfo info(configFile_);
    if (info.isAbsolute())
        return info.exists() ? info.absoluteFilePath() : QString();

    const auto searchDir = [this](QDir dir) -> QString {
        for (int i = 0; i < 3; ++i)
        {
            const QString candidate = dir.absoluteFilePath(configFile_);
            if (QFileInfo::exists(candidate))
                return QFileInfo(candidate).absoluteFilePath();
            if (!dir.cdUp())
                break;
        }
        return QString();
    };

    if (const QString fromCwd = searchDir(QDir::current()); !fromCwd.isEmpty())
        return fromCwd;

    if (QCoreApplication::instance())
    {
        if (const QString fromApp =
                searchDir(QDir(QCoreApplication::applicationDirPath()));
            !fromApp.isEmpty())
        {
            return fromApp;
        }
    }

    return QString();
}

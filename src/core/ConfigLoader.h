#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "EngineConfig.h"

/**
 * ConfigLoader
 * --------------------
 * Reads config/face_gesture.json (searched from the working directory and
 * the application directory, up to three levels up) on top of the built-in
 * defaults. Missing keys keep their defaults; out-of-range values are
 * reported and ignored.
 */

class ConfigLoader
{
public:
    explicit ConfigLoader(const QString &relativePath = QStringLiteral("config/face_gesture.json"));

    // Returns false if no config file was found or it could not be parsed.
    // `config` always ends up usable.
    bool load(AppConfig &config) const;

    bool loadFromFile(const QString &path, AppConfig &config) const;

    static bool loadFromJson(const QByteArray &json, AppConfig &config,
                             QString *error = nullptr);

    QString resolveConfigPath() const;

private:
    static void readDetector(const QJsonObject &obj, const QString &name,
                             DetectorSettings &settings);

    QString configFile_;
};

#pragma once

#include <QElapsedTimer>
#include <QString>
#include <QtMath>

#include <optional>

#include "Types.h"

/**
 * Generic helpers used across modules.
 */

namespace Utils
{

    // Planar distance, z is ignored as in the tracker's 2D measurements
    inline double distance2D(const Landmark &a, const Landmark &b)
    {
        const double dx = double(b.x) - double(a.x);
        const double dy = double(b.y) - double(a.y);
        return qSqrt(dx * dx + dy * dy);
    }

    inline const Landmark *landmarkAt(const MeasurementFrame &frame, int index)
    {
        if (index < 0 || index >= frame.landmarks.size())
            return nullptr;
        return &frame.landmarks[index];
    }

    inline std::optional<float> blendshape(const MeasurementFrame &frame,
                                           const QString &category)
    {
        const auto it = frame.blendshapes.constFind(category);
        if (it == frame.blendshapes.constEnd())
            return std::nullopt;
        return it.value();
    }

    inline QString gestureKey(GestureType type)
    {
        switch (type)
        {
        case GestureType::Blink:
            return QStringLiteral("blink");
        case GestureType::Smile:
            return QStringLiteral("smile");
        case GestureType::Nod:
            return QStringLiteral("nod");
        case GestureType::Wave:
            return QStringLiteral("wave");
        }
        return QString();
    }

    inline std::optional<GestureType> gestureFromKey(const QString &key)
    {
        const QString k = key.trimmed().toLower();
        if (k == "blink")
            return GestureType::Blink;
        if (k == "smile")
            return GestureType::Smile;
        if (k == "nod")
            return GestureType::Nod;
        if (k == "wave" || k == "handwave")
            return GestureType::Wave;
        return std::nullopt;
    }

    inline QString answerKey(Answer answer)
    {
        return answer == Answer::Yes ? QStringLiteral("yes") : QStringLiteral("no");
    }

    inline QString statusKey(DetectionStatus status)
    {
        switch (status)
        {
        case DetectionStatus::Waiting:
            return QStringLiteral("waiting");
        case DetectionStatus::Searching:
            return QStringLiteral("searching");
        case DetectionStatus::Detected:
            return QStringLiteral("detected");
        case DetectionStatus::Error:
            return QStringLiteral("error");
        }
        return QString();
    }

    inline GestureInfo gestureInfo(GestureType type)
    {
        switch (type)
        {
        case GestureType::Blink:
            return {QStringLiteral("Eye Blinking"),
                    QStringLiteral("Blink once for YES, twice for NO"),
                    QStringLiteral("Single Blink"),
                    QStringLiteral("Double Blink")};
        case GestureType::Smile:
            return {QStringLiteral("Smile Detection"),
                    QStringLiteral("Smile for YES, relax the smile early for NO"),
                    QStringLiteral("Sustained Smile"),
                    QStringLiteral("Interrupted Smile")};
        case GestureType::Nod:
            return {QStringLiteral("Head Nodding"),
                    QStringLiteral("Nod once for YES, twice for NO"),
                    QStringLiteral("Single Nod"),
                    QStringLiteral("Double Nod")};
        case GestureType::Wave:
            return {QStringLiteral("Head Waving"),
                    QStringLiteral("Sway once for YES, twice for NO"),
                    QStringLiteral("Single Wave"),
                    QStringLiteral("Double Wave")};
        }
        return {};
    }

    // FPS timer for debugging performance
    class FPSTimer
    {
    public:
        FPSTimer()
        {
            timer_.start();
        }

        float fps()
        {
            qint64 ms = timer_.restart();
            if (ms <= 0)
                return 0.f;
            return 1000.f / ms;
        }

    private:
        QElapsedTimer timer_;
    };
}

#pragma once
#include <QHash>
#include <QMetaType>
#include <QString>
#include <QVector>

enum class GestureType
{
    Blink,
    Smile,
    Nod,
    Wave
};

enum class Answer
{
    Yes,
    No
};

enum class DetectionStatus
{
    Waiting,
    Searching,
    Detected,
    Error
};

struct Landmark
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

/**
 * MeasurementFrame
 * --------------------
 * One tick of face tracker output. Blendshapes and landmarks are only
 * filled in when a face was found.
 */
struct MeasurementFrame
{
    qint64 timestampMs = 0;
    bool faceDetected = false;

    QHash<QString, float> blendshapes;
    QVector<Landmark> landmarks;
};

struct RawCandidate
{
    Answer value = Answer::Yes;
    GestureType gesture = GestureType::Blink;
    qint64 timestampMs = 0;
};

struct FinalSignal
{
    Answer value = Answer::Yes;
    GestureType gesture = GestureType::Blink;
    qint64 timestampMs = 0;
};

// Caregiver-facing description of a gesture
struct GestureInfo
{
    QString name;
    QString description;
    QString yesAction;
    QString noAction;
};

Q_DECLARE_METATYPE(GestureType)
Q_DECLARE_METATYPE(Answer)
Q_DECLARE_METATYPE(DetectionStatus)
Q_DECLARE_METATYPE(MeasurementFrame)
Q_DECLARE_METATYPE(RawCandidate)
Q_DECLARE_METATYPE(FinalSignal)

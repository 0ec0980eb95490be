#include "TrackerClient.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

namespace
{
    bool readLandmark(const QJsonValue &val, Landmark &out)
    {
        if (val.isObject())
        {
            const QJsonObject obj = val.toObject();
            if (!obj.value("x").isDouble() || !obj.value("y").isDouble())
                return false;
            out.x = float(obj.value("x").toDouble());
            out.y = float(obj.value("y").toDouble());
            out.z = float(obj.value("z").toDouble(0.0)); // z is optional in 2D mode
            return true;
        }

        if (val.isArray())
        {
            const QJsonArray arr = val.toArray();
            if (arr.size() < 2 || !arr[0].isDouble() || !arr[1].isDouble())
                return false;
            out.x = float(arr[0].toDouble());
            out.y = float(arr[1].toDouble());
            out.z = arr.size() > 2 ? float(arr[2].toDouble()) : 0.0f;
            return true;
        }

        return false;
    }
}

TrackerClient::TrackerClient(QObject *parent)
    : QObject(parent)
{
    connect(&socket_, &QTcpSocket::connected,
            this, &TrackerClient::onConnected);

    connect(&socket_, &QTcpSocket::disconnected,
            this, &TrackerClient::onDisconnected);

    connect(&socket_, &QTcpSocket::readyRead,
            this, &TrackerClient::onReadyRead);

    connect(&socket_, &QTcpSocket::errorOccurred,
            this, &TrackerClient::onError);
}

void TrackerClient::setEndpoint(const QString &host, quint16 port)
{
    host_ = host;
    port_ = port;
}

void TrackerClient::start()
{
    if (socket_.state() != QAbstractSocket::UnconnectedState)
        socket_.abort();
    buffer_.clear();
    emit connectionStatusChanged(
        tr("Connecting to %1:%2").arg(host_).arg(port_));
    socket_.connectToHost(host_, port_);
}

void TrackerClient::stop()
{
    if (socket_.state() != QAbstractSocket::UnconnectedState)
    {
        socket_.disconnectFromHost();
        if (socket_.state() != QAbstractSocket::UnconnectedState)
            socket_.waitForDisconnected(1000);
    }
    emit connectionStatusChanged(tr("Disconnected"));
}

void TrackerClient::onConnected()
{
    emit connectionStatusChanged(
        tr("Connected to %1:%2").arg(host_).arg(port_));
}

void TrackerClient::onDisconnected()
{
    emit connectionStatusChanged(tr("Disconnected"));
}

void TrackerClient::onError(QAbstractSocket::SocketError)
{
    const QString message = tr("Connection error: %1").arg(socket_.errorString());
    emit connectionStatusChanged(message);
    emit trackerError(message);
}

void TrackerClient::onReadyRead()
{
    buffer_.append(socket_.readAll());

    while (true)
    {
        const int idx = int(buffer_.indexOf('\n'));
        if (idx < 0)
            return;

        const QByteArray line = buffer_.left(idx).trimmed();
        buffer_.remove(0, idx + 1);
        if (!line.isEmpty())
            processLine(line);
    }
}

void TrackerClient::processLine(const QByteArray &line)
{
    MeasurementFrame frame;
    QString message;

    switch (parseLine(line, frame, message))
    {
    case LineKind::Frame:
        emit frameReceived(frame);
        break;
    case LineKind::Error:
        emit trackerError(message);
        break;
    case LineKind::Invalid:
        qWarning() << "[Tracker] dropped line:" << message;
        break;
    }
}

TrackerClient::LineKind TrackerClient::parseLine(const QByteArray &line,
                                                 MeasurementFrame &frame,
                                                 QString &message)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &err);

    if (err.error != QJsonParseError::NoError)
    {
        message = err.errorString();
        return LineKind::Invalid;
    }

    if (!doc.isObject())
    {
        message = QStringLiteral("message is not an object");
        return LineKind::Invalid;
    }

    const QJsonObject root = doc.object();

    if (root.contains("error"))
    {
        message = root.value("error").toString(QStringLiteral("unknown tracker error"));
        return LineKind::Error;
    }

    const QJsonValue ts = root.value("timestamp_ms");
    if (!ts.isDouble())
    {
        message = QStringLiteral("missing timestamp_ms");
        return LineKind::Invalid;
    }

    frame = MeasurementFrame();
    frame.timestampMs = qint64(ts.toDouble());

    // Either {"name": score, ...} or MediaPipe's [{"categoryName":..., "score":...}]
    const QJsonValue shapes = root.value("blendshapes");
    if (shapes.isObject())
    {
        const QJsonObject obj = shapes.toObject();
        for (auto it = obj.constBegin(); it != obj.constEnd(); ++it)
        {
            if (it.value().isDouble())
                frame.blendshapes.insert(it.key(), float(it.value().toDouble()));
        }
    }
    else if (shapes.isArray())
    {
        for (const QJsonValue &val : shapes.toArray())
        {
            const QJsonObject obj = val.toObject();
            const QString name = obj.value("categoryName").toString();
            if (!name.isEmpty() && obj.value("score").isDouble())
                frame.blendshapes.insert(name, float(obj.value("score").toDouble()));
        }
    }

    const QJsonArray landmarksArr = root.value("landmarks").toArray();
    frame.landmarks.reserve(landmarksArr.size());
    for (const QJsonValue &val : landmarksArr)
    {
        Landmark lm;
        if (!readLandmark(val, lm))
        {
            // A gap would shift every later index, so the frame is unusable
            message = QStringLiteral("malformed landmark at index %1")
                          .arg(frame.landmarks.size());
            return LineKind::Invalid;
        }
        frame.landmarks.append(lm);
    }

    // Older tracker builds omit "face_detected" and only send faces they found
    const bool hasMeasurements = !frame.landmarks.isEmpty() || !frame.blendshapes.isEmpty();
    frame.faceDetected = root.value("face_detected").toBool(hasMeasurements);

    if (!frame.faceDetected)
    {
        frame.blendshapes.clear();
        frame.landmarks.clear();
    }

    return LineKind::Frame;
}

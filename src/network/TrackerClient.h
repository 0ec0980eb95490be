#pragma once
#include <QObject>
#include <QTcpSocket>
#include <QString>

#include "../common/Types.h"

/**
 * TrackerClient
 * -----------------------
 * Connects to the face tracking process and turns its newline separated
 * JSON messages into:
 *   - frameReceived() for measurement frames
 *   - trackerError() for camera/model failures and socket errors
 */

class TrackerClient : public QObject
{
    Q_OBJECT

public:
    explicit TrackerClient(QObject *parent = nullptr);

    void start();
    void stop();

    void setEndpoint(const QString &host, quint16 port);

    enum class LineKind
    {
        Frame,
        Error,
        Invalid
    };

    // Decodes one message; `frame` is filled for Frame, `message` for Error/Invalid
    static LineKind parseLine(const QByteArray &line, MeasurementFrame &frame,
                              QString &message);

signals:
    void connectionStatusChanged(const QString &status);
    void frameReceived(const MeasurementFrame &frame);
    void trackerError(const QString &message);

private slots:
    void onConnected();
    void onDisconnected();
    void onError(QAbstractSocket::SocketError socketError);
    void onReadyRead();

private:
    void processLine(const QByteArray &line);

    QTcpSocket socket_;
    QByteArray buffer_;
    QString host_ = QStringLiteral("127.0.0.1");
    quint16 port_ = 5556;
};

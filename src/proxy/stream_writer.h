#pragma once
#include <QTcpSocket>
#include <QByteArray>
#include <QString>

// Chunked-transfer framing for streamed replies. Frames are written as-is;
// the payload format (newline-delimited JSON) is the caller's concern.
class StreamWriter {
public:
    static void writeStreamHeader(QTcpSocket* socket, const QString& contentType);
    static void sendChunk(QTcpSocket* socket, const QByteArray& data);
    static void sendTerminator(QTcpSocket* socket);

    static QByteArray wrapChunked(const QByteArray& data);
};

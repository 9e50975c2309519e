#include "stream_writer.h"
#include "core/log_manager.h"

void StreamWriter::writeStreamHeader(QTcpSocket* socket, const QString& contentType)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_WARNING(QStringLiteral("StreamWriter: cannot write stream header, socket not connected"));
        return;
    }

    QByteArray header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: ";
    header.append(contentType.toUtf8());
    header.append("\r\n"
                  "Cache-Control: no-cache\r\n"
                  "Connection: close\r\n"
                  "Access-Control-Allow-Origin: *\r\n"
                  "Transfer-Encoding: chunked\r\n"
                  "\r\n");

    socket->write(header);
    socket->flush();
}

QByteArray StreamWriter::wrapChunked(const QByteArray& data)
{
    // HTTP/1.1 chunked transfer encoding:
    //   <hex-length>\r\n
    //   <data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

void StreamWriter::sendChunk(QTcpSocket* socket, const QByteArray& data)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_DEBUG(QStringLiteral("StreamWriter: dropping chunk, socket not connected"));
        return;
    }
    // a zero-length chunk would end the body early
    if (data.isEmpty())
        return;

    socket->write(wrapChunked(data));
    socket->flush();
}

void StreamWriter::sendTerminator(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        LOG_DEBUG(QStringLiteral("StreamWriter: cannot send terminator, socket not connected"));
        return;
    }

    // The zero-length chunk signals end of chunked transfer
    socket->write("0\r\n\r\n");
    socket->flush();
}

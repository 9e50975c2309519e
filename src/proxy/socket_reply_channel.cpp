#include "socket_reply_channel.h"
#include "stream_writer.h"
#include "core/log_manager.h"
#include <QMap>

SocketReplyChannel::SocketReplyChannel(QTcpSocket* socket)
    : m_socket(socket)
{
    if (m_socket) {
        m_disconnectConnection = QObject::connect(m_socket, &QTcpSocket::disconnected,
                                                  m_socket, [this]() { onDisconnected(); });
    }
}

SocketReplyChannel::~SocketReplyChannel()
{
    QObject::disconnect(m_disconnectConnection);
}

bool SocketReplyChannel::isOpen() const
{
    return !m_finished && m_socket && m_socket->state() == QAbstractSocket::ConnectedState;
}

QByteArray SocketReplyChannel::statusText(int status)
{
    static const QMap<int, QByteArray> statusTexts = {
        {200, "OK"},
        {400, "Bad Request"},
        {401, "Unauthorized"},
        {403, "Forbidden"},
        {404, "Not Found"},
        {413, "Payload Too Large"},
        {429, "Too Many Requests"},
        {500, "Internal Server Error"},
        {501, "Not Implemented"},
        {502, "Bad Gateway"},
        {503, "Service Unavailable"},
        {504, "Gateway Timeout"}
    };
    return statusTexts.value(status, QByteArrayLiteral("Unknown"));
}

void SocketReplyChannel::sendResponse(int status, const QByteArray& body,
                                      const QString& contentType)
{
    if (!isOpen()) {
        LOG_DEBUG(QStringLiteral("SocketReplyChannel: dropping %1 reply, client gone").arg(status));
        return;
    }

    if (m_streaming) {
        // Headers are already on the wire; deliver the body in-band and close.
        StreamWriter::sendChunk(m_socket, body);
        endStream();
        return;
    }

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 ").arg(status).toUtf8());
    response.append(statusText(status));
    response.append("\r\n");
    response.append(QStringLiteral("Content-Type: %1\r\n")
                        .arg(contentType)
                        .toUtf8());
    response.append(QStringLiteral("Content-Length: %1\r\n")
                        .arg(body.size())
                        .toUtf8());
    response.append("Access-Control-Allow-Origin: *\r\n");
    response.append("Connection: close\r\n");
    response.append("\r\n");
    response.append(body);

    m_finished = true;
    m_socket->write(response);
    m_socket->flush();
    m_socket->disconnectFromHost();
}

void SocketReplyChannel::beginStream(const QString& contentType)
{
    if (!isOpen() || m_streaming)
        return;
    m_streaming = true;
    StreamWriter::writeStreamHeader(m_socket, contentType);
}

void SocketReplyChannel::writeChunk(const QByteArray& data)
{
    if (!isOpen() || !m_streaming)
        return;
    StreamWriter::sendChunk(m_socket, data);
}

void SocketReplyChannel::endStream()
{
    if (!isOpen())
        return;
    m_finished = true;
    if (m_streaming)
        StreamWriter::sendTerminator(m_socket);
    m_socket->disconnectFromHost();
}

void SocketReplyChannel::setCloseHandler(std::function<void()> handler)
{
    m_closeHandler = std::move(handler);
}

void SocketReplyChannel::onDisconnected()
{
    QObject::disconnect(m_disconnectConnection);
    const bool interrupted = !m_finished;
    m_finished = true;
    if (interrupted) {
        LOG_INFO(QStringLiteral("SocketReplyChannel: client disconnected before the reply completed"));
    }

    auto handler = std::move(m_closeHandler);
    m_closeHandler = nullptr;
    if (interrupted && handler)
        handler();
}

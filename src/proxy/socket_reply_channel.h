#pragma once
#include "semantic/ports.h"
#include <QMetaObject>
#include <QPointer>
#include <QTcpSocket>

// IReplyChannel over one accepted client socket. Each inbound request gets its
// own channel; replies close the connection once complete.
class SocketReplyChannel : public IReplyChannel {
public:
    explicit SocketReplyChannel(QTcpSocket* socket);
    ~SocketReplyChannel() override;

    bool isOpen() const override;
    void sendResponse(int status, const QByteArray& body,
                      const QString& contentType = QStringLiteral("application/json")) override;
    void beginStream(const QString& contentType) override;
    void writeChunk(const QByteArray& data) override;
    void endStream() override;
    void setCloseHandler(std::function<void()> handler) override;

    bool isFinished() const { return m_finished; }

    static QByteArray statusText(int status);

private:
    void onDisconnected();

    QPointer<QTcpSocket> m_socket;
    QMetaObject::Connection m_disconnectConnection;
    std::function<void()> m_closeHandler;
    bool m_streaming = false;
    bool m_finished = false;
};

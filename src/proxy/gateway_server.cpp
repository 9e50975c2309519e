#include "gateway_server.h"
#include "socket_reply_channel.h"
#include "core/log_manager.h"

#include <QHostInfo>
#include <QJsonDocument>
#include <QJsonObject>

GatewayServer::GatewayServer(QObject* parent)
    : QObject(parent)
{
    m_router.registerDefaults();
}

GatewayServer::~GatewayServer()
{
    stop();
}

void GatewayServer::setEndpoints(GatewayEndpoints* endpoints)
{
    m_endpoints = endpoints;
}

QHostAddress GatewayServer::resolveListenAddress(const QString& host)
{
    const QString trimmed = host.trimmed();
    if (trimmed.isEmpty() || trimmed == QStringLiteral("0.0.0.0") || trimmed == QStringLiteral("*"))
        return QHostAddress(QHostAddress::AnyIPv4);
    if (trimmed.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0)
        return QHostAddress(QHostAddress::LocalHost);

    QHostAddress literal(trimmed);
    if (!literal.isNull())
        return literal;

    const QHostInfo info = QHostInfo::fromName(trimmed);
    if (info.error() == QHostInfo::NoError && !info.addresses().isEmpty())
        return info.addresses().first();
    return QHostAddress();
}

bool GatewayServer::start(const ListenConfig& config)
{
    if (m_server) {
        stop();
    }

    const QHostAddress address = resolveListenAddress(config.host);
    if (address.isNull()) {
        LOG_ERROR(QStringLiteral("GatewayServer: cannot resolve listen host '%1'").arg(config.host));
        return false;
    }

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::pendingConnectionAvailable,
            this, &GatewayServer::onNewConnection);

    if (!m_server->listen(address, static_cast<quint16>(config.port))) {
        LOG_ERROR(QStringLiteral("GatewayServer: failed to listen on %1:%2 - %3")
                      .arg(config.host)
                      .arg(config.port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("GatewayServer: listening on %1:%2")
                 .arg(address.toString())
                 .arg(m_server->serverPort()));
    emit statusChanged(true);
    return true;
}

void GatewayServer::stop()
{
    if (!m_server) {
        return;
    }

    const QList<QTcpSocket*> sockets = m_pendingData.keys();
    for (QTcpSocket* socket : sockets) {
        socket->disconnectFromHost();
    }
    m_pendingData.clear();
    m_dispatched.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("GatewayServer: stopped"));
    emit statusChanged(false);
}

bool GatewayServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 GatewayServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

void GatewayServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        m_pendingData.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &GatewayServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &GatewayServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("GatewayServer: connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void GatewayServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    // One request per connection; anything after it is ignored.
    if (m_dispatched.contains(socket)) {
        socket->readAll();
        return;
    }

    QByteArray& buffer = m_pendingData[socket];
    buffer += socket->readAll();

    if (buffer.size() > kMaxRequestBytes) {
        QJsonObject errObj;
        errObj[QStringLiteral("error")] = QStringLiteral("request too large");
        sendError(socket, 413, errObj);
        return;
    }

    const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return;
    }

    int contentLength = 0;
    bool hasChunkedTransfer = false;
    const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
    const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
    for (const QString& line : headerLines) {
        if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
            contentLength = line.mid(15).trimmed().toInt();
        }
        if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
            && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
            hasChunkedTransfer = true;
        }
    }

    if (hasChunkedTransfer) {
        QJsonObject errObj;
        errObj[QStringLiteral("error")] = QStringLiteral("chunked request bodies are not supported");
        sendError(socket, 501, errObj);
        return;
    }

    const qsizetype bodyStart = headerEnd + 4;
    const qsizetype totalRequired = bodyStart + qMax(0, contentLength);
    if (buffer.size() < totalRequired) {
        return;
    }

    const InboundRequest req = parseHttpRequest(buffer.left(totalRequired));
    buffer.clear();
    m_dispatched.insert(socket);
    handleRequest(socket, req);
}

void GatewayServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData.remove(socket);
    m_dispatched.remove(socket);
    socket->deleteLater();

    LOG_DEBUG(QStringLiteral("GatewayServer: client disconnected"));
}

InboundRequest GatewayServer::parseHttpRequest(const QByteArray& data) const
{
    InboundRequest req;

    qsizetype headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return req;
    }

    QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Parse the request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method = parts[0].trimmed().toUpper();
            req.path   = parts[1];
        }
    }

    // Parse headers
    for (qsizetype i = 1; i < lines.size(); ++i) {
        qsizetype colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            QString key   = lines[i].left(colon).trimmed().toLower();
            QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    req.body = data.mid(headerEnd + 4);
    return req;
}

void GatewayServer::handleRequest(QTcpSocket* socket, const InboundRequest& request)
{
    LOG_INFO(QStringLiteral("GatewayServer: %1 %2").arg(request.method, request.path));

    if (request.method.isEmpty()) {
        QJsonObject errObj;
        errObj[QStringLiteral("error")] = QStringLiteral("malformed request line");
        sendError(socket, 400, errObj);
        return;
    }

    auto routeOpt = m_router.match(request.method, request.path);
    if (!routeOpt) {
        QJsonObject errObj;
        errObj[QStringLiteral("error")] = QStringLiteral("route not found");
        errObj[QStringLiteral("path")]  = request.path;
        sendError(socket, 404, errObj);
        return;
    }

    if (!m_endpoints) {
        QJsonObject errObj;
        errObj[QStringLiteral("error")] = QStringLiteral("gateway not configured");
        sendError(socket, 503, errObj);
        return;
    }

    m_endpoints->handle(routeOpt->endpoint, request,
                        std::make_shared<SocketReplyChannel>(socket));
}

void GatewayServer::sendError(QTcpSocket* socket, int status, const QJsonObject& body)
{
    m_dispatched.insert(socket);
    m_pendingData[socket].clear();
    SocketReplyChannel channel(socket);
    channel.sendResponse(status, QJsonDocument(body).toJson(QJsonDocument::Compact));
}

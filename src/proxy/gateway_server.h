#pragma once
#include "request_router.h"
#include "config/config_types.h"
#include "pipeline/gateway_endpoints.h"
#include <QObject>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QMap>
#include <QSet>

class GatewayServer : public QObject {
    Q_OBJECT
public:
    explicit GatewayServer(QObject* parent = nullptr);
    ~GatewayServer() override;

    bool start(const ListenConfig& config);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    void setEndpoints(GatewayEndpoints* endpoints);

    static QHostAddress resolveListenAddress(const QString& host);

    static constexpr int kMaxRequestBytes = 32 * 1024 * 1024;

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    InboundRequest parseHttpRequest(const QByteArray& data) const;
    void handleRequest(QTcpSocket* socket, const InboundRequest& request);
    void sendError(QTcpSocket* socket, int status, const QJsonObject& body);

    QTcpServer* m_server = nullptr;
    RequestRouter m_router;
    GatewayEndpoints* m_endpoints = nullptr;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
    QSet<QTcpSocket*> m_dispatched;
};

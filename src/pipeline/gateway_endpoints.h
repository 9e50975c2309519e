#pragma once
#include "semantic/ports.h"
#include "proxy/request_router.h"
#include <QObject>
#include <QJsonObject>
#include <memory>

struct InboundRequest {
    QString method;
    QString path;
    QMap<QString, QString> headers;   // lower-cased names
    QByteArray body;
};

// Per-request orchestration: decodes the inbound body, picks streaming or
// single-shot mode, drives the outbound call and writes the reply.
class GatewayEndpoints : public QObject {
    Q_OBJECT
public:
    GatewayEndpoints(IInboundAdapter* inbound,
                     IOutboundAdapter* outbound,
                     IExecutor* executor,
                     QObject* parent = nullptr);

    void handle(Endpoint endpoint, const InboundRequest& request,
                std::shared_ptr<IReplyChannel> channel);

    static bool shouldStream(ReplyShape shape, const CanonicalRequest& request,
                             const QMap<QString, QString>& headers);

    int activeStreams() const { return m_activeStreams; }

signals:
    void streamFinished();

private:
    void handleCompletion(ReplyShape shape, const InboundRequest& request,
                          std::shared_ptr<IReplyChannel> channel);
    void handlePull(const InboundRequest& request, std::shared_ptr<IReplyChannel> channel);
    void handleTags(std::shared_ptr<IReplyChannel> channel);
    void handleShow(const InboundRequest& request, std::shared_ptr<IReplyChannel> channel);
    void handleHealth(std::shared_ptr<IReplyChannel> channel);

    void runSingleShot(ReplyShape shape, const ProviderRequest& request,
                       std::shared_ptr<IReplyChannel> channel);
    void runStream(ReplyShape shape, const ProviderRequest& request,
                   std::shared_ptr<IReplyChannel> channel);
    void replyCompletion(ReplyShape shape, const ProviderResponse& response,
                         const std::shared_ptr<IReplyChannel>& channel);
    void replyFailure(const std::shared_ptr<IReplyChannel>& channel,
                      const DomainFailure& failure);

    Result<QJsonObject> parseBody(const QByteArray& body) const;

    IInboundAdapter* m_inbound;
    IOutboundAdapter* m_outbound;
    IExecutor* m_executor;
    int m_activeStreams = 0;
};

#include "gateway_endpoints.h"
#include "semantic/stream_session.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QPointer>

namespace {

using PendingReply = std::shared_ptr<QPointer<QNetworkReply>>;

// Abort the outbound call if the client leaves before it completes.
PendingReply guardPending(const std::shared_ptr<IReplyChannel>& channel)
{
    auto pending = std::make_shared<QPointer<QNetworkReply>>();
    channel->setCloseHandler([pending]() {
        if (*pending && (*pending)->isRunning()) {
            LOG_INFO(QStringLiteral("GatewayEndpoints: client gone, aborting upstream call"));
            (*pending)->abort();
        }
    });
    return pending;
}

QString preview(const QByteArray& body)
{
    return QString::fromUtf8(body.left(512));
}

}

GatewayEndpoints::GatewayEndpoints(IInboundAdapter* inbound,
                                   IOutboundAdapter* outbound,
                                   IExecutor* executor,
                                   QObject* parent)
    : QObject(parent)
    , m_inbound(inbound)
    , m_outbound(outbound)
    , m_executor(executor)
{
}

void GatewayEndpoints::handle(Endpoint endpoint, const InboundRequest& request,
                              std::shared_ptr<IReplyChannel> channel)
{
    switch (endpoint) {
    case Endpoint::Generate:
        handleCompletion(ReplyShape::Generate, request, std::move(channel));
        break;
    case Endpoint::Chat:
        handleCompletion(ReplyShape::Chat, request, std::move(channel));
        break;
    case Endpoint::Pull:
        handlePull(request, std::move(channel));
        break;
    case Endpoint::Tags:
        handleTags(std::move(channel));
        break;
    case Endpoint::Show:
        handleShow(request, std::move(channel));
        break;
    case Endpoint::Health:
        handleHealth(std::move(channel));
        break;
    }
}

bool GatewayEndpoints::shouldStream(ReplyShape shape, const CanonicalRequest& request,
                                    const QMap<QString, QString>& headers)
{
    if (request.messagesSynthesized)
        return false;
    if (shape == ReplyShape::Generate)
        return request.stream;
    // chat streams only a conversation given as a "messages" array
    if (!request.messagesFromList)
        return false;
    return request.stream
        || headers.value(QStringLiteral("accept")).contains(QStringLiteral("text/event-stream"),
                                                            Qt::CaseInsensitive);
}

Result<QJsonObject> GatewayEndpoints::parseBody(const QByteArray& body) const
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("request body is not a JSON object")));
    }
    return doc.object();
}

void GatewayEndpoints::replyFailure(const std::shared_ptr<IReplyChannel>& channel,
                                    const DomainFailure& failure)
{
    channel->sendResponse(failure.httpStatus(), m_inbound->encodeFailure(failure));
}

void GatewayEndpoints::handleCompletion(ReplyShape shape, const InboundRequest& request,
                                        std::shared_ptr<IReplyChannel> channel)
{
    auto decoded = m_inbound->decodeRequest(request.body, request.headers);
    if (!decoded) {
        LOG_WARNING(QStringLiteral("GatewayEndpoints: rejecting %1: %2")
                        .arg(request.path, decoded.error().message));
        replyFailure(channel, decoded.error());
        return;
    }

    CanonicalRequest canonical = std::move(*decoded);
    canonical.stream = shouldStream(shape, canonical, request.headers);

    LOG_INFO(QStringLiteral("GatewayEndpoints: %1 model=%2 messages=%3 mode=%4")
                 .arg(request.path,
                      canonical.model.isEmpty() ? QStringLiteral("<default>") : canonical.model)
                 .arg(canonical.messages.size())
                 .arg(canonical.stream ? QStringLiteral("stream") : QStringLiteral("single")));

    auto built = m_outbound->buildRequest(canonical);
    if (!built) {
        replyFailure(channel, built.error());
        return;
    }

    if (canonical.stream)
        runStream(shape, *built, std::move(channel));
    else
        runSingleShot(shape, *built, std::move(channel));
}

void GatewayEndpoints::runSingleShot(ReplyShape shape, const ProviderRequest& request,
                                     std::shared_ptr<IReplyChannel> channel)
{
    PendingReply pending = guardPending(channel);
    *pending = m_executor->execute(request,
        [this, shape, channel](Result<ProviderResponse> result) {
            channel->setCloseHandler(nullptr);
            if (!channel->isOpen())
                return;
            if (!result) {
                LOG_WARNING(QStringLiteral("GatewayEndpoints: upstream call failed: %1")
                                .arg(result.error().message));
                replyFailure(channel, result.error());
                return;
            }
            replyCompletion(shape, *result, channel);
        });
}

void GatewayEndpoints::runStream(ReplyShape shape, const ProviderRequest& request,
                                 std::shared_ptr<IReplyChannel> channel)
{
    PendingReply pending = guardPending(channel);
    *pending = m_executor->connectStream(request,
        [this, shape, channel](Result<StreamStart> result) {
            channel->setCloseHandler(nullptr);
            if (!channel->isOpen()) {
                if (result && result->isIncremental()) {
                    result->reply->abort();
                    result->reply->deleteLater();
                }
                return;
            }
            if (!result) {
                LOG_WARNING(QStringLiteral("GatewayEndpoints: stream setup failed: %1")
                                .arg(result.error().message));
                replyFailure(channel, result.error());
                return;
            }

            if (!result->isIncremental()) {
                if (result->buffered.isSuccess()) {
                    LOG_WARNING(QStringLiteral("GatewayEndpoints: upstream answered a streaming "
                                               "request with a complete body, replying once"));
                }
                replyCompletion(shape, result->buffered, channel);
                return;
            }

            channel->beginStream(QStringLiteral("text/event-stream"));

            auto* session = new StreamSession(result->reply, m_inbound, m_outbound,
                                              shape, channel, this);
            ++m_activeStreams;

            QPointer<StreamSession> guard(session);
            channel->setCloseHandler([guard]() {
                if (guard)
                    guard->abort();
            });
            connect(session, &StreamSession::finished, this, [this, session, channel]() {
                channel->setCloseHandler(nullptr);
                channel->endStream();
                --m_activeStreams;
                session->deleteLater();
                emit streamFinished();
            });

            session->start();
        });
}

void GatewayEndpoints::replyCompletion(ReplyShape shape, const ProviderResponse& response,
                                       const std::shared_ptr<IReplyChannel>& channel)
{
    if (!response.isSuccess()) {
        LOG_WARNING(QStringLiteral("GatewayEndpoints: upstream HTTP %1: %2")
                        .arg(response.statusCode)
                        .arg(preview(response.body)));
        replyFailure(channel, m_outbound->mapFailure(response.statusCode, response.body));
        return;
    }

    auto unit = m_outbound->parseResponse(response);
    if (!unit) {
        LOG_WARNING(QStringLiteral("GatewayEndpoints: %1").arg(unit.error().message));
        replyFailure(channel, unit.error());
        return;
    }

    auto encoded = m_inbound->encodeResponse(*unit, shape);
    if (!encoded) {
        replyFailure(channel, encoded.error());
        return;
    }
    channel->sendResponse(200, *encoded);
}

void GatewayEndpoints::handlePull(const InboundRequest& request,
                                  std::shared_ptr<IReplyChannel> channel)
{
    auto body = parseBody(request.body);
    if (!body) {
        replyFailure(channel, body.error());
        return;
    }

    QJsonValue name = body->value(QStringLiteral("name"));
    if (name.isUndefined())
        name = body->value(QStringLiteral("model"));

    QJsonObject reply;
    reply[QStringLiteral("status")] = QStringLiteral("success");
    if (!name.isUndefined())
        reply[QStringLiteral("model")] = name;

    LOG_INFO(QStringLiteral("GatewayEndpoints: pull %1 acknowledged").arg(name.toString()));
    channel->sendResponse(200, QJsonDocument(reply).toJson(QJsonDocument::Compact));
}

void GatewayEndpoints::handleTags(std::shared_ptr<IReplyChannel> channel)
{
    PendingReply pending = guardPending(channel);
    *pending = m_executor->execute(m_outbound->buildModelListRequest(),
        [this, channel](Result<ProviderResponse> result) {
            channel->setCloseHandler(nullptr);
            if (!channel->isOpen())
                return;

            if (!result || !result->isSuccess()) {
                const QString reason = result
                    ? QStringLiteral("HTTP %1: %2").arg(result->statusCode).arg(preview(result->body))
                    : result.error().message;
                LOG_WARNING(QStringLiteral("GatewayEndpoints: model list failed: %1").arg(reason));
                replyFailure(channel, DomainFailure::internal(reason));
                return;
            }

            auto models = m_outbound->parseModelList(*result);
            if (!models) {
                LOG_WARNING(QStringLiteral("GatewayEndpoints: %1").arg(models.error().message));
                replyFailure(channel, DomainFailure::internal(models.error().message));
                return;
            }

            auto encoded = m_inbound->encodeModelList(*models);
            if (!encoded) {
                replyFailure(channel, encoded.error());
                return;
            }
            channel->sendResponse(200, *encoded);
        });
}

void GatewayEndpoints::handleShow(const InboundRequest& request,
                                  std::shared_ptr<IReplyChannel> channel)
{
    auto body = parseBody(request.body);
    if (!body) {
        replyFailure(channel, body.error());
        return;
    }

    QString model = body->value(QStringLiteral("model")).toString();
    if (model.isEmpty())
        model = body->value(QStringLiteral("name")).toString();
    if (model.isEmpty()) {
        replyFailure(channel, DomainFailure::invalidInput(
            QStringLiteral("missing_model"), QStringLiteral("model is required")));
        return;
    }

    PendingReply pending = guardPending(channel);
    *pending = m_executor->execute(m_outbound->buildModelInfoRequest(model),
        [this, channel, model](Result<ProviderResponse> result) {
            channel->setCloseHandler(nullptr);
            if (!channel->isOpen())
                return;

            if (result && result->statusCode == 404) {
                replyFailure(channel, DomainFailure::notFound(
                    QStringLiteral("model not found: %1").arg(model)));
                return;
            }
            if (!result || !result->isSuccess()) {
                const QString reason = result
                    ? QStringLiteral("HTTP %1: %2").arg(result->statusCode).arg(preview(result->body))
                    : result.error().message;
                LOG_WARNING(QStringLiteral("GatewayEndpoints: model lookup for %1 failed: %2")
                                .arg(model, reason));
                replyFailure(channel, DomainFailure::internal(reason));
                return;
            }

            auto info = m_outbound->parseModelInfo(*result);
            if (!info) {
                LOG_WARNING(QStringLiteral("GatewayEndpoints: %1").arg(info.error().message));
                replyFailure(channel, DomainFailure::internal(info.error().message));
                return;
            }

            auto encoded = m_inbound->encodeModelInfo(model, *info);
            if (!encoded) {
                replyFailure(channel, encoded.error());
                return;
            }
            channel->sendResponse(200, *encoded);
        });
}

void GatewayEndpoints::handleHealth(std::shared_ptr<IReplyChannel> channel)
{
    QJsonObject reply;
    reply[QStringLiteral("status")] = QStringLiteral("healthy");
    channel->sendResponse(200, QJsonDocument(reply).toJson(QJsonDocument::Compact));
}

#pragma once
#include "request.h"
#include "response.h"
#include "failure.h"
#include "types.h"
#include <expected>
#include <functional>
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QNetworkReply>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

struct ProviderRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
};

struct ProviderResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

struct ProviderChunk {
    QByteArray data;
};

// Outcome of opening a streaming call. When the upstream answers with a
// complete (non-incremental) body, reply is null and buffered holds it.
struct StreamStart {
    QNetworkReply* reply = nullptr;
    ProviderResponse buffered;

    bool isIncremental() const { return reply != nullptr; }
};

class IInboundAdapter {
public:
    virtual ~IInboundAdapter() = default;
    virtual QString protocol() const = 0;
    virtual Result<CanonicalRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) = 0;
    virtual Result<QByteArray> encodeResponse(
        const TargetResponseUnit& response, ReplyShape shape) = 0;
    virtual Result<QByteArray> encodeStreamFrame(
        const TargetResponseUnit& delta, ReplyShape shape, FrameKind kind) = 0;
    virtual QByteArray encodeStreamError(const QJsonValue& upstreamError) = 0;
    virtual QByteArray encodeFailure(const DomainFailure& failure) = 0;
    virtual Result<QByteArray> encodeModelList(const QList<ModelInfo>& models) = 0;
    virtual Result<QByteArray> encodeModelInfo(
        const QString& requestedModel, const ModelInfo& info) = 0;
};

class IOutboundAdapter {
public:
    virtual ~IOutboundAdapter() = default;
    virtual QString adapterId() const = 0;
    virtual Result<ProviderRequest> buildRequest(
        const CanonicalRequest& request) = 0;
    virtual Result<TargetResponseUnit> parseResponse(
        const ProviderResponse& response) = 0;
    virtual Result<TargetResponseUnit> parseChunk(
        const ProviderChunk& chunk) = 0;
    virtual DomainFailure mapFailure(int httpStatus, const QByteArray& body) = 0;

    virtual ProviderRequest buildModelListRequest() const = 0;
    virtual ProviderRequest buildModelInfoRequest(const QString& modelId) const = 0;
    virtual Result<QList<ModelInfo>> parseModelList(const ProviderResponse& response) = 0;
    virtual Result<ModelInfo> parseModelInfo(const ProviderResponse& response) = 0;
};

class IExecutor {
public:
    using ResponseCallback = std::function<void(Result<ProviderResponse>)>;
    using StreamCallback = std::function<void(Result<StreamStart>)>;

    virtual ~IExecutor() = default;

    // Both calls return the pending reply (may be null) so the caller can
    // abort it; the callback runs exactly once.
    virtual QNetworkReply* execute(const ProviderRequest& request,
                                   ResponseCallback done) = 0;
    virtual QNetworkReply* connectStream(const ProviderRequest& request,
                                         StreamCallback ready) = 0;
};

// Write side of one inbound HTTP exchange.
class IReplyChannel {
public:
    virtual ~IReplyChannel() = default;
    virtual bool isOpen() const = 0;
    virtual void sendResponse(int status, const QByteArray& body,
                              const QString& contentType = QStringLiteral("application/json")) = 0;
    virtual void beginStream(const QString& contentType) = 0;
    virtual void writeChunk(const QByteArray& data) = 0;
    virtual void endStream() = 0;
    // Invoked once when the peer goes away; replaces any previous handler.
    virtual void setCloseHandler(std::function<void()> handler) = 0;
};

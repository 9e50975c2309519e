#pragma once
#include "semantic/ports.h"
#include <QDateTime>
#include <QJsonObject>

class OllamaAdapter : public IInboundAdapter {
public:
    OllamaAdapter() = default;

    QString protocol() const override;
    Result<CanonicalRequest> decodeRequest(
        const QByteArray& body,
        const QMap<QString, QString>& metadata) override;
    Result<QByteArray> encodeResponse(
        const TargetResponseUnit& response, ReplyShape shape) override;
    Result<QByteArray> encodeStreamFrame(
        const TargetResponseUnit& delta, ReplyShape shape, FrameKind kind) override;
    QByteArray encodeStreamError(const QJsonValue& upstreamError) override;
    QByteArray encodeFailure(const DomainFailure& failure) override;
    Result<QByteArray> encodeModelList(const QList<ModelInfo>& models) override;
    Result<QByteArray> encodeModelInfo(
        const QString& requestedModel, const ModelInfo& info) override;

    static GenerationOptions parseOptions(const QJsonObject& root);
    static QString isoTimestamp(qint64 epochSeconds);
    static QString isoTimestamp(const QDateTime& time);

private:
    static void attachCounts(QJsonObject& obj, const UsageEntry& counts);
    static void attachContent(QJsonObject& obj, ReplyShape shape,
                              const QString& role, const QString& content,
                              const QJsonArray& toolCalls);
};

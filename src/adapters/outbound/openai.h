#pragma once
#include "semantic/ports.h"
#include <QJsonArray>
#include <QJsonObject>

class OpenAIOutbound : public IOutboundAdapter {
public:
    OpenAIOutbound(QString baseUrl, QString apiKey);
    ~OpenAIOutbound() override = default;

    QString adapterId() const override;

    Result<ProviderRequest> buildRequest(const CanonicalRequest& request) override;
    Result<TargetResponseUnit> parseResponse(const ProviderResponse& response) override;
    Result<TargetResponseUnit> parseChunk(const ProviderChunk& chunk) override;
    DomainFailure mapFailure(int httpStatus, const QByteArray& body) override;

    ProviderRequest buildModelListRequest() const override;
    ProviderRequest buildModelInfoRequest(const QString& modelId) const override;
    Result<QList<ModelInfo>> parseModelList(const ProviderResponse& response) override;
    Result<ModelInfo> parseModelInfo(const ProviderResponse& response) override;

    QString baseUrl() const { return m_baseUrl; }

    static constexpr const char* kDefaultModel = "gpt-3.5-turbo";

protected:
    QJsonArray buildMessages(const QList<Message>& messages) const;
    void buildOptions(QJsonObject& body, const GenerationOptions& options) const;
    TargetResponseUnit parseUnit(const QJsonObject& root, const QJsonObject& choice,
                                 const QString& payloadKey) const;
    ModelInfo parseModel(const QJsonObject& model) const;
    QMap<QString, QString> baseHeaders() const;

private:
    QString m_baseUrl;
    QString m_apiKey;
};

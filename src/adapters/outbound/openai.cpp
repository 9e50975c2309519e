#include "openai.h"
#include <QJsonDocument>
#include <QUrl>

namespace {

Result<QJsonObject> parseObject(const QByteArray& data, const QString& what)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("Failed to parse OpenAI %1 JSON: %2").arg(what, err.errorString())));
    }
    if (!doc.isObject()) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("OpenAI %1 is not a JSON object").arg(what)));
    }
    return doc.object();
}

// Epoch seconds; fractional values are truncated.
qint64 epochSeconds(const QJsonValue& value)
{
    return static_cast<qint64>(value.toDouble());
}

}

OpenAIOutbound::OpenAIOutbound(QString baseUrl, QString apiKey)
    : m_baseUrl(std::move(baseUrl))
    , m_apiKey(std::move(apiKey))
{
    while (m_baseUrl.endsWith(QLatin1Char('/')))
        m_baseUrl.chop(1);
}

QString OpenAIOutbound::adapterId() const
{
    return QStringLiteral("openai");
}

QMap<QString, QString> OpenAIOutbound::baseHeaders() const
{
    QMap<QString, QString> headers;
    headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + m_apiKey;
    headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    return headers;
}

Result<ProviderRequest> OpenAIOutbound::buildRequest(const CanonicalRequest& request)
{
    if (request.messages.isEmpty()) {
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("canonical request carries no messages")));
    }

    ProviderRequest pr;
    pr.method = QStringLiteral("POST");
    pr.url = m_baseUrl + QStringLiteral("/v1/chat/completions");
    pr.headers = baseHeaders();
    pr.stream = request.stream;
    if (request.stream)
        pr.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");

    QJsonObject body;
    body[QStringLiteral("model")] = request.model.isEmpty()
        ? QString::fromLatin1(kDefaultModel) : request.model;
    body[QStringLiteral("messages")] = buildMessages(request.messages);
    body[QStringLiteral("stream")] = request.stream;
    buildOptions(body, request.options);

    pr.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return pr;
}

QJsonArray OpenAIOutbound::buildMessages(const QList<Message>& messages) const
{
    QJsonArray arr;
    for (const Message& m : messages) {
        QJsonObject msg;
        msg[QStringLiteral("role")] = m.role;
        msg[QStringLiteral("content")] = m.content;
        arr.append(msg);
    }
    return arr;
}

void OpenAIOutbound::buildOptions(QJsonObject& body, const GenerationOptions& options) const
{
    if (options.temperature.has_value()) {
        body[QStringLiteral("temperature")] = options.temperature.value();
    }
    if (options.maxTokens.has_value()) {
        body[QStringLiteral("max_tokens")] = options.maxTokens.value();
    }
    if (options.topP.has_value()) {
        body[QStringLiteral("top_p")] = options.topP.value();
    }
    if (options.frequencyPenalty.has_value()) {
        body[QStringLiteral("frequency_penalty")] = options.frequencyPenalty.value();
    }
    if (options.presencePenalty.has_value()) {
        body[QStringLiteral("presence_penalty")] = options.presencePenalty.value();
    }
    if (options.tools.has_value()) {
        body[QStringLiteral("tools")] = options.tools.value();
    }
    if (options.toolChoice.has_value()) {
        body[QStringLiteral("tool_choice")] = options.toolChoice.value();
    }
    if (options.responseFormat.has_value()) {
        body[QStringLiteral("response_format")] = options.responseFormat.value();
    }
}

TargetResponseUnit OpenAIOutbound::parseUnit(const QJsonObject& root,
                                             const QJsonObject& choice,
                                             const QString& payloadKey) const
{
    TargetResponseUnit unit;
    unit.model = root.value(QStringLiteral("model")).toString();
    unit.created = epochSeconds(root.value(QStringLiteral("created")));

    const QJsonObject payload = choice.value(payloadKey).toObject();
    unit.choice.role = payload.value(QStringLiteral("role")).toString();
    unit.choice.content = payload.value(QStringLiteral("content")).toString();
    unit.choice.toolCalls = payload.value(QStringLiteral("tool_calls")).toArray();
    unit.choice.finishReason = choice.value(QStringLiteral("finish_reason")).toString();

    const QJsonValue usageVal = root.value(QStringLiteral("usage"));
    if (usageVal.isObject()) {
        const QJsonObject usage = usageVal.toObject();
        UsageEntry entry;
        entry.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInteger();
        entry.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInteger();
        entry.totalTokens = usage.value(QStringLiteral("total_tokens")).toInteger();
        unit.usage = entry;
    }

    const QJsonValue timingsVal = root.value(QStringLiteral("timings"));
    if (timingsVal.isObject()) {
        const QJsonObject timings = timingsVal.toObject();
        TimingEntry entry;
        if (timings.value(QStringLiteral("cache_n")).isDouble())
            entry.cacheN = timings.value(QStringLiteral("cache_n")).toInteger();
        if (timings.value(QStringLiteral("predicted_n")).isDouble())
            entry.predictedN = timings.value(QStringLiteral("predicted_n")).toInteger();
        if (timings.value(QStringLiteral("prompt_ms")).isDouble())
            entry.promptMs = timings.value(QStringLiteral("prompt_ms")).toDouble();
        if (timings.value(QStringLiteral("predicted_ms")).isDouble())
            entry.predictedMs = timings.value(QStringLiteral("predicted_ms")).toDouble();
        unit.timings = entry;
    }

    return unit;
}

Result<TargetResponseUnit> OpenAIOutbound::parseResponse(const ProviderResponse& response)
{
    auto root = parseObject(response.body, QStringLiteral("response"));
    if (!root) return std::unexpected(root.error());

    const QJsonArray choices = root->value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty() || !choices.first().isObject()) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("OpenAI response carries no choices")));
    }

    return parseUnit(*root, choices.first().toObject(), QStringLiteral("message"));
}

Result<TargetResponseUnit> OpenAIOutbound::parseChunk(const ProviderChunk& chunk)
{
    auto root = parseObject(chunk.data, QStringLiteral("chunk"));
    if (!root) return std::unexpected(root.error());

    const QJsonValue error = root->value(QStringLiteral("error"));
    if (!error.isUndefined() && !error.isNull()) {
        TargetResponseUnit unit;
        unit.error = error;
        return unit;
    }

    const QJsonValue choicesVal = root->value(QStringLiteral("choices"));
    if (!choicesVal.isArray()) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("OpenAI chunk carries no choices array")));
    }

    const QJsonArray choices = choicesVal.toArray();
    if (choices.isEmpty()) {
        // usage-only trailer or keep-alive
        TargetResponseUnit unit = parseUnit(*root, QJsonObject(), QStringLiteral("delta"));
        unit.hasChoice = false;
        return unit;
    }
    if (!choices.first().isObject()) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("OpenAI chunk choice is not an object")));
    }

    return parseUnit(*root, choices.first().toObject(), QStringLiteral("delta"));
}

DomainFailure OpenAIOutbound::mapFailure(int httpStatus, const QByteArray& body)
{
    QString message;

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error == QJsonParseError::NoError && doc.isObject()) {
        const QJsonValue errorVal = doc.object().value(QStringLiteral("error"));
        if (errorVal.isObject())
            message = errorVal.toObject().value(QStringLiteral("message")).toString();
        else if (errorVal.isString())
            message = errorVal.toString();
    }

    if (message.isEmpty()) {
        message = QStringLiteral("OpenAI API error (HTTP %1)").arg(httpStatus);
    }

    return DomainFailure::upstreamHttp(httpStatus, body, message);
}

ProviderRequest OpenAIOutbound::buildModelListRequest() const
{
    ProviderRequest pr;
    pr.method = QStringLiteral("GET");
    pr.url = m_baseUrl + QStringLiteral("/v1/models");
    pr.headers = baseHeaders();
    return pr;
}

ProviderRequest OpenAIOutbound::buildModelInfoRequest(const QString& modelId) const
{
    ProviderRequest pr;
    pr.method = QStringLiteral("GET");
    pr.url = m_baseUrl + QStringLiteral("/v1/models/")
             + QString::fromUtf8(QUrl::toPercentEncoding(modelId));
    pr.headers = baseHeaders();
    return pr;
}

ModelInfo OpenAIOutbound::parseModel(const QJsonObject& model) const
{
    ModelInfo info;
    info.id = model.value(QStringLiteral("id")).toString();
    info.created = epochSeconds(model.value(QStringLiteral("created")));
    info.ownedBy = model.value(QStringLiteral("owned_by")).toString();
    return info;
}

Result<QList<ModelInfo>> OpenAIOutbound::parseModelList(const ProviderResponse& response)
{
    auto root = parseObject(response.body, QStringLiteral("model list"));
    if (!root) return std::unexpected(root.error());

    const QJsonValue data = root->value(QStringLiteral("data"));
    if (!data.isArray()) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("OpenAI model list carries no data array")));
    }

    QList<ModelInfo> models;
    for (const QJsonValue& item : data.toArray()) {
        if (!item.isObject())
            continue;
        ModelInfo info = parseModel(item.toObject());
        if (!info.id.isEmpty())
            models.append(info);
    }
    return models;
}

Result<ModelInfo> OpenAIOutbound::parseModelInfo(const ProviderResponse& response)
{
    auto root = parseObject(response.body, QStringLiteral("model"));
    if (!root) return std::unexpected(root.error());
    return parseModel(*root);
}

#include "adapters/inbound/ollama.h"
#include "adapters/inbound/message_normalizer.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QTimeZone>
#include <algorithm>
#include <limits>

namespace {

std::optional<double> numberOption(const QJsonObject& options, const QString& key)
{
    const QJsonValue value = options.value(key);
    if (!value.isDouble())
        return std::nullopt;
    return value.toDouble();
}

std::optional<QJsonValue> verbatimOption(const QJsonValue& value)
{
    if (value.isUndefined() || value.isNull())
        return std::nullopt;
    return value;
}

}

QString OllamaAdapter::protocol() const
{
    return QStringLiteral("ollama");
}

QString OllamaAdapter::isoTimestamp(qint64 epochSeconds)
{
    return isoTimestamp(QDateTime::fromSecsSinceEpoch(epochSeconds, QTimeZone::utc()));
}

QString OllamaAdapter::isoTimestamp(const QDateTime& time)
{
    return time.toUTC().toString(Qt::ISODateWithMs);
}

GenerationOptions OllamaAdapter::parseOptions(const QJsonObject& root)
{
    GenerationOptions opts;
    const QJsonObject options = root.value(QStringLiteral("options")).toObject();

    opts.temperature = numberOption(options, QStringLiteral("temperature"));
    opts.topP = numberOption(options, QStringLiteral("top_p"));
    opts.presencePenalty = numberOption(options, QStringLiteral("presence_penalty"));

    // -1 (infinite) and -2 (fill context) have no chat-completions equivalent
    if (auto numPredict = numberOption(options, QStringLiteral("num_predict")); numPredict && *numPredict > 0)
        opts.maxTokens = static_cast<int>(
            std::min(*numPredict, double(std::numeric_limits<int>::max())));

    if (auto repeat = numberOption(options, QStringLiteral("repeat_penalty")))
        opts.frequencyPenalty = *repeat - 1.0;

    const QJsonValue tools = root.value(QStringLiteral("tools"));
    if (tools.isArray() && !tools.toArray().isEmpty())
        opts.tools = tools;

    opts.toolChoice = verbatimOption(options.value(QStringLiteral("tool_choice")));
    opts.responseFormat = verbatimOption(options.value(QStringLiteral("response_format")));
    return opts;
}

Result<CanonicalRequest> OllamaAdapter::decodeRequest(
    const QByteArray& body,
    const QMap<QString, QString>& metadata)
{
    Q_UNUSED(metadata);

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_json"),
            QStringLiteral("Request body is not valid JSON: %1").arg(parseErr.errorString())));
    }

    const QJsonObject root = doc.object();
    CanonicalRequest req;
    req.model = root.value(QStringLiteral("model")).toString();
    req.stream = root.value(QStringLiteral("stream")).toBool(false);

    MessageNormalizer::Outcome normalized = MessageNormalizer::normalize(root);
    req.messages = std::move(normalized.messages);
    req.messagesSynthesized = normalized.synthesized;
    req.messagesFromList = normalized.fromMessageList;

    req.options = parseOptions(root);
    return req;
}

void OllamaAdapter::attachCounts(QJsonObject& obj, const UsageEntry& counts)
{
    obj[QStringLiteral("prompt_eval_count")] = counts.promptTokens;
    obj[QStringLiteral("eval_count")] = counts.completionTokens;
    obj[QStringLiteral("total_tokens")] = counts.totalTokens;
}

void OllamaAdapter::attachContent(QJsonObject& obj, ReplyShape shape,
                                  const QString& role, const QString& content,
                                  const QJsonArray& toolCalls)
{
    if (shape == ReplyShape::Generate) {
        obj[QStringLiteral("response")] = content;
        return;
    }

    QJsonObject message;
    message[QStringLiteral("role")] = role.isEmpty() ? QStringLiteral("assistant") : role;
    message[QStringLiteral("content")] = content;
    if (!toolCalls.isEmpty())
        message[QStringLiteral("tool_calls")] = toolCalls;
    obj[QStringLiteral("message")] = message;
}

Result<QByteArray> OllamaAdapter::encodeResponse(const TargetResponseUnit& response, ReplyShape shape)
{
    QJsonObject root;
    root[QStringLiteral("model")] = response.model;
    root[QStringLiteral("created_at")] = isoTimestamp(response.created);
    attachContent(root, shape, response.choice.role, response.choice.content,
                  response.choice.toolCalls);
    root[QStringLiteral("done")] = response.choice.finishReason == QStringLiteral("stop");
    attachCounts(root, response.tokenCounts());

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

Result<QByteArray> OllamaAdapter::encodeStreamFrame(
    const TargetResponseUnit& delta, ReplyShape shape, FrameKind kind)
{
    QJsonObject frame;
    frame[QStringLiteral("model")] = delta.model;
    frame[QStringLiteral("created_at")] = delta.created > 0
        ? isoTimestamp(delta.created)
        : isoTimestamp(QDateTime::currentDateTimeUtc());

    if (kind == FrameKind::Opening) {
        attachContent(frame, shape, QStringLiteral("assistant"), QString(), QJsonArray());
        frame[QStringLiteral("done")] = false;
        return QJsonDocument(frame).toJson(QJsonDocument::Compact);
    }

    attachContent(frame, shape, delta.choice.role, delta.choice.content, delta.choice.toolCalls);

    if (kind == FrameKind::Content) {
        frame[QStringLiteral("done")] = false;
        if (delta.usage.has_value())
            attachCounts(frame, *delta.usage);
        return QJsonDocument(frame).toJson(QJsonDocument::Compact);
    }

    frame[QStringLiteral("done")] = true;
    frame[QStringLiteral("done_reason")] = QStringLiteral("stop");
    frame[QStringLiteral("context")] = QJsonArray();
    attachCounts(frame, delta.tokenCounts());
    if (delta.timings.has_value()) {
        if (delta.timings->promptMs.has_value())
            frame[QStringLiteral("prompt_eval_duration")] = *delta.timings->promptMs;
        if (delta.timings->predictedMs.has_value())
            frame[QStringLiteral("eval_duration")] = *delta.timings->predictedMs;
    }
    return QJsonDocument(frame).toJson(QJsonDocument::Compact);
}

QByteArray OllamaAdapter::encodeStreamError(const QJsonValue& upstreamError)
{
    QJsonObject root;
    root[QStringLiteral("error")] = upstreamError;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray OllamaAdapter::encodeFailure(const DomainFailure& failure)
{
    return failure.toBody();
}

Result<QByteArray> OllamaAdapter::encodeModelList(const QList<ModelInfo>& models)
{
    const QString now = isoTimestamp(QDateTime::currentDateTimeUtc());

    QJsonArray entries;
    for (const ModelInfo& model : models) {
        QJsonObject entry;
        entry[QStringLiteral("name")] = model.id;
        entry[QStringLiteral("modified_at")] = model.created > 0 ? isoTimestamp(model.created) : now;
        entry[QStringLiteral("size")] = 0;
        entries.append(entry);
    }

    QJsonObject root;
    root[QStringLiteral("models")] = entries;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

Result<QByteArray> OllamaAdapter::encodeModelInfo(const QString& requestedModel,
                                                  const ModelInfo& info)
{
    QJsonObject details;
    details[QStringLiteral("format")] = QStringLiteral("openai");
    details[QStringLiteral("family")] = QStringLiteral("gpt");
    details[QStringLiteral("families")] = QJsonArray{QStringLiteral("gpt")};
    details[QStringLiteral("parameter_size")] = QStringLiteral("unknown");
    details[QStringLiteral("quantization_level")] = QStringLiteral("unknown");

    QJsonObject root;
    root[QStringLiteral("model")] = requestedModel;
    root[QStringLiteral("details")] = details;
    root[QStringLiteral("modified_at")] = info.created > 0
        ? isoTimestamp(info.created)
        : isoTimestamp(QDateTime::currentDateTimeUtc());
    root[QStringLiteral("size")] = 0;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

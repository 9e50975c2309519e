#include "message_normalizer.h"
#include <QJsonArray>
#include <QRegularExpression>

namespace {

bool isNonEmptyString(const QJsonValue& value)
{
    return value.isString() && !value.toString().isEmpty();
}

}

MessageNormalizer::Outcome MessageNormalizer::normalize(const QJsonObject& body)
{
    Outcome out;

    out.messages = fromMessages(body.value(QStringLiteral("messages")));
    out.fromMessageList = !out.messages.isEmpty();
    if (out.messages.isEmpty())
        out.messages = fromSystem(body.value(QStringLiteral("system")));
    if (out.messages.isEmpty())
        out.messages = fromPrompt(body.value(QStringLiteral("prompt")));
    if (out.messages.isEmpty())
        out.messages = fromHistory(body.value(QStringLiteral("history")));

    if (out.messages.isEmpty()) {
        out.messages.append(Message{QStringLiteral("user"), QString()});
        out.synthesized = true;
    }
    return out;
}

QList<Message> MessageNormalizer::fromMessages(const QJsonValue& messages)
{
    QList<Message> out;
    if (!messages.isArray())
        return out;

    for (const QJsonValue& entry : messages.toArray()) {
        const QJsonObject obj = entry.toObject();
        const QJsonValue role = obj.value(QStringLiteral("role"));
        const QJsonValue content = obj.value(QStringLiteral("content"));
        if (!isNonEmptyString(role) || !isNonEmptyString(content))
            continue;
        out.append(Message{role.toString(), content.toString()});
    }
    return out;
}

QList<Message> MessageNormalizer::fromSystem(const QJsonValue& system)
{
    if (!isNonEmptyString(system))
        return {};
    return {Message{QStringLiteral("system"), system.toString()}};
}

QList<Message> MessageNormalizer::fromPrompt(const QJsonValue& prompt)
{
    if (!isNonEmptyString(prompt))
        return {};

    const QString text = prompt.toString();
    if (!hasPromptTags(text))
        return {Message{QStringLiteral("user"), text}};
    return parseTaggedPrompt(text);
}

QList<Message> MessageNormalizer::fromHistory(const QJsonValue& history)
{
    QList<Message> out;
    if (!history.isArray())
        return out;

    for (const QJsonValue& entry : history.toArray()) {
        const QJsonObject obj = entry.toObject();
        const QString role = obj.value(QStringLiteral("role")).toString();
        if (role != QStringLiteral("user") && role != QStringLiteral("assistant"))
            continue;
        out.append(Message{role, obj.value(QStringLiteral("content")).toString()});
    }
    return out;
}

bool MessageNormalizer::hasPromptTags(const QString& prompt)
{
    return prompt.contains(QStringLiteral("<user>"))
        || prompt.contains(QStringLiteral("<assistant>"));
}

QList<Message> MessageNormalizer::parseTaggedPrompt(const QString& prompt)
{
    static const QRegularExpression tagPattern(QStringLiteral("<(/?)(user|assistant)>"));

    QList<Message> out;
    QString role;
    QString span;
    bool open = false;

    auto flush = [&]() {
        const QString trimmed = span.trimmed();
        if (open && !trimmed.isEmpty())
            out.append(Message{role, trimmed});
        span.clear();
    };

    qsizetype pos = 0;
    auto it = tagPattern.globalMatch(prompt);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();

        // Text outside an open span is dropped.
        if (open)
            span += prompt.mid(pos, match.capturedStart() - pos);
        pos = match.capturedEnd();

        const bool closing = !match.captured(1).isEmpty();
        if (closing) {
            flush();
            open = false;
            continue;
        }

        flush();
        role = match.captured(2);
        open = true;
    }

    // An unterminated trailing span still counts, under the last role seen.
    if (open) {
        span += prompt.mid(pos);
        flush();
    }
    return out;
}

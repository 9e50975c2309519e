#pragma once
#include "semantic/request.h"
#include <QJsonObject>
#include <QJsonValue>
#include <QList>

// Turns the many legal shapes of an Ollama request body into one ordered
// message list. Sources are tried in order and the first one that yields
// at least one message wins: messages, system, prompt, history.
class MessageNormalizer {
public:
    struct Outcome {
        QList<Message> messages;
        bool synthesized = false;
        bool fromMessageList = false;
    };

    static Outcome normalize(const QJsonObject& body);

    static QList<Message> fromMessages(const QJsonValue& messages);
    static QList<Message> fromSystem(const QJsonValue& system);
    static QList<Message> fromPrompt(const QJsonValue& prompt);
    static QList<Message> fromHistory(const QJsonValue& history);

    static bool hasPromptTags(const QString& prompt);
    static QList<Message> parseTaggedPrompt(const QString& prompt);
};

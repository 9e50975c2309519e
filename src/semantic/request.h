#pragma once
#include <QJsonValue>
#include <QList>
#include <QString>
#include <optional>

// Roles are kept as the client sent them; the normalizer only produces
// "system", "user" and "assistant" on its own.
struct Message {
    QString role;
    QString content;

    bool operator==(const Message& other) const {
        return role == other.role && content == other.content;
    }
};

struct GenerationOptions {
    std::optional<double> temperature;
    std::optional<int> maxTokens;
    std::optional<double> topP;
    std::optional<double> frequencyPenalty;
    std::optional<double> presencePenalty;
    std::optional<QJsonValue> tools;
    std::optional<QJsonValue> toolChoice;
    std::optional<QJsonValue> responseFormat;
};

struct CanonicalRequest {
    QString model;
    QList<Message> messages;
    bool stream = false;
    // true when no source in the body produced a message and the single
    // empty user message was synthesized
    bool messagesSynthesized = false;
    // true when the body's own "messages" array produced the list
    bool messagesFromList = false;
    GenerationOptions options;
};

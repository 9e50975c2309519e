#pragma once
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

struct UsageEntry {
    qint64 promptTokens = 0;
    qint64 completionTokens = 0;
    qint64 totalTokens = 0;
};

// llama.cpp server extension carried next to (or instead of) "usage"
struct TimingEntry {
    std::optional<qint64> cacheN;
    std::optional<qint64> predictedN;
    std::optional<double> promptMs;
    std::optional<double> predictedMs;
};

struct ChoiceUnit {
    QString role;
    QString content;
    QJsonArray toolCalls;
    QString finishReason;   // empty while the upstream reports null

    bool isFinished() const { return !finishReason.isEmpty(); }
};

// One complete completion object, or one incremental delta of a stream.
struct TargetResponseUnit {
    QString model;
    qint64 created = 0;
    ChoiceUnit choice;
    std::optional<UsageEntry> usage;
    std::optional<TimingEntry> timings;
    QJsonValue error = QJsonValue(QJsonValue::Undefined);
    bool hasChoice = true;

    bool isError() const { return !error.isUndefined() && !error.isNull(); }

    // usage block first, then engine timings, then zeros
    UsageEntry tokenCounts() const;
};

struct ModelInfo {
    QString id;
    qint64 created = 0;
    QString ownedBy;
};

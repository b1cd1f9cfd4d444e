#pragma once
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

struct Message {
    QString role;
    QString content;
    std::optional<QString> name;
    std::optional<QJsonArray> toolCalls;
};

struct ChatRequest {
    QString model;
    QList<Message> messages;
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> n;
    std::optional<bool> stream;
    std::optional<QStringList> stop;
    bool stopAsString = false;   // arrived as a bare string, re-emitted as one
    std::optional<int> maxTokens;
    std::optional<double> presencePenalty;
    std::optional<double> frequencyPenalty;
    std::optional<QString> user;
    std::optional<QJsonArray> tools;
    std::optional<QJsonValue> toolChoice;
    QJsonObject extra;  // unrecognized top-level fields

    bool isStreaming() const { return stream.value_or(false); }
};

struct Usage {
    quint32 promptTokens = 0;
    quint32 completionTokens = 0;
    quint32 totalTokens = 0;
};

struct Choice {
    int index = 0;
    Message message;
    std::optional<QString> finishReason;
};

struct ChatResponse {
    QString id;
    QString object = QStringLiteral("chat.completion");
    qint64 created = 0;
    QString model;
    QList<Choice> choices;
    Usage usage;
};

// At most one of role/content is set on any emitted delta.
struct Delta {
    std::optional<QString> role;
    std::optional<QString> content;
};

struct ChatChunk {
    QString id;
    QString object = QStringLiteral("chat.completion.chunk");
    qint64 created = 0;
    QString model;
    Delta delta;
    std::optional<QString> finishReason;
};

struct ModelDescriptor {
    QString id;
    QString object = QStringLiteral("model");
    qint64 created = 0;
    QString ownedBy;
};

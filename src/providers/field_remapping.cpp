#include "field_remapping.h"
#include "wire/codec.h"
#include "wire/identifiers.h"
#include "core/log_manager.h"
#include <QJsonArray>
#include <cmath>
#include <limits>
#include <optional>

QString FieldRemappingProvider::latestUserQuestion(const QList<Message>& messages)
{
    for (auto it = messages.crbegin(); it != messages.crend(); ++it) {
        if (it->role == QStringLiteral("user"))
            return it->content;
    }
    return QString();
}

QJsonArray FieldRemappingProvider::conversationContext(const QList<Message>& messages)
{
    QJsonArray context;
    for (const Message& message : messages) {
        QJsonObject turn;
        turn.insert(QStringLiteral("role"), message.role);
        turn.insert(QStringLiteral("content"), message.content);
        context.append(turn);
    }
    return context;
}

Usage FieldRemappingProvider::estimateUsage(const QString& text)
{
    // Roughly four bytes of UTF-8 per token.
    const qsizetype bytes = text.toUtf8().size();
    Usage usage;
    usage.promptTokens = 0;
    usage.completionTokens = static_cast<quint32>((bytes + 3) / 4);
    usage.totalTokens = usage.promptTokens + usage.completionTokens;
    return usage;
}

QJsonObject FieldRemappingProvider::transformRequest(const ChatRequest& request) const
{
    const QString question = latestUserQuestion(request.messages);
    if (question.isEmpty())
        LOG_DEBUG(QStringLiteral("[%1] no user message in %2 turns, sending empty question")
                      .arg(id()).arg(request.messages.size()));

    const QJsonArray context = conversationContext(request.messages);
    LOG_DEBUG(QStringLiteral("[%1] context withheld from backend: %2 turns")
                  .arg(id()).arg(context.size()));

    QJsonObject payload;
    payload.insert(QStringLiteral("question"), question);
    return payload;
}

Result<QString> FieldRemappingProvider::extractStreamingText(const BackendPayload& payload) const
{
    const QJsonValue data = payload.value(QStringLiteral("data"));
    if (!data.isObject())
        return std::unexpected(GatewayError::transform(
            QStringLiteral("missing 'data' field in response: %1").arg(payloadSnapshot(payload))));

    const QJsonValue text = data.toObject().value(QStringLiteral("text"));
    if (!text.isString())
        return std::unexpected(GatewayError::transform(
            QStringLiteral("missing 'data.text' field in response: %1").arg(payloadSnapshot(payload))));
    return text.toString();
}

Result<ChatResponse> FieldRemappingProvider::transformResponse(const BackendPayload& payload,
                                                               const QString& model) const
{
    auto text = extractStreamingText(payload);
    if (!text)
        return std::unexpected(text.error());

    Usage usage;
    const QJsonValue usageValue = payload.value(QStringLiteral("usage"));
    if (usageValue.isObject()) {
        const QJsonObject counts = usageValue.toObject();
        // A count that is not a whole number in quint32 range counts as absent.
        auto count = [&counts](const char* key) -> std::optional<quint32> {
            const QJsonValue value = counts.value(QLatin1String(key));
            if (!value.isDouble())
                return std::nullopt;
            const double number = value.toDouble();
            if (!(number >= 0.0) || number > static_cast<double>(std::numeric_limits<quint32>::max())
                || std::floor(number) != number)
                return std::nullopt;
            return static_cast<quint32>(number);
        };
        usage.promptTokens = count("prompt_tokens").value_or(0);
        usage.completionTokens = count("completion_tokens").value_or(0);
        const quint64 sum = quint64(usage.promptTokens) + usage.completionTokens;
        usage.totalTokens = count("total_tokens").value_or(
            static_cast<quint32>(qMin<quint64>(sum, std::numeric_limits<quint32>::max())));
    } else {
        usage = estimateUsage(*text);
    }

    Choice choice;
    choice.index = 0;
    choice.message.role = QStringLiteral("assistant");
    choice.message.content = *text;
    choice.finishReason = QStringLiteral("stop");

    ChatResponse response;
    response.id = wire_ids::generateChatId();
    response.created = wire_ids::currentTimestamp();
    response.model = model;
    response.choices.append(choice);
    response.usage = usage;
    return response;
}

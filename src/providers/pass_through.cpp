#include "pass_through.h"
#include "wire/codec.h"
#include "core/log_manager.h"
#include <QJsonArray>

QJsonObject PassThroughProvider::transformRequest(const ChatRequest& request) const
{
    QJsonObject payload = wire_codec::encodeChatRequest(request);
    if (payload.isEmpty()) {
        LOG_ERROR(QStringLiteral("[%1] request for model '%2' serialized to an empty object")
                      .arg(id(), request.model));
        return {};
    }
    return payload;
}

Result<ChatResponse> PassThroughProvider::transformResponse(const BackendPayload& payload,
                                                            const QString& model) const
{
    Q_UNUSED(model);
    auto decoded = wire_codec::decodeChatResponse(payload);
    if (!decoded) {
        return std::unexpected(GatewayError::transform(
            QStringLiteral("failed to parse chat-completion response: %1; payload: %2")
                .arg(decoded.error(), payloadSnapshot(payload))));
    }
    return *decoded;
}

Result<QString> PassThroughProvider::extractStreamingText(const BackendPayload& payload) const
{
    const QJsonValue choices = payload.value(QStringLiteral("choices"));
    if (!choices.isArray() || choices.toArray().isEmpty())
        return std::unexpected(GatewayError::transform(
            QStringLiteral("missing choices in response: %1").arg(payloadSnapshot(payload))));

    const QJsonValue message = choices.toArray().first().toObject().value(QStringLiteral("message"));
    if (!message.isObject())
        return std::unexpected(GatewayError::transform(
            QStringLiteral("missing choices[0].message in response: %1").arg(payloadSnapshot(payload))));

    const QJsonValue content = message.toObject().value(QStringLiteral("content"));
    if (!content.isString())
        return std::unexpected(GatewayError::transform(
            QStringLiteral("missing choices[0].message.content in response: %1")
                .arg(payloadSnapshot(payload))));
    return content.toString();
}

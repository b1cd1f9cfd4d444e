#include "provider.h"
#include "wire/codec.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonParseError>

namespace {

constexpr int kSnapshotLimit = 512;

QString bodyExcerpt(const QByteArray& body)
{
    QString text = QString::fromUtf8(body.left(kSnapshotLimit));
    if (body.size() > kSnapshotLimit)
        text += QStringLiteral("...");
    return text;
}

}

QString Provider::payloadSnapshot(const QJsonObject& payload)
{
    return bodyExcerpt(wire_codec::toCompactJson(payload));
}

void Provider::fetchBackendPayload(IBackendExecutor& client,
                                   const GatewayConfig& config,
                                   const ChatRequest& request,
                                   QObject* context,
                                   PayloadHandler handler) const
{
    BackendRequest outbound;
    outbound.url = QUrl(config.backend.endpoint);
    outbound.headers.insert(QStringLiteral("Content-Type"), QStringLiteral("application/json"));
    outbound.body = wire_codec::toCompactJson(transformRequest(request));

    LOG_DEBUG(QStringLiteral("[%1] POST %2 (%3 bytes)")
                  .arg(id(), config.backend.endpoint).arg(outbound.body.size()));

    const QString providerId = id();
    client.post(outbound, context, [providerId, handler = std::move(handler)](Result<BackendReply> reply) {
        if (!reply) {
            LOG_ERROR(QStringLiteral("[%1] %2").arg(providerId, reply.error().message));
            handler(std::unexpected(reply.error()));
            return;
        }

        if (!reply->isSuccess()) {
            LOG_ERROR(QStringLiteral("[%1] backend returned HTTP %2: %3")
                          .arg(providerId).arg(reply->statusCode).arg(bodyExcerpt(reply->body)));
            handler(std::unexpected(GatewayError::backend(
                QStringLiteral("backend returned HTTP %1").arg(reply->statusCode))));
            return;
        }

        QJsonParseError err;
        const QJsonDocument doc = QJsonDocument::fromJson(reply->body, &err);
        if (err.error != QJsonParseError::NoError || !doc.isObject()) {
            const QString reason = err.error != QJsonParseError::NoError
                ? err.errorString() : QStringLiteral("top-level value is not an object");
            LOG_ERROR(QStringLiteral("[%1] backend body is not a JSON object (%2): %3")
                          .arg(providerId, reason, bodyExcerpt(reply->body)));
            handler(std::unexpected(GatewayError::backend(
                QStringLiteral("failed to parse backend response: %1").arg(reason))));
            return;
        }

        handler(doc.object());
    });
}

void Provider::handleRequest(IBackendExecutor& client,
                             const GatewayConfig& config,
                             const ChatRequest& request,
                             QObject* context,
                             ResponseHandler handler) const
{
    const QString model = request.model;
    fetchBackendPayload(client, config, request, context,
                        [this, model, handler = std::move(handler)](Result<BackendPayload> payload) {
        if (!payload) {
            handler(std::unexpected(payload.error()));
            return;
        }
        auto response = transformResponse(*payload, model);
        if (!response)
            LOG_ERROR(QStringLiteral("[%1] %2").arg(id(), response.error().message));
        handler(std::move(response));
    });
}

#pragma once
#include "gateway/ports.h"
#include "config/config_types.h"
#include "wire/codec.h"
#include <QJsonDocument>
#include <QPointer>
#include <QTimer>
#include <optional>

// Backend double. Replies on the next event-loop turn, or holds the call
// until release() when `deferred` is set. Either way a destroyed context
// drops the reply, as the real executor does.
class StubExecutor : public IBackendExecutor {
public:
    int calls = 0;
    bool deferred = false;
    BackendRequest lastRequest;
    Result<BackendReply> nextReply = BackendReply{200, {}, QByteArray("{}")};

    void post(const BackendRequest& request, QObject* context, ReplyHandler handler) override {
        ++calls;
        lastRequest = request;
        if (deferred) {
            m_pendingContext = context;
            m_hasContext = context != nullptr;
            m_pending = std::move(handler);
            return;
        }
        const Result<BackendReply> reply = nextReply;
        if (context)
            QTimer::singleShot(0, context, [handler, reply]() { handler(reply); });
        else
            QTimer::singleShot(0, [handler, reply]() { handler(reply); });
    }

    bool hasPending() const { return static_cast<bool>(m_pending); }

    // False when the caller cancelled (context destroyed) in the meantime.
    bool release() {
        if (!m_pending)
            return false;
        ReplyHandler handler = std::move(m_pending);
        m_pending = nullptr;
        if (m_hasContext && !m_pendingContext)
            return false;
        handler(nextReply);
        return true;
    }

    void replyJson(int status, const QJsonObject& body) {
        nextReply = BackendReply{status, {}, QJsonDocument(body).toJson(QJsonDocument::Compact)};
    }
    void replyRaw(int status, const QByteArray& body) {
        nextReply = BackendReply{status, {}, body};
    }
    void replyError(const GatewayError& error) {
        nextReply = std::unexpected(error);
    }

private:
    ReplyHandler m_pending;
    QPointer<QObject> m_pendingContext;
    bool m_hasContext = false;
};

inline GatewayConfig testGatewayConfig()
{
    GatewayConfig config;
    config.backend.endpoint = QStringLiteral("https://backend.test/api/v1/infer");
    config.backend.provider = QStringLiteral("rhel_lightspeed");
    config.backend.timeoutMs = 2000;
    config.backend.auth.certFile = QStringLiteral("/nonexistent/cert.pem");
    config.backend.auth.keyFile = QStringLiteral("/nonexistent/key.pem");
    config.proxy.host = QStringLiteral("127.0.0.1");
    config.proxy.port = 0;
    config.proxy.allowedOrigins = {QStringLiteral("http://localhost:3000")};
    config.proxy.streamDelayMs = 1;
    config.models = GatewayConfig::defaultModels();
    return config;
}

inline QJsonObject remappedReply(const QString& text)
{
    QJsonObject data;
    data.insert(QStringLiteral("text"), text);
    QJsonObject root;
    root.insert(QStringLiteral("data"), data);
    return root;
}

inline ChatRequest userRequest(const QString& model, const QString& question, bool stream = false)
{
    ChatRequest request;
    request.model = model;
    request.messages.append(Message{QStringLiteral("user"), question, std::nullopt, std::nullopt});
    if (stream)
        request.stream = true;
    return request;
}

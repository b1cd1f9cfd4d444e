#pragma once
#include "provider.h"

// Backend speaks the chat-completion schema already (lightspeed_core).
class PassThroughProvider : public Provider {
public:
    static QString key() { return QStringLiteral("lightspeed_core"); }

    QString id() const override { return key(); }
    QJsonObject transformRequest(const ChatRequest& request) const override;
    Result<ChatResponse> transformResponse(const BackendPayload& payload,
                                           const QString& model) const override;
    Result<QString> extractStreamingText(const BackendPayload& payload) const override;
};

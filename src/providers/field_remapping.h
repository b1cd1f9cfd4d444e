#pragma once
#include "provider.h"

// Question/answer backend (rhel_lightspeed): sends {"question": ...} built
// from the latest user turn, reads the answer from data.text.
class FieldRemappingProvider : public Provider {
public:
    static QString key() { return QStringLiteral("rhel_lightspeed"); }

    QString id() const override { return key(); }
    QJsonObject transformRequest(const ChatRequest& request) const override;
    Result<ChatResponse> transformResponse(const BackendPayload& payload,
                                           const QString& model) const override;
    Result<QString> extractStreamingText(const BackendPayload& payload) const override;

    static QString latestUserQuestion(const QList<Message>& messages);
    // Role/content of every turn. Computed for diagnostics only; the
    // backend contract takes a single question.
    static QJsonArray conversationContext(const QList<Message>& messages);
    static Usage estimateUsage(const QString& text);
};

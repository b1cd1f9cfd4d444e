#pragma once
#include "wire/types.h"
#include "gateway/failure.h"
#include "gateway/ports.h"
#include "config/config_types.h"
#include <QJsonObject>
#include <functional>

// Backend body after JSON parsing, before any variant-specific extraction.
using BackendPayload = QJsonObject;

class Provider {
public:
    using PayloadHandler = std::function<void(Result<BackendPayload>)>;
    using ResponseHandler = std::function<void(Result<ChatResponse>)>;

    virtual ~Provider() = default;

    virtual QString id() const = 0;

    // Never fails; problems degrade to a partial payload and a log line.
    virtual QJsonObject transformRequest(const ChatRequest& request) const = 0;
    virtual Result<ChatResponse> transformResponse(const BackendPayload& payload,
                                                   const QString& model) const = 0;
    virtual Result<QString> extractStreamingText(const BackendPayload& payload) const = 0;

    // One outbound call: transform, POST, status check, JSON parse. The
    // streaming path stops here and extracts the text itself.
    void fetchBackendPayload(IBackendExecutor& client,
                             const GatewayConfig& config,
                             const ChatRequest& request,
                             QObject* context,
                             PayloadHandler handler) const;

    // fetchBackendPayload followed by transformResponse.
    void handleRequest(IBackendExecutor& client,
                       const GatewayConfig& config,
                       const ChatRequest& request,
                       QObject* context,
                       ResponseHandler handler) const;

protected:
    // Compact JSON cut to a loggable length.
    static QString payloadSnapshot(const QJsonObject& payload);
};

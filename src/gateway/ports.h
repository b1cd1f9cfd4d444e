#pragma once
#include "failure.h"
#include <QByteArray>
#include <QMap>
#include <QObject>
#include <QString>
#include <QUrl>
#include <functional>

struct BackendRequest {
    QUrl url;
    QMap<QString, QString> headers;
    QByteArray body;
};

struct BackendReply {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

using ReplyHandler = std::function<void(Result<BackendReply>)>;

// Outbound transport. A non-2xx status is a successful transport result;
// only connection failures (Backend) and expiry of the per-call budget
// (Timeout) come back as errors.
class IBackendExecutor {
public:
    virtual ~IBackendExecutor() = default;

    // `handler` runs exactly once on the caller's event loop, unless
    // `context` is destroyed first: then the call is aborted and the
    // handler is dropped without being invoked.
    virtual void post(const BackendRequest& request,
                      QObject* context,
                      ReplyHandler handler) = 0;
};

#pragma once
#include <QString>
#include <QJsonObject>
#include <QtGlobal>
#include <expected>

enum class ErrorKind : quint8 {
    Backend,          // 502
    Transform,        // 500
    Timeout,          // 504
    RateLimited,      // 429
    InvalidInput,     // 400
    Forbidden,        // 403
    NotFound,         // 404
    MethodNotAllowed, // 405
    PayloadTooLarge,  // 413
    NotSupported,     // 501
    Config,           // startup only
    Internal          // 500
};

// `message` is the internal diagnostic. It goes to the log, never to the
// caller: toJson() only carries the generic client message for the kind.
struct GatewayError {
    ErrorKind kind = ErrorKind::Internal;
    QString   message;

    int httpStatus() const;
    QString typeTag() const;
    QString clientMessage() const;
    QJsonObject toJson() const;

    static GatewayError backend(const QString& msg);
    static GatewayError transform(const QString& msg);
    static GatewayError timeout(const QString& msg);
    static GatewayError rateLimited(const QString& msg);
    static GatewayError invalidInput(const QString& msg);
    static GatewayError forbidden(const QString& msg);
    static GatewayError notFound(const QString& msg);
    static GatewayError methodNotAllowed(const QString& msg);
    static GatewayError payloadTooLarge(const QString& msg);
    static GatewayError notSupported(const QString& msg);
    static GatewayError config(const QString& msg);
    static GatewayError internal(const QString& msg);
};

template<typename T>
using Result = std::expected<T, GatewayError>;

using VoidResult = std::expected<void, GatewayError>;

#include "failure.h"

int GatewayError::httpStatus() const {
    switch (kind) {
    case ErrorKind::Backend:          return 502;
    case ErrorKind::Transform:        return 500;
    case ErrorKind::Timeout:          return 504;
    case ErrorKind::RateLimited:      return 429;
    case ErrorKind::InvalidInput:     return 400;
    case ErrorKind::Forbidden:        return 403;
    case ErrorKind::NotFound:         return 404;
    case ErrorKind::MethodNotAllowed: return 405;
    case ErrorKind::PayloadTooLarge:  return 413;
    case ErrorKind::NotSupported:     return 501;
    case ErrorKind::Config:
    case ErrorKind::Internal:
    default:                          return 500;
    }
}

QString GatewayError::typeTag() const {
    switch (kind) {
    case ErrorKind::Backend:          return QStringLiteral("backend_error");
    case ErrorKind::Transform:        return QStringLiteral("transform_error");
    case ErrorKind::Timeout:          return QStringLiteral("timeout_error");
    case ErrorKind::RateLimited:      return QStringLiteral("rate_limit_error");
    case ErrorKind::InvalidInput:
    case ErrorKind::MethodNotAllowed:
    case ErrorKind::PayloadTooLarge:  return QStringLiteral("invalid_request_error");
    case ErrorKind::Forbidden:        return QStringLiteral("cors_error");
    case ErrorKind::NotFound:         return QStringLiteral("not_found_error");
    case ErrorKind::NotSupported:     return QStringLiteral("not_supported_error");
    case ErrorKind::Config:           return QStringLiteral("config_error");
    case ErrorKind::Internal:
    default:                          return QStringLiteral("internal_error");
    }
}

QString GatewayError::clientMessage() const {
    switch (kind) {
    case ErrorKind::Backend:
        return QStringLiteral("The backend service failed to handle the request");
    case ErrorKind::Transform:
        return QStringLiteral("The backend response could not be translated");
    case ErrorKind::Timeout:
        return QStringLiteral("The backend did not respond in time");
    case ErrorKind::RateLimited:
        return QStringLiteral("Too many requests");
    case ErrorKind::InvalidInput:
        // Describes the caller's own payload, nothing from the backend.
        return message.isEmpty() ? QStringLiteral("Invalid request") : message;
    case ErrorKind::Forbidden:
        return QStringLiteral("Origin not allowed");
    case ErrorKind::NotFound:
        return QStringLiteral("Route not found");
    case ErrorKind::MethodNotAllowed:
        return QStringLiteral("Method not allowed");
    case ErrorKind::PayloadTooLarge:
        return QStringLiteral("Request body too large");
    case ErrorKind::NotSupported:
        return QStringLiteral("Chunked request bodies are not supported");
    case ErrorKind::Config:
    case ErrorKind::Internal:
    default:
        return QStringLiteral("Internal error");
    }
}

QJsonObject GatewayError::toJson() const {
    QJsonObject err;
    err["message"] = clientMessage();
    err["type"] = typeTag();
    QJsonObject root;
    root["error"] = err;
    return root;
}

GatewayError GatewayError::backend(const QString& msg) {
    return {ErrorKind::Backend, msg};
}

GatewayError GatewayError::transform(const QString& msg) {
    return {ErrorKind::Transform, msg};
}

GatewayError GatewayError::timeout(const QString& msg) {
    return {ErrorKind::Timeout, msg};
}

GatewayError GatewayError::rateLimited(const QString& msg) {
    return {ErrorKind::RateLimited, msg};
}

GatewayError GatewayError::invalidInput(const QString& msg) {
    return {ErrorKind::InvalidInput, msg};
}

GatewayError GatewayError::forbidden(const QString& msg) {
    return {ErrorKind::Forbidden, msg};
}

GatewayError GatewayError::notFound(const QString& msg) {
    return {ErrorKind::NotFound, msg};
}

GatewayError GatewayError::methodNotAllowed(const QString& msg) {
    return {ErrorKind::MethodNotAllowed, msg};
}

GatewayError GatewayError::payloadTooLarge(const QString& msg) {
    return {ErrorKind::PayloadTooLarge, msg};
}

GatewayError GatewayError::notSupported(const QString& msg) {
    return {ErrorKind::NotSupported, msg};
}

GatewayError GatewayError::config(const QString& msg) {
    return {ErrorKind::Config, msg};
}

GatewayError GatewayError::internal(const QString& msg) {
    return {ErrorKind::Internal, msg};
}

#pragma once
#include "wire/types.h"
#include <QString>
#include <QStringList>
#include <QMap>
#include <QList>

struct BackendAuth {
    QString certFile;
    QString keyFile;
};

struct BackendConfig {
    QString endpoint;
    QString provider = QStringLiteral("rhel_lightspeed");
    int timeoutMs = 30000;
    BackendAuth auth;
    QMap<QString, QString> proxies;   // scheme ("http"/"https") -> proxy URL
};

struct RateLimitConfig {
    double rate = 10.0;   // tokens per second
    int burst = 20;
};

struct ServerConfig {
    QString host = QStringLiteral("127.0.0.1");
    int port = 8080;
    QStringList allowedOrigins;
    RateLimitConfig rateLimit;
    qint64 maxBodyBytes = 1024 * 1024;
    int streamDelayMs = 20;
};

struct LoggingConfig {
    QString level = QStringLiteral("info");
    QString file;
};

// Immutable after startup; shared by const reference.
struct GatewayConfig {
    BackendConfig backend;
    ServerConfig proxy;
    QList<ModelDescriptor> models;
    LoggingConfig logging;

    static QList<ModelDescriptor> defaultModels() {
        ModelDescriptor model;
        model.id = QStringLiteral("default-model");
        model.created = 1234567890;
        model.ownedBy = QStringLiteral("clad");
        return {model};
    }
};

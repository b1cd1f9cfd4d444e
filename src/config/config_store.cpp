#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QUrl>
#include <QtGlobal>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback = QString())
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

double jsonDoubleEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, double fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toDouble(fallback);
}

constexpr int kMaxTimeoutMs = 24 * 60 * 60 * 1000;

// Out-of-range values map to -1 or kMaxTimeoutMs + 1 so validate() rejects them.
int boundedTimeoutMs(double ms)
{
    if (!(ms > 0.0))
        return -1;
    if (ms > kMaxTimeoutMs)
        return kMaxTimeoutMs + 1;
    return static_cast<int>(ms);
}

bool isHttpUrl(const QString& text)
{
    const QUrl url(text, QUrl::StrictMode);
    if (!url.isValid() || url.host().isEmpty())
        return false;
    const QString scheme = url.scheme().toLower();
    return scheme == QStringLiteral("http") || scheme == QStringLiteral("https");
}

BackendConfig parseBackend(const QJsonObject& obj)
{
    BackendConfig backend;
    backend.endpoint = obj.value(QStringLiteral("endpoint")).toString().trimmed();
    backend.provider = obj.value(QStringLiteral("provider")).toString(backend.provider).trimmed();

    // "timeout" is in seconds; "timeout_ms" takes precedence when both exist.
    const QJsonValue timeoutMs = jsonValueEither(obj, "timeout_ms", "timeoutMs");
    if (!timeoutMs.isUndefined())
        backend.timeoutMs = boundedTimeoutMs(timeoutMs.toDouble(-1));
    else if (obj.contains(QStringLiteral("timeout")))
        backend.timeoutMs = boundedTimeoutMs(obj.value(QStringLiteral("timeout")).toDouble(-1) * 1000.0);

    const QJsonObject auth = obj.value(QStringLiteral("auth")).toObject();
    backend.auth.certFile = jsonStringEither(auth, "cert_file", "certFile").trimmed();
    backend.auth.keyFile = jsonStringEither(auth, "key_file", "keyFile").trimmed();

    const QJsonObject proxies = obj.value(QStringLiteral("proxies")).toObject();
    for (auto it = proxies.constBegin(); it != proxies.constEnd(); ++it) {
        const QString url = it.value().toString().trimmed();
        if (!url.isEmpty())
            backend.proxies.insert(it.key().trimmed().toLower(), url);
    }
    return backend;
}

ServerConfig parseServer(const QJsonObject& obj)
{
    ServerConfig server;
    server.host = obj.value(QStringLiteral("host")).toString(server.host).trimmed();
    server.port = obj.value(QStringLiteral("port")).toInt(server.port);

    const QJsonArray origins = jsonValueEither(obj, "allowed_origins", "allowedOrigins").toArray();
    for (const QJsonValue& origin : origins) {
        const QString text = origin.toString().trimmed();
        if (!text.isEmpty() && !server.allowedOrigins.contains(text))
            server.allowedOrigins.append(text);
    }

    const QJsonObject rateLimit = jsonValueEither(obj, "rate_limit", "rateLimit").toObject();
    server.rateLimit.rate = rateLimit.value(QStringLiteral("rate")).toDouble(server.rateLimit.rate);
    server.rateLimit.burst = rateLimit.value(QStringLiteral("burst")).toInt(server.rateLimit.burst);

    server.maxBodyBytes = static_cast<qint64>(
        jsonDoubleEither(obj, "max_body_bytes", "maxBodyBytes",
                         static_cast<double>(server.maxBodyBytes)));
    server.streamDelayMs = jsonIntEither(obj, "stream_delay_ms", "streamDelayMs", server.streamDelayMs);
    return server;
}

QList<ModelDescriptor> parseModels(const QJsonValue& value)
{
    if (!value.isArray())
        return GatewayConfig::defaultModels();

    QList<ModelDescriptor> models;
    for (const QJsonValue& item : value.toArray()) {
        const QJsonObject obj = item.toObject();
        ModelDescriptor model;
        model.id = obj.value(QStringLiteral("id")).toString().trimmed();
        if (model.id.isEmpty())
            continue;
        model.created = obj.value(QStringLiteral("created")).toInteger(1234567890);
        model.ownedBy = jsonStringEither(obj, "owned_by", "ownedBy", QStringLiteral("clad"));
        models.append(model);
    }
    return models.isEmpty() ? GatewayConfig::defaultModels() : models;
}

}

Result<GatewayConfig> ConfigStore::load(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(GatewayError::config(
            QStringLiteral("cannot open config file %1: %2").arg(path, file.errorString())));
    }

    auto parsed = parse(file.readAll());
    if (!parsed)
        return std::unexpected(GatewayError::config(
            QStringLiteral("%1: %2").arg(path, parsed.error().message)));

    auto valid = validate(*parsed);
    if (!valid)
        return std::unexpected(GatewayError::config(
            QStringLiteral("%1: %2").arg(path, valid.error().message)));

    m_filePath = path;
    m_config = *parsed;
    LOG_INFO(QStringLiteral("ConfigStore: loaded %1").arg(path));
    return m_config;
}

Result<GatewayConfig> ConfigStore::parse(const QByteArray& json)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(GatewayError::config(
            QStringLiteral("invalid JSON: %1").arg(err.errorString())));
    }

    const QJsonObject root = doc.object();
    GatewayConfig config;
    config.backend = parseBackend(root.value(QStringLiteral("backend")).toObject());
    config.proxy = parseServer(root.value(QStringLiteral("proxy")).toObject());
    config.models = parseModels(root.value(QStringLiteral("models")));

    const QJsonObject logging = root.value(QStringLiteral("logging")).toObject();
    config.logging.level = logging.value(QStringLiteral("level")).toString(config.logging.level);
    config.logging.file = logging.value(QStringLiteral("file")).toString().trimmed();
    return config;
}

VoidResult ConfigStore::validate(const GatewayConfig& config)
{
    const BackendConfig& backend = config.backend;
    if (!isHttpUrl(backend.endpoint))
        return std::unexpected(GatewayError::config(
            QStringLiteral("backend.endpoint must be an http(s) URL, got '%1'").arg(backend.endpoint)));
    if (backend.provider.isEmpty())
        return std::unexpected(GatewayError::config(QStringLiteral("backend.provider is empty")));
    if (backend.timeoutMs <= 0)
        return std::unexpected(GatewayError::config(QStringLiteral("backend.timeout must be positive")));
    if (backend.timeoutMs > kMaxTimeoutMs)
        return std::unexpected(GatewayError::config(
            QStringLiteral("backend.timeout must not exceed %1 s").arg(kMaxTimeoutMs / 1000)));
    if (backend.auth.certFile.isEmpty() || backend.auth.keyFile.isEmpty())
        return std::unexpected(GatewayError::config(
            QStringLiteral("backend.auth.cert_file and backend.auth.key_file are required")));

    for (auto it = backend.proxies.cbegin(); it != backend.proxies.cend(); ++it) {
        if (it.key() != QStringLiteral("http") && it.key() != QStringLiteral("https"))
            return std::unexpected(GatewayError::config(
                QStringLiteral("backend.proxies: unsupported scheme '%1'").arg(it.key())));
        if (!isHttpUrl(it.value()))
            return std::unexpected(GatewayError::config(
                QStringLiteral("backend.proxies.%1 is not a valid URL").arg(it.key())));
    }

    const ServerConfig& server = config.proxy;
    if (server.host.isEmpty())
        return std::unexpected(GatewayError::config(QStringLiteral("proxy.host is empty")));
    if (server.port < 0 || server.port > 65535)
        return std::unexpected(GatewayError::config(
            QStringLiteral("proxy.port %1 is out of range").arg(server.port)));
    if (server.allowedOrigins.isEmpty())
        return std::unexpected(GatewayError::config(
            QStringLiteral("proxy.allowed_origins is empty; list every origin allowed to call the gateway")));
    if (!(server.rateLimit.rate > 0.0))
        return std::unexpected(GatewayError::config(
            QStringLiteral("proxy.rate_limit.rate must be positive")));
    if (server.rateLimit.burst < 1)
        return std::unexpected(GatewayError::config(
            QStringLiteral("proxy.rate_limit.burst must be at least 1")));
    if (server.maxBodyBytes <= 0)
        return std::unexpected(GatewayError::config(
            QStringLiteral("proxy.max_body_bytes must be positive")));
    if (server.streamDelayMs < 0)
        return std::unexpected(GatewayError::config(
            QStringLiteral("proxy.stream_delay_ms must not be negative")));

    if (!LogManager::parseLevel(config.logging.level, nullptr))
        return std::unexpected(GatewayError::config(
            QStringLiteral("logging.level '%1' is not one of debug, info, warn, error")
                .arg(config.logging.level)));

    return {};
}

QString ConfigStore::defaultConfigPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_DIRS");
    base = base.section(QLatin1Char(':'), 0, 0).trimmed();
    if (base.isEmpty())
        base = QStringLiteral("/etc/xdg");
    return base + QStringLiteral("/clad/config.json");
}

#include "bootstrap.h"
#include "log_manager.h"
#include "gateway/authenticated_client.h"
#include "gateway/qt_executor.h"
#include "gateway/rate_limiter.h"
#include "providers/provider_registry.h"
#include "proxy/gateway_server.h"

Bootstrap::Bootstrap(QObject* parent)
    : QObject(parent)
{
}

Bootstrap::~Bootstrap()
{
    stopAll();
}

bool Bootstrap::isProxyRunning() const {
    return m_server && m_server->isRunning();
}

VoidResult Bootstrap::fail(const QString& step, const GatewayError& error)
{
    LOG_ERROR(QStringLiteral("startup failed at %1: %2").arg(step, error.message));
    emit stepProgress(step, false, error.message);
    emit proxyStatusChanged(false);
    return std::unexpected(error);
}

VoidResult Bootstrap::startAll(const QString& configPath) {
    LOG_INFO(QStringLiteral("========== starting clad =========="));

    // config
    LOG_INFO(QStringLiteral("[1/5] loading configuration from %1").arg(configPath));
    auto loaded = m_configStore.load(configPath);
    if (!loaded)
        return fail(QStringLiteral("config"), loaded.error());
    const GatewayConfig& config = m_configStore.config();

    LogManager::Level level = LogManager::Info;
    LogManager::parseLevel(config.logging.level, &level);   // checked by ConfigStore::validate
    if (!LogManager::instance().initialize(config.logging.file, level))
        return fail(QStringLiteral("logging"), GatewayError::config(
            QStringLiteral("cannot open log file %1").arg(config.logging.file)));
    emit stepProgress(QStringLiteral("config"), true, configPath);

    // provider
    LOG_INFO(QStringLiteral("[2/5] selecting provider '%1'").arg(config.backend.provider));
    auto provider = ProviderRegistry::withBuiltins().create(config.backend.provider);
    if (!provider)
        return fail(QStringLiteral("provider"), provider.error());
    m_provider = std::move(*provider);
    emit stepProgress(QStringLiteral("provider"), true, m_provider->id());

    // identity + executor
    LOG_INFO(QStringLiteral("[3/5] loading client identity"));
    auto executor = AuthenticatedClient::create(config.backend);
    if (!executor)
        return fail(QStringLiteral("identity"), executor.error());
    m_executor = std::move(*executor);
    emit stepProgress(QStringLiteral("identity"), true, config.backend.auth.certFile);

    // admission control
    LOG_INFO(QStringLiteral("[4/5] rate limit %1/s, burst %2")
                 .arg(config.proxy.rateLimit.rate).arg(config.proxy.rateLimit.burst));
    m_rateLimiter = std::make_unique<RateLimiter>(config.proxy.rateLimit);

    // server
    LOG_INFO(QStringLiteral("[5/5] starting gateway server"));
    m_server = std::make_unique<GatewayServer>(config, *m_executor, *m_provider, *m_rateLimiter);
    connect(m_server.get(), &GatewayServer::statusChanged, this, &Bootstrap::proxyStatusChanged);
    if (!m_server->start()) {
        m_server.reset();
        return fail(QStringLiteral("listen"), GatewayError::config(
            QStringLiteral("cannot listen on %1:%2").arg(config.proxy.host).arg(config.proxy.port)));
    }
    emit stepProgress(QStringLiteral("listen"), true,
                      QStringLiteral("%1:%2").arg(config.proxy.host).arg(m_server->serverPort()));

    LOG_INFO(QStringLiteral("========== clad ready on %1:%2 ==========")
                 .arg(config.proxy.host).arg(m_server->serverPort()));
    return {};
}

void Bootstrap::stopAll() {
    if (!m_server)
        return;
    LOG_INFO(QStringLiteral("========== stopping clad =========="));
    m_server->stop();
    m_server.reset();
    m_rateLimiter.reset();
    m_executor.reset();
    m_provider.reset();
}

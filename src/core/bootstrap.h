#pragma once
#include "config/config_store.h"
#include "gateway/failure.h"
#include <QObject>
#include <memory>

class QtBackendExecutor;
class Provider;
class RateLimiter;
class GatewayServer;

// Builds the process-wide objects once, in dependency order, and refuses to
// bind when any of them cannot be built.
class Bootstrap : public QObject {
    Q_OBJECT

public:
    explicit Bootstrap(QObject* parent = nullptr);
    ~Bootstrap() override;

    VoidResult startAll(const QString& configPath);
    void stopAll();

    bool isProxyRunning() const;
    const GatewayConfig& config() const { return m_configStore.config(); }
    GatewayServer* server() const { return m_server.get(); }

signals:
    void stepProgress(const QString& step, bool success, const QString& message);
    void proxyStatusChanged(bool running);

private:
    VoidResult fail(const QString& step, const GatewayError& error);

    ConfigStore m_configStore;
    std::unique_ptr<QtBackendExecutor> m_executor;
    std::unique_ptr<Provider> m_provider;
    std::unique_ptr<RateLimiter> m_rateLimiter;
    std::unique_ptr<GatewayServer> m_server;
};

#pragma once
#include "ports.h"
#include <QMap>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkProxyFactory>
#include <QSslConfiguration>
#include <memory>
#include <optional>

class QNetworkReply;

// Picks the upstream proxy by the request URL's scheme.
class SchemeProxyFactory : public QNetworkProxyFactory {
public:
    explicit SchemeProxyFactory(const QMap<QString, QNetworkProxy>& proxies);
    QList<QNetworkProxy> queryProxy(const QNetworkProxyQuery& query) override;

    static std::optional<QNetworkProxy> proxyFromUrl(const QString& url);

private:
    QMap<QString, QNetworkProxy> m_proxies;
};

// One instance per process; its QNetworkAccessManager keeps the connection
// cache that every request shares.
class QtBackendExecutor : public IBackendExecutor {
public:
    QtBackendExecutor(const QSslConfiguration& sslConfig, int requestTimeoutMs);
    ~QtBackendExecutor() override;

    void post(const BackendRequest& request, QObject* context, ReplyHandler handler) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    int requestTimeout() const { return m_requestTimeout; }
    void setUpstreamProxies(const QMap<QString, QNetworkProxy>& proxies);
    const QSslConfiguration& sslConfiguration() const { return m_sslConfig; }

private:
    std::unique_ptr<QNetworkAccessManager> m_nam;
    QSslConfiguration m_sslConfig;
    int m_requestTimeout = 30000;

    QNetworkRequest buildQtRequest(const BackendRequest& request) const;
    Result<BackendReply> collectReply(QNetworkReply* reply) const;
};

#include "qt_executor.h"
#include "core/log_manager.h"
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

SchemeProxyFactory::SchemeProxyFactory(const QMap<QString, QNetworkProxy>& proxies)
    : m_proxies(proxies)
{
}

QList<QNetworkProxy> SchemeProxyFactory::queryProxy(const QNetworkProxyQuery& query)
{
    const QString scheme = query.url().scheme().toLower();
    auto it = m_proxies.constFind(scheme);
    if (it != m_proxies.constEnd())
        return {it.value()};
    return {QNetworkProxy(QNetworkProxy::NoProxy)};
}

std::optional<QNetworkProxy> SchemeProxyFactory::proxyFromUrl(const QString& url)
{
    const QUrl parsed(url, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.host().isEmpty())
        return std::nullopt;

    const QString scheme = parsed.scheme().toLower();
    QNetworkProxy::ProxyType type = QNetworkProxy::HttpProxy;
    if (scheme == QStringLiteral("socks5") || scheme == QStringLiteral("socks5h"))
        type = QNetworkProxy::Socks5Proxy;
    else if (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))
        return std::nullopt;

    const int defaultPort = type == QNetworkProxy::Socks5Proxy ? 1080 : 3128;
    return QNetworkProxy(type, parsed.host(),
                         static_cast<quint16>(parsed.port(defaultPort)),
                         parsed.userName(), parsed.password());
}

QtBackendExecutor::QtBackendExecutor(const QSslConfiguration& sslConfig, int requestTimeoutMs)
    : m_nam(std::make_unique<QNetworkAccessManager>())
    , m_sslConfig(sslConfig)
    , m_requestTimeout(requestTimeoutMs)
{
}

QtBackendExecutor::~QtBackendExecutor() = default;

void QtBackendExecutor::setUpstreamProxies(const QMap<QString, QNetworkProxy>& proxies)
{
    if (proxies.isEmpty()) {
        m_nam->setProxyFactory(nullptr);
        return;
    }
    // QNetworkAccessManager takes ownership of the factory.
    m_nam->setProxyFactory(new SchemeProxyFactory(proxies));
}

QNetworkRequest QtBackendExecutor::buildQtRequest(const BackendRequest& request) const {
    QNetworkRequest req{request.url};
    req.setSslConfiguration(m_sslConfig);

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setRawHeader("Accept", "application/json");

    // No transfer timeout: the per-call timer in post() owns the budget.
    req.setTransferTimeout(0);
    return req;
}

Result<BackendReply> QtBackendExecutor::collectReply(QNetworkReply* reply) const {
    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);

    // HTTP-level errors still carry a status and a body; hand them back so
    // the caller can log the body and classify the status.
    if (!statusAttr.isValid()) {
        if (reply->error() == QNetworkReply::TimeoutError)
            return std::unexpected(GatewayError::timeout(
                QStringLiteral("backend transfer timed out: %1").arg(reply->errorString())));
        return std::unexpected(GatewayError::backend(
            QStringLiteral("failed to send request to backend: %1").arg(reply->errorString())));
    }

    BackendReply resp;
    resp.statusCode = statusAttr.toInt();
    resp.body = reply->readAll();
    for (const auto& header : reply->rawHeaderList())
        resp.headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));
    return resp;
}

void QtBackendExecutor::post(const BackendRequest& request, QObject* context, ReplyHandler handler) {
    QNetworkReply* reply = m_nam->post(buildQtRequest(request), request.body);

    struct CallState {
        bool timedOut = false;
        bool cancelled = false;
    };
    auto state = std::make_shared<CallState>();

    auto* timeoutTimer = new QTimer(reply);
    timeoutTimer->setSingleShot(true);
    QObject::connect(timeoutTimer, &QTimer::timeout, reply, [reply, state]() {
        state->timedOut = true;
        reply->abort();
    });
    timeoutTimer->start(m_requestTimeout);

    if (context) {
        QObject::connect(context, &QObject::destroyed, reply, [reply, state]() {
            state->cancelled = true;
            reply->abort();
        });
    }

    const QString target = request.url.toString(QUrl::RemoveUserInfo);
    const int budget = m_requestTimeout;
    QObject::connect(reply, &QNetworkReply::finished, reply,
                     [this, reply, state, timeoutTimer, handler = std::move(handler), target, budget]() {
        timeoutTimer->stop();
        reply->deleteLater();

        if (state->cancelled) {
            LOG_DEBUG(QStringLiteral("QtBackendExecutor: call to %1 cancelled by caller").arg(target));
            return;
        }
        if (state->timedOut) {
            LOG_WARNING(QStringLiteral("QtBackendExecutor: call to %1 exceeded %2 ms, aborted")
                            .arg(target).arg(budget));
            handler(std::unexpected(GatewayError::timeout(
                QStringLiteral("backend call exceeded %1 ms").arg(budget))));
            return;
        }
        handler(collectReply(reply));
    });
}

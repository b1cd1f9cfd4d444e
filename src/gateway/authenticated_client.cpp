#include "authenticated_client.h"
#include "core/log_manager.h"
#include <QFile>
#include <QFileInfo>
#include <QSslConfiguration>
#include <QSslSocket>

namespace {

Result<QByteArray> readPem(const QString& path, const char* what)
{
    QFile file(path);
    if (!file.exists())
        return std::unexpected(GatewayError::config(
            QStringLiteral("%1 file not found: %2").arg(QLatin1String(what), path)));
    if (!file.open(QIODevice::ReadOnly))
        return std::unexpected(GatewayError::config(
            QStringLiteral("cannot read %1 file %2: %3")
                .arg(QLatin1String(what), path, file.errorString())));
    return file.readAll();
}

}

bool AuthenticatedClient::warnIfExposed(const QString& path)
{
    const QFileDevice::Permissions perms = QFileInfo(path).permissions();
    if (!(perms & (QFileDevice::ReadGroup | QFileDevice::ReadOther)))
        return false;
    LOG_WARNING(QStringLiteral("AuthenticatedClient: %1 is readable by group or others; "
                               "restrict it to the service user (chmod 600)").arg(path));
    return true;
}

Result<ClientIdentity> AuthenticatedClient::loadIdentity(const BackendAuth& auth)
{
    auto certPem = readPem(auth.certFile, "certificate");
    if (!certPem)
        return std::unexpected(certPem.error());
    auto keyPem = readPem(auth.keyFile, "private key");
    if (!keyPem)
        return std::unexpected(keyPem.error());

    warnIfExposed(auth.certFile);
    warnIfExposed(auth.keyFile);

    const QList<QSslCertificate> certs = QSslCertificate::fromData(*certPem, QSsl::Pem);
    if (certs.isEmpty() || certs.first().isNull())
        return std::unexpected(GatewayError::config(
            QStringLiteral("no PEM certificate found in %1").arg(auth.certFile)));

    ClientIdentity identity;
    identity.certificate = certs.first();
    identity.chain = certs.mid(1);

    for (QSsl::KeyAlgorithm algorithm : {QSsl::Rsa, QSsl::Ec}) {
        QSslKey key(*keyPem, algorithm, QSsl::Pem, QSsl::PrivateKey);
        if (!key.isNull()) {
            identity.privateKey = key;
            break;
        }
    }
    if (identity.privateKey.isNull())
        return std::unexpected(GatewayError::config(
            QStringLiteral("%1 does not hold an unencrypted PEM RSA or EC private key")
                .arg(auth.keyFile)));

    LOG_DEBUG(QStringLiteral("AuthenticatedClient: identity %1 (expires %2)")
                  .arg(identity.certificate.subjectDisplayName(),
                       identity.certificate.expiryDate().toString(Qt::ISODate)));
    return identity;
}

Result<QMap<QString, QNetworkProxy>> AuthenticatedClient::buildProxies(const QMap<QString, QString>& urls)
{
    QMap<QString, QNetworkProxy> proxies;
    for (auto it = urls.constBegin(); it != urls.constEnd(); ++it) {
        auto proxy = SchemeProxyFactory::proxyFromUrl(it.value());
        if (!proxy)
            return std::unexpected(GatewayError::config(
                QStringLiteral("invalid %1 proxy URL '%2'").arg(it.key(), it.value())));
        proxies.insert(it.key(), *proxy);
    }
    return proxies;
}

Result<std::unique_ptr<QtBackendExecutor>> AuthenticatedClient::create(const BackendConfig& config)
{
    auto identity = loadIdentity(config.auth);
    if (!identity)
        return std::unexpected(identity.error());

    auto proxies = buildProxies(config.proxies);
    if (!proxies)
        return std::unexpected(proxies.error());

    QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
    ssl.setLocalCertificate(identity->certificate);
    if (!identity->chain.isEmpty()) {
        QList<QSslCertificate> chain{identity->certificate};
        chain.append(identity->chain);
        ssl.setLocalCertificateChain(chain);
    }
    ssl.setPrivateKey(identity->privateKey);
    ssl.setPeerVerifyMode(QSslSocket::VerifyPeer);

    auto executor = std::make_unique<QtBackendExecutor>(ssl, config.timeoutMs);
    executor->setUpstreamProxies(*proxies);

    LOG_INFO(QStringLiteral("AuthenticatedClient: backend %1, timeout %2 ms, %3 upstream prox%4")
                 .arg(config.endpoint).arg(config.timeoutMs)
                 .arg(proxies->size()).arg(proxies->size() == 1 ? QStringLiteral("y") : QStringLiteral("ies")));
    return executor;
}

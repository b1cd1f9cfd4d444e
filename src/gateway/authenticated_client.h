#pragma once
#include "qt_executor.h"
#include "config/config_types.h"
#include <QSslCertificate>
#include <QSslKey>
#include <memory>

struct ClientIdentity {
    QSslCertificate certificate;
    QList<QSslCertificate> chain;   // intermediates following the leaf in the PEM file
    QSslKey privateKey;
};

// Builds the single outbound executor the process uses: client certificate
// identity for mutual TLS, per-call timeout, per-scheme upstream proxies.
class AuthenticatedClient {
public:
    static Result<std::unique_ptr<QtBackendExecutor>> create(const BackendConfig& config);

    static Result<ClientIdentity> loadIdentity(const BackendAuth& auth);
    static Result<QMap<QString, QNetworkProxy>> buildProxies(const QMap<QString, QString>& urls);

    // True (and a warning is logged) when group or others may read the file.
    static bool warnIfExposed(const QString& path);
};

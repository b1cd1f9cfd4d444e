#pragma once
#include "config_types.h"
#include "gateway/failure.h"
#include <QByteArray>

class ConfigStore {
public:
    Result<GatewayConfig> load(const QString& path);

    const GatewayConfig& config() const { return m_config; }
    QString filePath() const { return m_filePath; }

    static Result<GatewayConfig> parse(const QByteArray& json);
    static VoidResult validate(const GatewayConfig& config);

    // First entry of $XDG_CONFIG_DIRS (default /etc/xdg) + /clad/config.json
    static QString defaultConfigPath();

private:
    GatewayConfig m_config;
    QString m_filePath;
};

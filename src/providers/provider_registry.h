#pragma once
#include "provider.h"
#include <QMap>
#include <QStringList>
#include <functional>
#include <memory>

class ProviderRegistry {
public:
    using Factory = std::function<std::unique_ptr<Provider>()>;

    // Registry pre-populated with lightspeed_core and rhel_lightspeed.
    static ProviderRegistry withBuiltins();

    void registerFactory(const QString& key, Factory factory);

    // Unknown key -> Config error naming the valid keys.
    Result<std::unique_ptr<Provider>> create(const QString& key) const;

    QStringList keys() const { return m_factories.keys(); }

private:
    QMap<QString, Factory> m_factories;
};

#include "provider_registry.h"
#include "pass_through.h"
#include "field_remapping.h"

ProviderRegistry ProviderRegistry::withBuiltins()
{
    ProviderRegistry registry;
    registry.registerFactory(PassThroughProvider::key(),
                             [] { return std::make_unique<PassThroughProvider>(); });
    registry.registerFactory(FieldRemappingProvider::key(),
                             [] { return std::make_unique<FieldRemappingProvider>(); });
    return registry;
}

void ProviderRegistry::registerFactory(const QString& key, Factory factory)
{
    m_factories.insert(key.trimmed().toLower(), std::move(factory));
}

Result<std::unique_ptr<Provider>> ProviderRegistry::create(const QString& key) const
{
    auto it = m_factories.constFind(key.trimmed().toLower());
    if (it == m_factories.constEnd()) {
        return std::unexpected(GatewayError::config(
            QStringLiteral("unknown provider '%1'; valid providers: %2")
                .arg(key, keys().join(QStringLiteral(", ")))));
    }
    return it.value()();
}

#include "request_router.h"
#include "core/log_manager.h"

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    addRoute({QStringLiteral("POST"), QStringLiteral("/v1/chat/completions"),
              RouteTarget::ChatCompletions});
    addRoute({QStringLiteral("GET"), QStringLiteral("/v1/models"), RouteTarget::Models});
    addRoute({QStringLiteral("GET"), QStringLiteral("/health"), RouteTarget::Health});

    LOG_DEBUG(QStringLiteral("RequestRouter: registered %1 default routes")
                  .arg(m_routes.size()));
}

void RequestRouter::addRoute(const Route& route)
{
    Route entry = route;
    entry.method = route.method.trimmed().toUpper();
    m_routes.append(entry);
}

QStringList RequestRouter::allowedMethods(const QString& path) const
{
    QStringList methods;
    for (const Route& entry : m_routes) {
        if (entry.path == path && !methods.contains(entry.method))
            methods.append(entry.method);
    }
    return methods;
}

Result<Route> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();

    if (normalizedMethod == QStringLiteral("OPTIONS"))
        return Route{normalizedMethod, path, RouteTarget::Preflight};

    bool pathKnown = false;
    for (const Route& entry : m_routes) {
        if (entry.path != path)
            continue;
        pathKnown = true;
        if (entry.method == normalizedMethod)
            return entry;
    }

    if (pathKnown)
        return std::unexpected(GatewayError::methodNotAllowed(
            QStringLiteral("%1 %2").arg(normalizedMethod, path)));
    return std::unexpected(GatewayError::notFound(
        QStringLiteral("%1 %2").arg(normalizedMethod, path)));
}

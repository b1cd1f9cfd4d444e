#pragma once
#include "gateway/failure.h"
#include <QString>
#include <QList>

enum class RouteTarget {
    ChatCompletions,
    Models,
    Health,
    Preflight
};

struct Route {
    QString method;
    QString path;
    RouteTarget target;
};

class RequestRouter {
public:
    void registerDefaults();
    void addRoute(const Route& route);

    // OPTIONS on any path resolves to Preflight. Unknown path -> NotFound;
    // known path with another method -> MethodNotAllowed.
    Result<Route> match(const QString& method, const QString& path) const;

    QStringList allowedMethods(const QString& path) const;

private:
    QList<Route> m_routes;
};

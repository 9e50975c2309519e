#include "request_router.h"
#include "core/log_manager.h"

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    addRoute({QStringLiteral("POST"), QStringLiteral("/api/generate"), Endpoint::Generate});
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/chat"), Endpoint::Chat});
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/pull"), Endpoint::Pull});
    addRoute({QStringLiteral("GET"), QStringLiteral("/api/tags"), Endpoint::Tags});
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/show"), Endpoint::Show});
    addRoute({QStringLiteral("GET"), QStringLiteral("/health"), Endpoint::Health});

    LOG_DEBUG(QStringLiteral("RequestRouter: registered %1 default routes")
                  .arg(m_routes.size()));
}

void RequestRouter::addRoute(const Route& route)
{
    InternalRoute entry;
    entry.route = route;
    entry.method = route.method.isEmpty() ? QStringLiteral("*") : route.method.trimmed().toUpper();

    // Handle wildcard paths: "/some/prefix/*"
    if (route.pathPattern.endsWith(QLatin1Char('*'))) {
        entry.wildcard = true;
        entry.pathPrefix = route.pathPattern.left(route.pathPattern.size() - 1);
    } else {
        entry.wildcard = false;
        entry.pathPrefix = route.pathPattern;
    }

    m_routes.append(entry);
}

std::optional<Route> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();

    // Query strings never take part in routing
    QString routePath = path;
    const qsizetype query = routePath.indexOf(QLatin1Char('?'));
    if (query >= 0)
        routePath.truncate(query);

    for (const InternalRoute& entry : m_routes) {
        if (entry.method != QStringLiteral("*") && entry.method != normalizedMethod) {
            continue;
        }

        if (entry.wildcard) {
            if (routePath.startsWith(entry.pathPrefix)) {
                return entry.route;
            }
        } else {
            if (routePath == entry.pathPrefix) {
                return entry.route;
            }
        }
    }

    return std::nullopt;
}

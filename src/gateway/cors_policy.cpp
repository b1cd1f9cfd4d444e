#include "cors_policy.h"

namespace {

// Origins compare without a trailing slash and case-insensitively on
// scheme and host.
QString normalizeOrigin(const QString& origin)
{
    QString text = origin.trimmed();
    while (text.endsWith(QLatin1Char('/')))
        text.chop(1);
    return text.toLower();
}

}

CorsPolicy::CorsPolicy(const QStringList& allowedOrigins)
{
    for (const QString& origin : allowedOrigins) {
        const QString normalized = normalizeOrigin(origin);
        if (!normalized.isEmpty())
            m_allowed.insert(normalized);
    }
}

CorsPolicy::Verdict CorsPolicy::evaluate(const QString& origin) const
{
    if (origin.trimmed().isEmpty())
        return Verdict::NotCrossOrigin;
    return m_allowed.contains(normalizeOrigin(origin)) ? Verdict::Allowed : Verdict::Rejected;
}

HeaderList CorsPolicy::responseHeaders(const QString& origin, bool preflight)
{
    HeaderList headers;
    headers.append({"Access-Control-Allow-Origin", origin.trimmed().toUtf8()});
    headers.append({"Vary", "Origin"});
    if (preflight) {
        headers.append({"Access-Control-Allow-Methods", "GET, POST, OPTIONS"});
        headers.append({"Access-Control-Allow-Headers", "Content-Type, Authorization"});
        headers.append({"Access-Control-Max-Age", "600"});
    }
    return headers;
}

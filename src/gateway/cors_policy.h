#pragma once
#include <QByteArray>
#include <QList>
#include <QPair>
#include <QSet>
#include <QString>
#include <QStringList>

using HeaderList = QList<QPair<QByteArray, QByteArray>>;

class CorsPolicy {
public:
    enum class Verdict {
        NotCrossOrigin,   // no Origin header
        Allowed,
        Rejected
    };

    explicit CorsPolicy(const QStringList& allowedOrigins);

    Verdict evaluate(const QString& origin) const;
    bool isEmpty() const { return m_allowed.isEmpty(); }

    // Headers for an allowed origin, echoing it back. `preflight` adds the
    // method/header/max-age set answered to OPTIONS.
    static HeaderList responseHeaders(const QString& origin, bool preflight);

private:
    QSet<QString> m_allowed;
};

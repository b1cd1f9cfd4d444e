#pragma once
#include "config/config_types.h"
#include <QMutex>
#include <QElapsedTimer>
#include <functional>

// Token bucket shared by every inbound request. Starts full; refills at
// `rate` tokens per second up to `burst`.
class RateLimiter {
public:
    using Clock = std::function<qint64()>;   // monotonic milliseconds

    explicit RateLimiter(const RateLimitConfig& config, Clock clock = {});

    // Takes one token. False when the bucket is empty.
    bool tryAcquire();

    double availableTokens() const;
    double rate() const { return m_rate; }
    int burst() const { return m_burst; }

private:
    void refillLocked(qint64 nowMs) const;

    const double m_rate;
    const int m_burst;
    Clock m_clock;
    QElapsedTimer m_monotonic;

    mutable QMutex m_mutex;
    mutable double m_tokens;
    mutable qint64 m_lastRefillMs;
};

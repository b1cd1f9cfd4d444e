#include "rate_limiter.h"
#include <QMutexLocker>
#include <algorithm>

RateLimiter::RateLimiter(const RateLimitConfig& config, Clock clock)
    : m_rate(config.rate)
    , m_burst(config.burst)
    , m_clock(std::move(clock))
    , m_tokens(config.burst)
{
    if (!m_clock) {
        m_monotonic.start();
        m_clock = [this]() { return m_monotonic.elapsed(); };
    }
    m_lastRefillMs = m_clock();
}

void RateLimiter::refillLocked(qint64 nowMs) const
{
    const qint64 elapsed = nowMs - m_lastRefillMs;
    if (elapsed <= 0)
        return;
    m_tokens = std::min<double>(m_burst, m_tokens + m_rate * static_cast<double>(elapsed) / 1000.0);
    m_lastRefillMs = nowMs;
}

bool RateLimiter::tryAcquire()
{
    QMutexLocker lock(&m_mutex);
    refillLocked(m_clock());
    if (m_tokens < 1.0)
        return false;
    m_tokens -= 1.0;
    return true;
}

double RateLimiter::availableTokens() const
{
    QMutexLocker lock(&m_mutex);
    refillLocked(m_clock());
    return m_tokens;
}

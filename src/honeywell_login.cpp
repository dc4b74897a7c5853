#include "honeywell_login.h"

#include <algorithm>
#include <utility>

#include "honeywell_log.h"

namespace phicore::honeywell {

LoginController::LoginController(LoginPolicy policy, Clock clock)
    : m_policy(policy)
    , m_clock(clock ? std::move(clock) : Clock(systemNowMs))
{
}

LoginOutcome LoginController::authenticate(SessionClient &session)
{
    const std::int64_t now = m_clock();
    const std::int64_t until = m_rateLimitedUntilMs.load();
    if (until > now) {
        qCDebug(honeywellLog) << "LoginController: login skipped, rate limited for" << (until - now) << "ms";
        return retryLater(static_cast<int>(until - now),
                          SessionErrorKind::RateLimited,
                          QStringLiteral("Login skipped while the API is rate limited"));
    }

    // One rejection earns an immediate second attempt.
    bool retried = false;
    for (;;) {
        const LoginResult result = session.login(m_policy.loginTimeoutMs);
        if (result.ok) {
            m_loginFailureCount.store(0);
            m_rateLimitedUntilMs.store(0);
            return ready();
        }

        const SessionError &error = result.error;
        switch (error.kind) {
        case SessionErrorKind::Timeout:
        case SessionErrorKind::ConnectionError:
            qCWarning(honeywellLog).noquote() << "LoginController: login failed:" << formatError(error);
            return retryLater(m_policy.shortBackoffMs, error.kind, formatError(error));

        case SessionErrorKind::RateLimited: {
            const int backoff = noteRateLimited(error.retryAfterMs);
            qCWarning(honeywellLog) << "LoginController: rate limited, backing off for" << backoff << "ms";
            return retryLater(backoff, error.kind, formatError(error));
        }

        case SessionErrorKind::AuthError:
        case SessionErrorKind::EmptyCookie:
            ++m_loginFailureCount;
            if (!retried) {
                retried = true;
                qCInfo(honeywellLog).noquote() << "LoginController: login rejected, retrying once:"
                                               << formatError(error);
                continue;
            }
            if (error.kind == SessionErrorKind::AuthError) {
                qCWarning(honeywellLog).noquote() << "LoginController: credentials rejected twice:"
                                                  << formatError(error);
                LoginOutcome outcome;
                outcome.kind = LoginOutcome::Kind::PermanentAuthFailure;
                outcome.cause = error.kind;
                outcome.message = formatError(error);
                return outcome;
            }
            qCWarning(honeywellLog).noquote() << "LoginController: login failed (site may be down):"
                                              << formatError(error);
            return retryLater(m_policy.shortBackoffMs, error.kind, formatError(error));

        case SessionErrorKind::None:
        case SessionErrorKind::Unclassified:
            qCWarning(honeywellLog).noquote() << "LoginController: unexpected login failure:" << formatError(error);
            return retryLater(m_policy.shortBackoffMs, SessionErrorKind::Unclassified, formatError(error));
        }
    }
}

int LoginController::noteRateLimited(int retryAfterMs)
{
    const int backoff = retryAfterMs > 0 ? retryAfterMs : m_policy.rateLimitBackoffMs;
    const std::int64_t until = m_clock() + backoff;
    std::int64_t current = m_rateLimitedUntilMs.load();
    while (current < until && !m_rateLimitedUntilMs.compare_exchange_weak(current, until)) {
    }
    return backoff;
}

void LoginController::reset()
{
    m_loginFailureCount.store(0);
    m_rateLimitedUntilMs.store(0);
}

bool LoginController::isRateLimited() const
{
    return m_rateLimitedUntilMs.load() > m_clock();
}

LoginOutcome LoginController::ready() const
{
    LoginOutcome outcome;
    outcome.kind = LoginOutcome::Kind::Ready;
    return outcome;
}

LoginOutcome LoginController::retryLater(int delayMs, SessionErrorKind cause, const QString &message) const
{
    LoginOutcome outcome;
    outcome.kind = LoginOutcome::Kind::RetryLater;
    outcome.retryDelayMs = std::max(0, delayMs);
    outcome.cause = cause;
    outcome.message = message;
    return outcome;
}

QString loginOutcomeName(LoginOutcome::Kind kind)
{
    switch (kind) {
    case LoginOutcome::Kind::Ready:
        return QStringLiteral("Ready");
    case LoginOutcome::Kind::RetryLater:
        return QStringLiteral("RetryLater");
    case LoginOutcome::Kind::PermanentAuthFailure:
        break;
    }
    return QStringLiteral("PermanentAuthFailure");
}

} // namespace phicore::honeywell

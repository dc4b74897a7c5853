#pragma once

#include <atomic>
#include <cstdint>

#include <QString>

#include "honeywell_clock.h"
#include "honeywell_session.h"

namespace phicore::honeywell {

struct LoginPolicy {
    int loginTimeoutMs = 30000;
    int shortBackoffMs = 10000;
    int rateLimitBackoffMs = 10 * 60 * 1000;
};

struct LoginOutcome {
    enum class Kind {
        Ready,
        RetryLater,
        PermanentAuthFailure
    };

    Kind kind = Kind::RetryLater;
    int retryDelayMs = 0;
    SessionErrorKind cause = SessionErrorKind::None;
    QString message;

    bool isReady() const { return kind == Kind::Ready; }
};

// Serializes authentication for one installation. The controller is the only
// writer of the login failure counter and the rate-limit window; both can be
// read from any thread.
class LoginController
{
public:
    explicit LoginController(LoginPolicy policy = {}, Clock clock = systemNowMs);

    LoginOutcome authenticate(SessionClient &session);

    // Opens (or extends) the rate-limit window after a RateLimited response
    // seen outside of login. Returns the backoff applied.
    int noteRateLimited(int retryAfterMs);

    void reset();

    bool isRateLimited() const;
    std::int64_t rateLimitedUntilMs() const { return m_rateLimitedUntilMs.load(); }
    int loginFailureCount() const { return m_loginFailureCount.load(); }
    const LoginPolicy &policy() const { return m_policy; }

private:
    LoginOutcome ready() const;
    LoginOutcome retryLater(int delayMs, SessionErrorKind cause, const QString &message) const;

    LoginPolicy m_policy;
    Clock m_clock;
    std::atomic<std::int64_t> m_rateLimitedUntilMs{0};
    std::atomic<int> m_loginFailureCount{0};
};

QString loginOutcomeName(LoginOutcome::Kind kind);

} // namespace phicore::honeywell

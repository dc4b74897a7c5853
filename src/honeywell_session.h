#pragma once

#include <QList>
#include <QString>

#include "honeywell_model.h"

namespace phicore::honeywell {

enum class SessionErrorKind {
    None,
    Timeout,
    ConnectionError,
    RateLimited,
    // Explicit credential rejection, or a data request answered with 401.
    AuthError,
    // Login answered without an auth cookie: the portal is degraded, the
    // credentials are not known to be wrong.
    EmptyCookie,
    Unclassified
};

struct SessionError {
    SessionErrorKind kind = SessionErrorKind::None;
    QString message;
    // Server-provided backoff, 0 when the response carried none.
    int retryAfterMs = 0;
};

struct LoginResult {
    bool ok = false;
    SessionError error;
};

struct DiscoveryResult {
    bool ok = false;
    QList<DiscoveredDevice> devices;
    SessionError error;
};

struct RefreshResult {
    bool ok = false;
    ThermostatState state;
    SessionError error;
};

struct WriteResult {
    bool ok = false;
    SessionError error;
};

// Capability set of an authenticated Total Connect Comfort session. Calls
// block the calling thread for at most timeoutMs; refreshDevice() and
// submitChange() may be called concurrently from several threads.
class SessionClient
{
public:
    virtual ~SessionClient() = default;

    virtual LoginResult login(int timeoutMs) = 0;
    // Discovery performs a full refresh of every device it reports.
    virtual DiscoveryResult discoverDevices(int timeoutMs) = 0;
    virtual RefreshResult refreshDevice(const QString &deviceId, int timeoutMs) = 0;
    virtual WriteResult submitChange(const QString &deviceId, const ControlChange &change, int timeoutMs) = 0;
};

QString errorKindName(SessionErrorKind kind);
bool isTransient(SessionErrorKind kind);
QString formatError(const SessionError &error);

} // namespace phicore::honeywell

#include "honeywell_session.h"

namespace phicore::honeywell {

QString errorKindName(SessionErrorKind kind)
{
    switch (kind) {
    case SessionErrorKind::None:
        return QStringLiteral("None");
    case SessionErrorKind::Timeout:
        return QStringLiteral("Timeout");
    case SessionErrorKind::ConnectionError:
        return QStringLiteral("ConnectionError");
    case SessionErrorKind::RateLimited:
        return QStringLiteral("RateLimited");
    case SessionErrorKind::AuthError:
        return QStringLiteral("AuthError");
    case SessionErrorKind::EmptyCookie:
        return QStringLiteral("EmptyCookie");
    case SessionErrorKind::Unclassified:
        break;
    }
    return QStringLiteral("Unclassified");
}

bool isTransient(SessionErrorKind kind)
{
    return kind != SessionErrorKind::None && kind != SessionErrorKind::AuthError;
}

QString formatError(const SessionError &error)
{
    const QString name = errorKindName(error.kind);
    if (error.message.isEmpty())
        return name;
    return QStringLiteral("%1: %2").arg(name, error.message);
}

} // namespace phicore::honeywell

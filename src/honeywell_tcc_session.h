#pragma once

#include <QList>
#include <QMutex>
#include <QNetworkCookie>
#include <QString>
#include <QUrl>

#include "honeywell_http.h"
#include "honeywell_session.h"

namespace phicore::honeywell {

inline constexpr const char kDefaultPortalUrl[] = "https://www.mytotalconnectcomfort.com";
inline constexpr const char kAuthCookieName[] = ".ASPXAUTH_TRUEHOME";

// Session client for the Total Connect Comfort web portal. Every call runs on
// its own QNetworkAccessManager, so calls may come from any thread; the auth
// cookies are swapped under a mutex on each successful login.
class TccSession final : public SessionClient
{
public:
    TccSession(QString username, QString password, QUrl baseUrl = QUrl(QString::fromLatin1(kDefaultPortalUrl)));

    LoginResult login(int timeoutMs) override;
    DiscoveryResult discoverDevices(int timeoutMs) override;
    RefreshResult refreshDevice(const QString &deviceId, int timeoutMs) override;
    WriteResult submitChange(const QString &deviceId, const ControlChange &change, int timeoutMs) override;

    bool hasAuthCookie() const;

private:
    ConnectionSettings currentSettings() const;
    RefreshResult refreshWith(HttpClient &http,
                              const ConnectionSettings &settings,
                              const QString &deviceId,
                              int timeoutMs) const;

    QString m_username;
    QString m_password;
    QUrl m_baseUrl;

    mutable QMutex m_mutex;
    QList<QNetworkCookie> m_cookies;
};

// Maps a failed portal request onto the session error taxonomy.
SessionError classifyHttpFailure(const HttpResult &result);

// True if the login response carries a non-empty auth cookie.
bool hasNonEmptyAuthCookie(const QList<QNetworkCookie> &cookies);

} // namespace phicore::honeywell

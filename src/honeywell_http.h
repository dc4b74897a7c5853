#pragma once

#include <QByteArray>
#include <QList>
#include <QNetworkCookie>
#include <QNetworkReply>
#include <QString>
#include <QUrl>
#include <QUrlQuery>

class QNetworkAccessManager;
class QNetworkRequest;

namespace phicore::honeywell {

struct ConnectionSettings {
    QUrl baseUrl;
    // Session cookies replayed on every request.
    QList<QNetworkCookie> cookies;
};

struct HttpResult {
    bool ok = false;
    bool timedOut = false;
    QNetworkReply::NetworkError networkError = QNetworkReply::NoError;
    int statusCode = 0;
    QByteArray payload;
    // Value of a Retry-After header in milliseconds, 0 if absent.
    int retryAfterMs = 0;
    // Cookie jar content for the base URL after the request, redirects
    // included.
    QList<QNetworkCookie> cookies;
    QString error;
};

class HttpClient
{
public:
    explicit HttpClient(QNetworkAccessManager *manager);

    HttpResult get(const ConnectionSettings &settings,
                   const QString &path,
                   const QUrlQuery &query = {},
                   int timeoutMs = 30000) const;

    HttpResult postForm(const ConnectionSettings &settings,
                        const QString &path,
                        const QUrlQuery &form,
                        int timeoutMs = 30000) const;

    HttpResult postJson(const ConnectionSettings &settings,
                        const QString &path,
                        const QByteArray &payload,
                        const QUrlQuery &query = {},
                        int timeoutMs = 30000) const;

    static QUrl resolve(const ConnectionSettings &settings, const QString &path, const QUrlQuery &query);

private:
    bool buildRequest(const QUrl &url,
                      const QByteArray &contentType,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    HttpResult request(const ConnectionSettings &settings,
                       const QByteArray &method,
                       const QUrl &url,
                       const QByteArray &payload,
                       const QByteArray &contentType,
                       int timeoutMs) const;

    QNetworkAccessManager *m_manager = nullptr;
};

} // namespace phicore::honeywell

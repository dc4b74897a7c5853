#include "honeywell_http.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkCookieJar>
#include <QNetworkRequest>
#include <QTimer>

namespace phicore::honeywell {

namespace {

// QUrlQuery leaves '+' and '&' inside values alone, which breaks form
// decoding of passwords.
QByteArray encodeForm(const QUrlQuery &form)
{
    QByteArray body;
    const auto items = form.queryItems(QUrl::FullyDecoded);
    for (const auto &item : items) {
        if (!body.isEmpty())
            body.append('&');
        body.append(QUrl::toPercentEncoding(item.first));
        body.append('=');
        body.append(QUrl::toPercentEncoding(item.second));
    }
    return body;
}

int parseRetryAfterMs(const QByteArray &header)
{
    bool ok = false;
    const int seconds = header.trimmed().toInt(&ok);
    if (!ok || seconds <= 0)
        return 0;
    return seconds * 1000;
}

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

QUrl HttpClient::resolve(const ConnectionSettings &settings, const QString &path, const QUrlQuery &query)
{
    QUrl url = settings.baseUrl;
    QString basePath = url.path();
    if (basePath.endsWith(QLatin1Char('/')))
        basePath.chop(1);
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(basePath + path);
    else
        url.setPath(basePath + QLatin1Char('/') + path);
    if (!query.isEmpty())
        url.setQuery(query);
    return url;
}

HttpResult HttpClient::get(const ConnectionSettings &settings,
                           const QString &path,
                           const QUrlQuery &query,
                           int timeoutMs) const
{
    return request(settings, QByteArrayLiteral("GET"), resolve(settings, path, query), {}, {}, timeoutMs);
}

HttpResult HttpClient::postForm(const ConnectionSettings &settings,
                                const QString &path,
                                const QUrlQuery &form,
                                int timeoutMs) const
{
    return request(settings,
                   QByteArrayLiteral("POST"),
                   resolve(settings, path, {}),
                   encodeForm(form),
                   QByteArrayLiteral("application/x-www-form-urlencoded"),
                   timeoutMs);
}

HttpResult HttpClient::postJson(const ConnectionSettings &settings,
                                const QString &path,
                                const QByteArray &payload,
                                const QUrlQuery &query,
                                int timeoutMs) const
{
    return request(settings,
                   QByteArrayLiteral("POST"),
                   resolve(settings, path, query),
                   payload,
                   QByteArrayLiteral("application/json"),
                   timeoutMs);
}

bool HttpClient::buildRequest(const QUrl &url,
                              const QByteArray &contentType,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    if (!url.isValid() || url.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Portal URL is invalid");
        return false;
    }

    QNetworkRequest out(url);
    out.setRawHeader("Accept", "application/json, text/javascript, */*; q=0.01");
    out.setRawHeader("X-Requested-With", "XMLHttpRequest");
    out.setRawHeader("User-Agent", "phi-adapter-honeywell-ipc/1.0");
    if (!contentType.isEmpty())
        out.setHeader(QNetworkRequest::ContentTypeHeader, QString::fromLatin1(contentType));
    out.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const ConnectionSettings &settings,
                               const QByteArray &method,
                               const QUrl &url,
                               const QByteArray &payload,
                               const QByteArray &contentType,
                               int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        result.networkError = QNetworkReply::UnknownNetworkError;
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(url, contentType, &requestObj, &result.error)) {
        result.networkError = QNetworkReply::ProtocolInvalidOperationError;
        return result;
    }

    // A fresh jar per request keeps concurrent callers from sharing state;
    // redirects still collect their Set-Cookie headers into it.
    auto *jar = new QNetworkCookieJar;
    jar->setCookiesFromUrl(settings.cookies, settings.baseUrl);
    m_manager->setCookieJar(jar);

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET")) {
        reply = m_manager->get(requestObj);
    } else if (method == QByteArrayLiteral("POST")) {
        reply = m_manager->post(requestObj, payload);
    } else {
        reply = m_manager->sendCustomRequest(requestObj, method, payload);
    }

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        result.networkError = QNetworkReply::UnknownNetworkError;
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : 30000);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.timedOut = true;
        result.networkError = QNetworkReply::TimeoutError;
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();
    result.retryAfterMs = parseRetryAfterMs(reply->rawHeader("Retry-After"));
    result.cookies = jar->cookiesForUrl(settings.baseUrl);
    result.networkError = reply->error();

    // HTTP error statuses surface as network errors too; keep the status code
    // and let the caller classify.
    if (reply->error() != QNetworkReply::NoError && result.statusCode == 0) {
        result.error = reply->errorString();
        reply->deleteLater();
        return result;
    }

    if (result.statusCode >= 200 && result.statusCode < 300) {
        result.ok = true;
        result.networkError = QNetworkReply::NoError;
    } else {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    }

    reply->deleteLater();
    return result;
}

} // namespace phicore::honeywell

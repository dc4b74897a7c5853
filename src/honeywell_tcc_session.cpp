#include "honeywell_tcc_session.h"

#include <algorithm>
#include <utility>

#include <QDateTime>
#include <QDeadlineTimer>
#include <QFuture>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QNetworkAccessManager>
#include <QThreadPool>
#include <QUrlQuery>
#include <QtConcurrent/QtConcurrentRun>

#include "honeywell_log.h"

namespace phicore::honeywell {

namespace {

SessionError makeError(SessionErrorKind kind, const QString &message, int retryAfterMs = 0)
{
    SessionError error;
    error.kind = kind;
    error.message = message;
    error.retryAfterMs = retryAfterMs;
    return error;
}

constexpr int kMaxParallelDiscovery = 8;

int remainingMs(const QDeadlineTimer &deadline)
{
    return static_cast<int>(std::max<qint64>(0, deadline.remainingTime()));
}

bool loginRejected(const QByteArray &payload)
{
    return payload.contains("Login was unsuccessful")
        || payload.contains("Invalid username or password")
        || payload.contains("invalid username or password");
}

} // namespace

SessionError classifyHttpFailure(const HttpResult &result)
{
    if (result.timedOut)
        return makeError(SessionErrorKind::Timeout, result.error);

    if (result.statusCode == 401)
        return makeError(SessionErrorKind::AuthError, QStringLiteral("Session unauthorized (HTTP 401)"));
    if (result.statusCode == 429)
        return makeError(SessionErrorKind::RateLimited,
                         QStringLiteral("API rate limited (HTTP 429)"),
                         result.retryAfterMs);

    if (result.statusCode == 0) {
        if (result.networkError == QNetworkReply::TimeoutError
            || result.networkError == QNetworkReply::OperationCanceledError) {
            return makeError(SessionErrorKind::Timeout, result.error);
        }
        return makeError(SessionErrorKind::ConnectionError,
                         result.error.isEmpty() ? QStringLiteral("Connection failed") : result.error);
    }

    return makeError(SessionErrorKind::Unclassified,
                     result.error.isEmpty() ? QStringLiteral("Unexpected response %1").arg(result.statusCode)
                                            : result.error);
}

bool hasNonEmptyAuthCookie(const QList<QNetworkCookie> &cookies)
{
    for (const QNetworkCookie &cookie : cookies) {
        if (cookie.name() == QByteArray(kAuthCookieName) && !cookie.value().trimmed().isEmpty())
            return true;
    }
    return false;
}

TccSession::TccSession(QString username, QString password, QUrl baseUrl)
    : m_username(std::move(username))
    , m_password(std::move(password))
    , m_baseUrl(std::move(baseUrl))
{
}

LoginResult TccSession::login(int timeoutMs)
{
    LoginResult out;

    // Both requests share one budget.
    const QDeadlineTimer deadline(timeoutMs);

    QNetworkAccessManager manager;
    HttpClient http(&manager);

    // Start from an empty jar; stale auth cookies must not leak into a new
    // login.
    ConnectionSettings settings;
    settings.baseUrl = m_baseUrl;

    const HttpResult landing = http.get(settings, QStringLiteral("/portal/"), {}, remainingMs(deadline));
    if (!landing.ok) {
        out.error = classifyHttpFailure(landing);
        return out;
    }
    settings.cookies = landing.cookies;

    if (remainingMs(deadline) == 0) {
        out.error = makeError(SessionErrorKind::Timeout, QStringLiteral("Login timed out after %1 ms").arg(timeoutMs));
        return out;
    }

    QUrlQuery form;
    form.addQueryItem(QStringLiteral("timeOffset"), QStringLiteral("480"));
    form.addQueryItem(QStringLiteral("UserName"), m_username);
    form.addQueryItem(QStringLiteral("Password"), m_password);
    form.addQueryItem(QStringLiteral("RememberMe"), QStringLiteral("false"));

    const HttpResult result = http.postForm(settings, QStringLiteral("/portal/"), form, remainingMs(deadline));
    if (!result.ok) {
        out.error = classifyHttpFailure(result);
        if (out.error.kind == SessionErrorKind::AuthError)
            out.error.message = QStringLiteral("Login as %1 failed").arg(m_username);
        return out;
    }

    if (loginRejected(result.payload)) {
        out.error = makeError(SessionErrorKind::AuthError, QStringLiteral("Login as %1 failed").arg(m_username));
        return out;
    }

    if (!hasNonEmptyAuthCookie(result.cookies)) {
        out.error = makeError(SessionErrorKind::EmptyCookie,
                              QStringLiteral("Null cookie connection error %1").arg(result.statusCode));
        return out;
    }

    {
        QMutexLocker locker(&m_mutex);
        m_cookies = result.cookies;
    }

    qCDebug(honeywellLog) << "TccSession: logged in as" << m_username;
    out.ok = true;
    return out;
}

DiscoveryResult TccSession::discoverDevices(int timeoutMs)
{
    DiscoveryResult out;

    QNetworkAccessManager manager;
    HttpClient http(&manager);
    const ConnectionSettings settings = currentSettings();

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("page"), QStringLiteral("1"));
    query.addQueryItem(QStringLiteral("filter"), QString());

    const HttpResult result = http.postJson(settings,
                                            QStringLiteral("/portal/Location/GetLocationListData/"),
                                            QByteArrayLiteral("{}"),
                                            query,
                                            timeoutMs);
    if (!result.ok) {
        out.error = classifyHttpFailure(result);
        return out;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    if (!doc.isArray()) {
        out.error = makeError(SessionErrorKind::Unclassified, QStringLiteral("Location list is not a JSON array"));
        return out;
    }

    QList<DiscoveredDevice> devices = parseLocationList(doc.array());

    QThreadPool pool;
    pool.setMaxThreadCount(std::clamp(static_cast<int>(devices.size()), 1, kMaxParallelDiscovery));

    QList<QFuture<RefreshResult>> futures;
    futures.reserve(devices.size());
    for (const DiscoveredDevice &device : std::as_const(devices)) {
        const QString deviceId = device.deviceId;
        futures.append(QtConcurrent::run(&pool, [this, settings, deviceId, timeoutMs]() {
            QNetworkAccessManager workerManager;
            HttpClient workerHttp(&workerManager);
            return refreshWith(workerHttp, settings, deviceId, timeoutMs);
        }));
    }

    // Join every fetch before looking at the results.
    for (QFuture<RefreshResult> &future : futures)
        future.waitForFinished();

    for (int i = 0; i < devices.size(); ++i) {
        RefreshResult refresh = futures.at(i).result();
        if (!refresh.ok) {
            out.error = refresh.error;
            return out;
        }
        refresh.state.name = devices.at(i).name;
        devices[i].state = refresh.state;
    }

    out.devices = devices;
    out.ok = true;
    return out;
}

RefreshResult TccSession::refreshDevice(const QString &deviceId, int timeoutMs)
{
    QNetworkAccessManager manager;
    HttpClient http(&manager);
    return refreshWith(http, currentSettings(), deviceId, timeoutMs);
}

WriteResult TccSession::submitChange(const QString &deviceId, const ControlChange &change, int timeoutMs)
{
    WriteResult out;

    QNetworkAccessManager manager;
    HttpClient http(&manager);

    const HttpResult result = http.postJson(currentSettings(),
                                            QStringLiteral("/portal/Device/SubmitControlScreenChanges"),
                                            buildControlPayload(deviceId, change),
                                            {},
                                            timeoutMs);
    if (!result.ok) {
        out.error = classifyHttpFailure(result);
        return out;
    }

    const QJsonObject root = QJsonDocument::fromJson(result.payload).object();
    const QJsonValue success = root.value(QStringLiteral("success"));
    if (success.toInt(0) != 1 && !success.toBool(false)) {
        out.error = makeError(SessionErrorKind::Unclassified, QStringLiteral("Portal rejected the change"));
        return out;
    }

    out.ok = true;
    return out;
}

bool TccSession::hasAuthCookie() const
{
    QMutexLocker locker(&m_mutex);
    return hasNonEmptyAuthCookie(m_cookies);
}

ConnectionSettings TccSession::currentSettings() const
{
    ConnectionSettings settings;
    settings.baseUrl = m_baseUrl;
    QMutexLocker locker(&m_mutex);
    settings.cookies = m_cookies;
    return settings;
}

RefreshResult TccSession::refreshWith(HttpClient &http,
                                      const ConnectionSettings &settings,
                                      const QString &deviceId,
                                      int timeoutMs) const
{
    RefreshResult out;

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("_"), QString::number(QDateTime::currentMSecsSinceEpoch()));

    const QString path = QStringLiteral("/portal/Device/CheckDataSession/%1")
                             .arg(QString::fromLatin1(QUrl::toPercentEncoding(deviceId)));
    const HttpResult result = http.get(settings, path, query, timeoutMs);
    if (!result.ok) {
        out.error = classifyHttpFailure(result);
        return out;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(result.payload);
    if (!doc.isObject()) {
        out.error = makeError(SessionErrorKind::Unclassified,
                              QStringLiteral("Device %1 response is not a JSON object").arg(deviceId));
        return out;
    }

    QString parseError;
    if (!parseThermostatState(doc.object(), &out.state, &parseError)) {
        out.error = makeError(SessionErrorKind::Unclassified, parseError);
        return out;
    }

    out.ok = true;
    return out;
}

} // namespace phicore::honeywell

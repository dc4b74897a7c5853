#include "honeywell_coordinator.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <QFuture>
#include <QList>
#include <QMutexLocker>
#include <QSet>
#include <QtConcurrent/QtConcurrentRun>

#include "honeywell_log.h"

namespace phicore::honeywell {

namespace {

class InFlightReset
{
public:
    explicit InFlightReset(std::atomic_bool &flag)
        : m_flag(flag)
    {
    }
    ~InFlightReset() { m_flag.store(false); }

private:
    std::atomic_bool &m_flag;
};

RefreshResult refreshGuarded(SessionClient &session, const QString &deviceId, int timeoutMs)
{
    try {
        RefreshResult result = session.refreshDevice(deviceId, timeoutMs);
        if (!result.ok && result.error.kind == SessionErrorKind::None)
            result.error.kind = SessionErrorKind::Unclassified;
        return result;
    } catch (const std::exception &ex) {
        RefreshResult result;
        result.error.kind = SessionErrorKind::Unclassified;
        result.error.message = QString::fromUtf8(ex.what());
        return result;
    }
}

int severity(SessionErrorKind kind)
{
    switch (kind) {
    case SessionErrorKind::AuthError:
        return 6;
    case SessionErrorKind::RateLimited:
        return 5;
    case SessionErrorKind::EmptyCookie:
        return 4;
    case SessionErrorKind::Timeout:
        return 3;
    case SessionErrorKind::ConnectionError:
        return 2;
    case SessionErrorKind::Unclassified:
        return 1;
    case SessionErrorKind::None:
        break;
    }
    return 0;
}

SetupOutcome setupOutcome(SetupOutcome::Status status, int retryDelayMs, const QString &message)
{
    SetupOutcome outcome;
    outcome.status = status;
    outcome.retryDelayMs = retryDelayMs;
    outcome.message = message;
    return outcome;
}

} // namespace

Coordinator::Coordinator(std::shared_ptr<SessionClient> session, CoordinatorSettings settings, Clock clock)
    : m_settings(settings)
    , m_clock(clock ? std::move(clock) : Clock(systemNowMs))
    , m_session(std::move(session))
    , m_login(settings.login, m_clock)
{
    m_pool.setMaxThreadCount(std::max(1, m_settings.maxParallelRefresh));
}

Coordinator::~Coordinator()
{
    m_started.store(false);
    m_pool.waitForDone();
}

SetupOutcome Coordinator::start()
{
    const std::shared_ptr<SessionClient> session = currentSession();
    if (!session)
        return setupOutcome(SetupOutcome::Status::NotReady, m_settings.login.shortBackoffMs,
                            QStringLiteral("No session client configured"));

    const LoginOutcome login = m_login.authenticate(*session);
    qCDebug(honeywellLog).noquote() << "Coordinator: setup login" << loginOutcomeName(login.kind);
    if (login.kind == LoginOutcome::Kind::PermanentAuthFailure)
        return setupOutcome(SetupOutcome::Status::NeedsReauth, 0, login.message);
    if (login.kind == LoginOutcome::Kind::RetryLater)
        return setupOutcome(SetupOutcome::Status::NotReady, login.retryDelayMs, login.message);

    const DiscoveryResult discovery = session->discoverDevices(m_settings.discoveryTimeoutMs);
    if (!discovery.ok) {
        const QString message = QStringLiteral("Discovery failed: %1").arg(formatError(discovery.error));
        qCWarning(honeywellLog).noquote() << "Coordinator::start:" << message;
        switch (discovery.error.kind) {
        case SessionErrorKind::AuthError:
            return setupOutcome(SetupOutcome::Status::NeedsReauth, 0, message);
        case SessionErrorKind::RateLimited:
            return setupOutcome(SetupOutcome::Status::NotReady,
                                m_login.noteRateLimited(discovery.error.retryAfterMs),
                                message);
        default:
            return setupOutcome(SetupOutcome::Status::NotReady, m_settings.login.shortBackoffMs, message);
        }
    }

    if (discovery.devices.isEmpty()) {
        qCWarning(honeywellLog) << "Coordinator::start: no devices found";
        return setupOutcome(SetupOutcome::Status::NoDevices, 0, QStringLiteral("No devices found"));
    }

    seedDevices(discovery.devices);
    m_skipNextRefresh.store(true);
    m_started.store(true);

    runCycle();
    m_nextCycleDueMs.store(m_clock() + m_settings.pollIntervalMs);

    qCInfo(honeywellLog) << "Coordinator::start: ready with" << m_store.size() << "devices";
    return setupOutcome(SetupOutcome::Status::Ready, 0, QString());
}

void Coordinator::stop()
{
    m_started.store(false);
}

std::optional<CycleResult> Coordinator::tick()
{
    if (!m_started.load())
        return std::nullopt;

    const std::int64_t now = m_clock();
    if (now < m_nextCycleDueMs.load())
        return std::nullopt;

    m_nextCycleDueMs.store(now + m_settings.pollIntervalMs);
    return runCycle();
}

CycleResult Coordinator::runCycle()
{
    return runCycleInternal(false);
}

CycleResult Coordinator::forceRefreshNow()
{
    return runCycleInternal(true);
}

CycleResult Coordinator::runCycleInternal(bool force)
{
    bool expected = false;
    if (!m_cycleInFlight.compare_exchange_strong(expected, true)) {
        qCDebug(honeywellLog) << "Coordinator: cycle still running, skipping";
        CycleResult skipped;
        skipped.skipped = true;
        skipped.completedAtMs = m_clock();
        return skipped;
    }
    InFlightReset reset(m_cycleInFlight);

    CycleResult result;
    const bool skipRefresh = m_skipNextRefresh.exchange(false);
    if (skipRefresh && !force) {
        // Discovery just fetched every device.
        result = mergedResult(false, {});
    } else {
        result = refreshAll();
    }

    publish(result);
    return result;
}

CycleResult Coordinator::refreshAll()
{
    const std::shared_ptr<SessionClient> session = currentSession();
    const QStringList ids = m_store.ids();
    if (!session || ids.isEmpty())
        return mergedResult(true, {});

    if (m_login.isRateLimited()) {
        qCInfo(honeywellLog) << "Coordinator: rate limited for"
                             << (m_login.rateLimitedUntilMs() - m_clock()) << "ms, serving cached data";
        SessionError error;
        error.kind = SessionErrorKind::RateLimited;
        error.message = QStringLiteral("Refresh skipped while the API is rate limited");
        QHash<QString, SessionError> failures;
        for (const QString &id : ids) {
            m_store.markStale(id);
            failures.insert(id, error);
        }
        CycleResult merged = mergedResult(true, failures);
        merged.error = error.message;
        return merged;
    }

    const QHash<QString, RefreshResult> results = fetchConcurrently(session, ids);
    const std::int64_t now = m_clock();

    QHash<QString, SessionError> failures;
    QStringList rejected;
    for (const QString &id : ids) {
        const RefreshResult result = results.value(id);
        if (result.ok) {
            applySuccess(id, result.state, now);
            continue;
        }
        if (result.error.kind == SessionErrorKind::AuthError) {
            rejected.append(id);
            continue;
        }
        applyTransient(id, result.error, &failures);
    }

    bool authFailed = false;
    if (!rejected.isEmpty()) {
        qCInfo(honeywellLog) << "Coordinator: session rejected for" << rejected.size() << "devices, logging in again";
        const LoginOutcome login = m_login.authenticate(*session);
        qCInfo(honeywellLog).noquote() << "Coordinator: re-login" << loginOutcomeName(login.kind);

        if (login.isReady()) {
            const QHash<QString, RefreshResult> retried = fetchConcurrently(session, rejected);
            const std::int64_t retryNow = m_clock();
            for (const QString &id : std::as_const(rejected)) {
                const RefreshResult result = retried.value(id);
                if (result.ok) {
                    applySuccess(id, result.state, retryNow);
                } else if (result.error.kind == SessionErrorKind::AuthError) {
                    authFailed = true;
                    m_store.markStale(id);
                    failures.insert(id, result.error);
                } else {
                    applyTransient(id, result.error, &failures);
                }
            }
        } else if (login.kind == LoginOutcome::Kind::PermanentAuthFailure) {
            authFailed = true;
            SessionError error;
            error.kind = SessionErrorKind::AuthError;
            error.message = login.message;
            for (const QString &id : std::as_const(rejected)) {
                m_store.markStale(id);
                failures.insert(id, error);
            }
        } else {
            SessionError error;
            error.kind = login.cause == SessionErrorKind::None ? SessionErrorKind::Unclassified : login.cause;
            error.message = QStringLiteral("Re-login deferred: %1").arg(login.message);
            // The controller already recorded any rate limit behind the
            // deferral.
            for (const QString &id : std::as_const(rejected))
                applyTransient(id, error, &failures, false);
        }
    }

    CycleResult merged = mergedResult(true, failures);
    merged.authFailed = authFailed;
    if (authFailed) {
        merged.error = QStringLiteral("Incorrect credentials");
        qCWarning(honeywellLog) << "Coordinator: credentials rejected after re-login, re-authentication required";
    } else if (!failures.isEmpty()) {
        merged.error = QStringLiteral("%1 of %2 devices returned cached data")
                           .arg(failures.size())
                           .arg(ids.size());
    }
    return merged;
}

QHash<QString, RefreshResult> Coordinator::fetchConcurrently(const std::shared_ptr<SessionClient> &session,
                                                             const QStringList &deviceIds)
{
    const int timeoutMs = m_settings.refreshTimeoutMs;

    QList<QFuture<RefreshResult>> futures;
    futures.reserve(deviceIds.size());
    for (const QString &id : deviceIds) {
        futures.append(QtConcurrent::run(&m_pool, [session, id, timeoutMs]() {
            return refreshGuarded(*session, id, timeoutMs);
        }));
    }

    QHash<QString, RefreshResult> results;
    for (int i = 0; i < deviceIds.size(); ++i) {
        futures[i].waitForFinished();
        results.insert(deviceIds.at(i), futures.at(i).result());
    }
    return results;
}

void Coordinator::applySuccess(const QString &deviceId, const ThermostatState &state, std::int64_t nowMs)
{
    ThermostatState next = state;
    if (next.name.isEmpty()) {
        const std::optional<DeviceSnapshot> previous = m_store.get(deviceId);
        if (previous)
            next.name = previous->state.name;
    }
    m_store.upsert(deviceId, next, nowMs);
}

void Coordinator::applyTransient(const QString &deviceId,
                                 const SessionError &error,
                                 QHash<QString, SessionError> *failures,
                                 bool recordRateLimit)
{
    m_store.markStale(deviceId);
    failures->insert(deviceId, error);

    if (recordRateLimit && error.kind == SessionErrorKind::RateLimited)
        m_login.noteRateLimited(error.retryAfterMs);

    if (error.kind == SessionErrorKind::Unclassified) {
        qCWarning(honeywellLog).noquote() << "Coordinator: unexpected API response for device" << deviceId
                                          << "-" << formatError(error) << "; returning cached data";
    } else {
        qCWarning(honeywellLog).noquote() << "Coordinator: refresh failed for device" << deviceId
                                          << "-" << formatError(error) << "; returning cached data";
    }
}

void Coordinator::seedDevices(const QList<DiscoveredDevice> &devices)
{
    const std::int64_t now = m_clock();
    for (const DiscoveredDevice &device : devices) {
        ThermostatState state = device.state;
        if (state.name.isEmpty())
            state.name = device.name;
        m_store.upsert(device.deviceId, state, now);
    }
}

bool Coordinator::rediscover(QString *error)
{
    auto fail = [error](const QString &message) {
        if (error)
            *error = message;
        return false;
    };

    bool expected = false;
    if (!m_cycleInFlight.compare_exchange_strong(expected, true))
        return fail(QStringLiteral("A refresh cycle is in progress"));
    InFlightReset reset(m_cycleInFlight);

    const std::shared_ptr<SessionClient> session = currentSession();
    if (!session)
        return fail(QStringLiteral("No session client configured"));

    const DiscoveryResult discovery = session->discoverDevices(m_settings.discoveryTimeoutMs);
    if (!discovery.ok) {
        if (discovery.error.kind == SessionErrorKind::RateLimited)
            m_login.noteRateLimited(discovery.error.retryAfterMs);
        return fail(QStringLiteral("Discovery failed: %1").arg(formatError(discovery.error)));
    }
    // An empty answer is more likely a portal hiccup than every device
    // vanishing at once.
    if (discovery.devices.isEmpty())
        return fail(QStringLiteral("Discovery returned no devices"));

    QSet<QString> reported;
    for (const DiscoveredDevice &device : discovery.devices)
        reported.insert(device.deviceId);

    const QStringList known = m_store.ids();
    for (const QString &id : known) {
        if (reported.contains(id))
            continue;
        qCInfo(honeywellLog) << "Coordinator::rediscover: device" << id << "no longer reported, removing";
        m_store.remove(id);
    }
    seedDevices(discovery.devices);

    publish(mergedResult(true, {}));
    if (error)
        error->clear();
    return true;
}

WriteResult Coordinator::submitChange(const QString &deviceId, const ControlChange &change)
{
    WriteResult result;
    if (!m_store.contains(deviceId)) {
        result.error.kind = SessionErrorKind::Unclassified;
        result.error.message = QStringLiteral("Unknown device %1").arg(deviceId);
        return result;
    }
    if (change.isEmpty()) {
        result.error.kind = SessionErrorKind::Unclassified;
        result.error.message = QStringLiteral("Empty change");
        return result;
    }

    const std::shared_ptr<SessionClient> session = currentSession();
    if (!session) {
        result.error.kind = SessionErrorKind::ConnectionError;
        result.error.message = QStringLiteral("No session client configured");
        return result;
    }

    result = session->submitChange(deviceId, change, m_settings.refreshTimeoutMs);
    if (!result.ok) {
        qCWarning(honeywellLog).noquote() << "Coordinator::submitChange: device" << deviceId
                                          << "rejected change:" << formatError(result.error);
    }
    return result;
}

void Coordinator::replaceSession(std::shared_ptr<SessionClient> session)
{
    {
        QMutexLocker locker(&m_sessionMutex);
        m_session = std::move(session);
    }
    m_login.reset();
}

std::optional<DeviceSnapshot> Coordinator::currentSnapshot(const QString &deviceId) const
{
    return m_store.get(deviceId);
}

bool Coordinator::isAvailable(const QString &deviceId) const
{
    const std::optional<DeviceSnapshot> snapshot = m_store.get(deviceId);
    return snapshot.has_value() && snapshot->isAvailable();
}

std::optional<SessionErrorKind> Coordinator::lastError() const
{
    QMutexLocker locker(&m_resultMutex);
    return m_lastError;
}

CycleResult Coordinator::lastResult() const
{
    QMutexLocker locker(&m_resultMutex);
    return m_lastResult;
}

SubscriptionId Coordinator::subscribe(CycleListener listener)
{
    return m_subscribers.subscribe(std::move(listener));
}

bool Coordinator::unsubscribe(SubscriptionId id)
{
    return m_subscribers.unsubscribe(id);
}

QJsonObject Coordinator::diagnostics() const
{
    QJsonObject out;
    out.insert(QStringLiteral("loginFailureCount"), m_login.loginFailureCount());
    out.insert(QStringLiteral("rateLimitedUntilMs"), static_cast<qint64>(m_login.rateLimitedUntilMs()));
    out.insert(QStringLiteral("pollIntervalMs"), m_settings.pollIntervalMs);

    const std::optional<SessionErrorKind> error = lastError();
    out.insert(QStringLiteral("lastError"), error ? errorKindName(*error) : QString());

    const QList<DeviceSnapshot> snapshots = m_store.all();
    for (const DeviceSnapshot &snapshot : snapshots) {
        QJsonObject device;
        device.insert(QStringLiteral("Name"), snapshot.state.name);
        device.insert(QStringLiteral("Stale"), snapshot.stale);
        device.insert(QStringLiteral("Consecutive Failures"), snapshot.consecutiveFailures);
        device.insert(QStringLiteral("Last Success"), static_cast<qint64>(snapshot.lastSuccessAtMs));
        device.insert(QStringLiteral("UI Data"), snapshot.state.rawUiData);
        device.insert(QStringLiteral("Fan Data"), snapshot.state.rawFanData);
        device.insert(QStringLiteral("DR Data"), snapshot.state.rawDrData);
        device.insert(QStringLiteral("Humidity Data"), snapshot.state.rawHumData);
        out.insert(QStringLiteral("Device %1").arg(snapshot.deviceId), device);
    }
    return out;
}

CycleResult Coordinator::mergedResult(bool refreshed, const QHash<QString, SessionError> &failures) const
{
    CycleResult result;
    result.refreshed = refreshed;
    result.completedAtMs = m_clock();
    result.failures = failures;
    const QList<DeviceSnapshot> snapshots = m_store.all();
    for (const DeviceSnapshot &snapshot : snapshots)
        result.snapshots.insert(snapshot.deviceId, snapshot);
    return result;
}

void Coordinator::publish(const CycleResult &result)
{
    {
        QMutexLocker locker(&m_resultMutex);
        m_lastResult = result;
        if (result.authFailed) {
            m_lastError = SessionErrorKind::AuthError;
        } else if (result.failures.isEmpty()) {
            m_lastError.reset();
        } else {
            SessionErrorKind worst = SessionErrorKind::None;
            for (auto it = result.failures.cbegin(); it != result.failures.cend(); ++it) {
                if (severity(it->kind) > severity(worst))
                    worst = it->kind;
            }
            m_lastError = worst;
        }
    }

    m_subscribers.notify(result);
}

std::shared_ptr<SessionClient> Coordinator::currentSession() const
{
    QMutexLocker locker(&m_sessionMutex);
    return m_session;
}

QString setupStatusName(SetupOutcome::Status status)
{
    switch (status) {
    case SetupOutcome::Status::Ready:
        return QStringLiteral("Ready");
    case SetupOutcome::Status::NotReady:
        return QStringLiteral("NotReady");
    case SetupOutcome::Status::NeedsReauth:
        return QStringLiteral("NeedsReauth");
    case SetupOutcome::Status::NoDevices:
        break;
    }
    return QStringLiteral("NoDevices");
}

} // namespace phicore::honeywell

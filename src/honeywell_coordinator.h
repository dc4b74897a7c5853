#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include <QHash>
#include <QJsonObject>
#include <QMutex>
#include <QStringList>
#include <QThreadPool>

#include "honeywell_clock.h"
#include "honeywell_cycle.h"
#include "honeywell_login.h"
#include "honeywell_session.h"
#include "honeywell_snapshot_store.h"
#include "honeywell_subscribers.h"

namespace phicore::honeywell {

struct CoordinatorSettings {
    int pollIntervalMs = 60000;
    int refreshTimeoutMs = 30000;
    int discoveryTimeoutMs = 30000;
    // Upper bound of concurrent refresh calls within one cycle.
    int maxParallelRefresh = 8;
    LoginPolicy login;
};

struct SetupOutcome {
    enum class Status {
        Ready,
        // Recoverable; the host retries after retryDelayMs.
        NotReady,
        // Credentials rejected; the host must ask for new ones.
        NeedsReauth,
        NoDevices
    };

    Status status = Status::NotReady;
    int retryDelayMs = 0;
    QString message;

    bool isReady() const { return status == Status::Ready; }
};

// Polling coordinator for one installation (account + devices). Owns the
// session, the snapshot store and the login state; at most one cycle runs at
// a time.
class Coordinator
{
public:
    explicit Coordinator(std::shared_ptr<SessionClient> session,
                         CoordinatorSettings settings = {},
                         Clock clock = systemNowMs);
    ~Coordinator();

    Coordinator(const Coordinator &) = delete;
    Coordinator &operator=(const Coordinator &) = delete;

    // Authenticates, discovers and seeds the store, then runs the startup
    // pass, which publishes the discovery data without fetching again.
    SetupOutcome start();
    void stop();
    bool isStarted() const { return m_started.load(); }

    // Runs a cycle when the poll interval has elapsed. Returns a skipped
    // result if the previous cycle is still running.
    std::optional<CycleResult> tick();
    CycleResult runCycle();
    // Manual refresh; always fetches, even right after start().
    CycleResult forceRefreshNow();

    // Re-runs discovery: adds new devices, drops those no longer reported.
    bool rediscover(QString *error = nullptr);

    // Writes never touch the snapshot store; a failure stays local to the
    // caller.
    WriteResult submitChange(const QString &deviceId, const ControlChange &change);

    // Installs a session built from new credentials. Calls still running on
    // the old session finish against it.
    void replaceSession(std::shared_ptr<SessionClient> session);

    std::optional<DeviceSnapshot> currentSnapshot(const QString &deviceId) const;
    bool isAvailable(const QString &deviceId) const;
    std::optional<SessionErrorKind> lastError() const;
    CycleResult lastResult() const;
    QStringList deviceIds() const { return m_store.ids(); }
    std::int64_t nextCycleDueMs() const { return m_nextCycleDueMs.load(); }

    SubscriptionId subscribe(CycleListener listener);
    bool unsubscribe(SubscriptionId id);

    const LoginController &loginController() const { return m_login; }
    const SnapshotStore &store() const { return m_store; }
    const CoordinatorSettings &settings() const { return m_settings; }

    QJsonObject diagnostics() const;

private:
    CycleResult runCycleInternal(bool force);
    CycleResult refreshAll();
    QHash<QString, RefreshResult> fetchConcurrently(const std::shared_ptr<SessionClient> &session,
                                                    const QStringList &deviceIds);
    void applySuccess(const QString &deviceId, const ThermostatState &state, std::int64_t nowMs);
    void applyTransient(const QString &deviceId,
                        const SessionError &error,
                        QHash<QString, SessionError> *failures,
                        bool recordRateLimit = true);
    void seedDevices(const QList<DiscoveredDevice> &devices);
    CycleResult mergedResult(bool refreshed, const QHash<QString, SessionError> &failures) const;
    void publish(const CycleResult &result);
    std::shared_ptr<SessionClient> currentSession() const;

    CoordinatorSettings m_settings;
    Clock m_clock;

    mutable QMutex m_sessionMutex;
    std::shared_ptr<SessionClient> m_session;

    LoginController m_login;
    SnapshotStore m_store;
    SubscriberRegistry m_subscribers;
    QThreadPool m_pool;

    std::atomic_bool m_started{false};
    std::atomic_bool m_cycleInFlight{false};
    std::atomic_bool m_skipNextRefresh{false};
    std::atomic<std::int64_t> m_nextCycleDueMs{0};

    mutable QMutex m_resultMutex;
    CycleResult m_lastResult;
    std::optional<SessionErrorKind> m_lastError;
};

QString setupStatusName(SetupOutcome::Status status);

} // namespace phicore::honeywell

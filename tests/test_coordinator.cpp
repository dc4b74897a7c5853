#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>

#include <QSemaphore>

#include "fake_session.h"
#include "honeywell_coordinator.h"

namespace phicore::honeywell {
namespace {

using test::FakeSession;
using test::loginFailed;
using test::refreshFailed;
using test::refreshOk;

class CoordinatorTest : public ::testing::Test
{
protected:
    std::unique_ptr<Coordinator> makeCoordinator(const QStringList &ids)
    {
        session->setDevices(ids);
        CoordinatorSettings settings;
        settings.pollIntervalMs = kPollMs;
        return std::make_unique<Coordinator>(session, settings, [this]() { return now.load(); });
    }

    std::unique_ptr<Coordinator> startedCoordinator(const QStringList &ids)
    {
        auto coordinator = makeCoordinator(ids);
        const SetupOutcome outcome = coordinator->start();
        EXPECT_EQ(outcome.status, SetupOutcome::Status::Ready) << outcome.message.toStdString();
        return coordinator;
    }

    static constexpr int kPollMs = 60000;

    std::shared_ptr<FakeSession> session = std::make_shared<FakeSession>();
    std::atomic<std::int64_t> now{1700000000000};
};

TEST_F(CoordinatorTest, StartPublishesDiscoveryWithoutRefreshing)
{
    auto coordinator = makeCoordinator({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C")});

    int notified = 0;
    coordinator->subscribe([&notified](const CycleResult &) { ++notified; });

    const SetupOutcome outcome = coordinator->start();
    ASSERT_TRUE(outcome.isReady());
    EXPECT_EQ(session->loginCalls.load(), 1);
    EXPECT_EQ(session->discoveryCalls.load(), 1);
    EXPECT_EQ(session->refreshCalls.load(), 0);
    EXPECT_EQ(notified, 1);

    const CycleResult startup = coordinator->lastResult();
    EXPECT_FALSE(startup.refreshed);
    EXPECT_EQ(startup.freshCount(), 3);

    EXPECT_FALSE(coordinator->tick().has_value());
    EXPECT_EQ(session->refreshCalls.load(), 0);

    now += kPollMs;
    const std::optional<CycleResult> first = coordinator->tick();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->refreshed);
    EXPECT_EQ(session->refreshCalls.load(), 3);
    EXPECT_EQ(session->refreshCallsFor(QStringLiteral("A")), 1);
}

TEST_F(CoordinatorTest, AllDevicesFresh)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C")});

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_FALSE(result.skipped);
    EXPECT_FALSE(result.authFailed);
    EXPECT_EQ(result.snapshots.size(), 3);
    EXPECT_EQ(result.freshCount(), 3);
    EXPECT_TRUE(result.failures.isEmpty());
    EXPECT_FALSE(coordinator->lastError().has_value());

    for (const DeviceSnapshot &snapshot : result.snapshots) {
        EXPECT_EQ(snapshot.consecutiveFailures, 0);
        EXPECT_FALSE(snapshot.stale);
        EXPECT_DOUBLE_EQ(snapshot.state.indoorTemperature, 71.0);
        EXPECT_EQ(snapshot.lastSuccessAtMs, now.load());
    }
}

TEST_F(CoordinatorTest, TimeoutReturnsCachedSnapshot)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C")});
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::Timeout));

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_FALSE(result.authFailed);
    EXPECT_EQ(result.freshCount(), 2);
    EXPECT_EQ(result.staleCount(), 1);
    ASSERT_TRUE(result.failures.contains(QStringLiteral("A")));
    EXPECT_EQ(result.failures.value(QStringLiteral("A")).kind, SessionErrorKind::Timeout);

    const DeviceSnapshot a = result.snapshots.value(QStringLiteral("A"));
    EXPECT_TRUE(a.stale);
    EXPECT_EQ(a.consecutiveFailures, 1);
    EXPECT_DOUBLE_EQ(a.state.indoorTemperature, 70.0);
    EXPECT_EQ(a.state.name, QStringLiteral("Thermostat A"));

    EXPECT_FALSE(result.snapshots.value(QStringLiteral("B")).stale);
    EXPECT_FALSE(result.snapshots.value(QStringLiteral("C")).stale);

    EXPECT_TRUE(coordinator->isAvailable(QStringLiteral("A")));
    ASSERT_TRUE(coordinator->lastError().has_value());
    EXPECT_EQ(*coordinator->lastError(), SessionErrorKind::Timeout);
}

TEST_F(CoordinatorTest, OutageKeepsInstallationAvailable)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B")});
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::Timeout));
    session->queueRefresh(QStringLiteral("B"), refreshFailed(SessionErrorKind::ConnectionError));

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_EQ(result.freshCount(), 0);
    EXPECT_EQ(result.staleCount(), 2);
    EXPECT_FALSE(result.authFailed);
    EXPECT_TRUE(result.anyAvailable());
    EXPECT_TRUE(coordinator->isAvailable(QStringLiteral("A")));
    EXPECT_TRUE(coordinator->isAvailable(QStringLiteral("B")));
}

TEST(CycleResultTest, NeverFetchedDevicesAreUnavailable)
{
    CycleResult result;
    EXPECT_FALSE(result.anyAvailable());

    DeviceSnapshot pending;
    pending.deviceId = QStringLiteral("A");
    pending.stale = true;
    result.snapshots.insert(pending.deviceId, pending);
    EXPECT_FALSE(result.anyAvailable());

    DeviceSnapshot cached = pending;
    cached.deviceId = QStringLiteral("B");
    cached.lastSuccessAtMs = 1000;
    result.snapshots.insert(cached.deviceId, cached);
    EXPECT_TRUE(result.anyAvailable());
}

TEST_F(CoordinatorTest, TransientFailuresKeepStateUntilNextSuccess)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});
    const DeviceSnapshot before = *coordinator->currentSnapshot(QStringLiteral("A"));

    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::Timeout));
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::ConnectionError));
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::EmptyCookie));

    for (int i = 1; i <= 3; ++i) {
        now += kPollMs;
        const CycleResult result = coordinator->forceRefreshNow();
        const DeviceSnapshot a = result.snapshots.value(QStringLiteral("A"));
        EXPECT_TRUE(a.stale);
        EXPECT_EQ(a.consecutiveFailures, i);
        EXPECT_DOUBLE_EQ(a.state.indoorTemperature, before.state.indoorTemperature);
        EXPECT_EQ(a.lastSuccessAtMs, before.lastSuccessAtMs);
        EXPECT_FALSE(result.authFailed);
    }

    now += kPollMs;
    const CycleResult recovered = coordinator->forceRefreshNow();
    const DeviceSnapshot a = recovered.snapshots.value(QStringLiteral("A"));
    EXPECT_FALSE(a.stale);
    EXPECT_EQ(a.consecutiveFailures, 0);
    EXPECT_DOUBLE_EQ(a.state.indoorTemperature, 71.0);
    EXPECT_EQ(a.state.name, QStringLiteral("Thermostat A"));
    EXPECT_FALSE(coordinator->lastError().has_value());
}

TEST_F(CoordinatorTest, SingleAuthErrorRecoversAfterRelogin)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B")});
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::AuthError));

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_FALSE(result.authFailed);
    EXPECT_TRUE(result.failures.isEmpty());
    EXPECT_EQ(result.freshCount(), 2);
    EXPECT_EQ(session->loginCalls.load(), 2);
    EXPECT_EQ(session->refreshCallsFor(QStringLiteral("A")), 2);
    EXPECT_EQ(session->refreshCallsFor(QStringLiteral("B")), 1);
}

TEST_F(CoordinatorTest, RepeatedAuthErrorEscalates)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B")});
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::AuthError));
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::AuthError));

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_TRUE(result.authFailed);
    EXPECT_TRUE(result.snapshots.value(QStringLiteral("A")).stale);
    EXPECT_FALSE(result.snapshots.value(QStringLiteral("B")).stale);
    EXPECT_EQ(result.failures.value(QStringLiteral("A")).kind, SessionErrorKind::AuthError);
    EXPECT_EQ(session->loginCalls.load(), 2);

    ASSERT_TRUE(coordinator->lastError().has_value());
    EXPECT_EQ(*coordinator->lastError(), SessionErrorKind::AuthError);
}

TEST_F(CoordinatorTest, RejectedReloginEscalates)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::AuthError));
    session->queueLogin(loginFailed(SessionErrorKind::AuthError));
    session->queueLogin(loginFailed(SessionErrorKind::AuthError));

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_TRUE(result.authFailed);
    EXPECT_EQ(result.error, QStringLiteral("Incorrect credentials"));
    EXPECT_EQ(session->refreshCallsFor(QStringLiteral("A")), 1);
    EXPECT_TRUE(coordinator->currentSnapshot(QStringLiteral("A"))->stale);
}

TEST_F(CoordinatorTest, EmptyCookieNeverEscalates)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B")});

    for (int i = 0; i < 5; ++i) {
        session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::EmptyCookie));
        session->queueRefresh(QStringLiteral("B"), refreshFailed(SessionErrorKind::EmptyCookie));
        now += kPollMs;
        const CycleResult result = coordinator->forceRefreshNow();
        EXPECT_FALSE(result.authFailed);
        EXPECT_EQ(result.staleCount(), 2);
    }

    // A re-login that only ever yields an empty cookie defers, it does not
    // escalate.
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::AuthError));
    session->queueLogin(loginFailed(SessionErrorKind::EmptyCookie));
    session->queueLogin(loginFailed(SessionErrorKind::EmptyCookie));

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_FALSE(result.authFailed);
    EXPECT_EQ(result.failures.value(QStringLiteral("A")).kind, SessionErrorKind::EmptyCookie);
    EXPECT_TRUE(result.snapshots.value(QStringLiteral("A")).stale);
    EXPECT_FALSE(result.snapshots.value(QStringLiteral("B")).stale);
}

TEST_F(CoordinatorTest, RateLimitServesCacheUntilWindowEnds)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B")});
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::RateLimited, 5000));

    const CycleResult limited = coordinator->forceRefreshNow();
    EXPECT_FALSE(limited.authFailed);
    EXPECT_TRUE(limited.snapshots.value(QStringLiteral("A")).stale);
    EXPECT_TRUE(coordinator->loginController().isRateLimited());
    EXPECT_EQ(coordinator->loginController().rateLimitedUntilMs(), now.load() + 5000);
    ASSERT_TRUE(coordinator->lastError().has_value());
    EXPECT_EQ(*coordinator->lastError(), SessionErrorKind::RateLimited);
    EXPECT_EQ(session->refreshCalls.load(), 2);

    // Inside the window nothing is fetched and every device serves its cache.
    now += 1000;
    const CycleResult waiting = coordinator->forceRefreshNow();
    EXPECT_EQ(session->refreshCalls.load(), 2);
    EXPECT_EQ(session->loginCalls.load(), 1);
    EXPECT_FALSE(waiting.authFailed);
    EXPECT_EQ(waiting.freshCount(), 0);
    EXPECT_TRUE(waiting.anyAvailable());
    EXPECT_EQ(waiting.failures.value(QStringLiteral("A")).kind, SessionErrorKind::RateLimited);
    EXPECT_EQ(waiting.failures.value(QStringLiteral("B")).kind, SessionErrorKind::RateLimited);
    EXPECT_DOUBLE_EQ(waiting.snapshots.value(QStringLiteral("A")).state.indoorTemperature, 70.0);
    EXPECT_DOUBLE_EQ(waiting.snapshots.value(QStringLiteral("B")).state.indoorTemperature, 71.0);
    EXPECT_EQ(coordinator->loginController().rateLimitedUntilMs(), now.load() - 1000 + 5000);

    // Once the window is over, fetching and re-login resume.
    now += 5000;
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::AuthError));
    const CycleResult resumed = coordinator->forceRefreshNow();
    EXPECT_EQ(session->loginCalls.load(), 2);
    EXPECT_EQ(session->refreshCallsFor(QStringLiteral("A")), 3);
    EXPECT_EQ(session->refreshCallsFor(QStringLiteral("B")), 2);
    EXPECT_EQ(resumed.freshCount(), 2);
    EXPECT_FALSE(coordinator->loginController().isRateLimited());
}

TEST_F(CoordinatorTest, DeviceRefreshesRunInParallel)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B"), QStringLiteral("C")});

    QSemaphore gate;
    session->setGate(&gate);

    CycleResult result;
    std::thread worker([&]() { result = coordinator->forceRefreshNow(); });

    // All three calls are inside the session before any may leave it.
    const bool allEntered = session->entered.tryAcquire(3, 5000);
    gate.release(3);
    worker.join();

    EXPECT_TRUE(allEntered);
    EXPECT_EQ(result.freshCount(), 3);
    EXPECT_EQ(session->refreshCalls.load(), 3);
}

TEST_F(CoordinatorTest, TickSkippedWhileCycleRuns)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});

    QSemaphore gate;
    session->setGate(&gate);

    CycleResult running;
    std::thread worker([&]() { running = coordinator->forceRefreshNow(); });
    session->entered.acquire();

    now += kPollMs;
    const std::optional<CycleResult> ticked = coordinator->tick();
    ASSERT_TRUE(ticked.has_value());
    EXPECT_TRUE(ticked->skipped);

    const CycleResult manual = coordinator->runCycle();
    EXPECT_TRUE(manual.skipped);

    QString error;
    EXPECT_FALSE(coordinator->rediscover(&error));
    EXPECT_FALSE(error.isEmpty());

    gate.release();
    worker.join();
    session->setGate(nullptr);

    EXPECT_FALSE(running.skipped);
    EXPECT_EQ(session->refreshCalls.load(), 1);
    EXPECT_FALSE(coordinator->lastResult().skipped);
}

TEST_F(CoordinatorTest, ThrowingSessionIsUnclassified)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B")});
    session->throwOnNextRefresh(QStringLiteral("A"));

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_FALSE(result.authFailed);
    EXPECT_EQ(result.failures.value(QStringLiteral("A")).kind, SessionErrorKind::Unclassified);
    EXPECT_TRUE(result.snapshots.value(QStringLiteral("A")).stale);
    EXPECT_FALSE(result.snapshots.value(QStringLiteral("B")).stale);
}

TEST_F(CoordinatorTest, ThrowingListenerDoesNotStopDelivery)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});

    int delivered = 0;
    coordinator->subscribe([](const CycleResult &) { throw std::runtime_error("listener failed"); });
    coordinator->subscribe([](const CycleResult &) { throw 42; });
    coordinator->subscribe([&delivered](const CycleResult &) { ++delivered; });

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_FALSE(result.skipped);
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(coordinator->lastResult().completedAtMs, result.completedAtMs);
}

TEST_F(CoordinatorTest, UnsubscribedListenerIsNotCalled)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});

    int delivered = 0;
    const SubscriptionId id = coordinator->subscribe([&delivered](const CycleResult &) { ++delivered; });
    EXPECT_TRUE(coordinator->unsubscribe(id));
    EXPECT_FALSE(coordinator->unsubscribe(id));

    coordinator->forceRefreshNow();
    EXPECT_EQ(delivered, 0);
}

TEST_F(CoordinatorTest, SetupRetriesRejectedLoginOnce)
{
    session->queueLogin(loginFailed(SessionErrorKind::AuthError));
    auto coordinator = makeCoordinator({QStringLiteral("A")});

    const SetupOutcome outcome = coordinator->start();
    EXPECT_EQ(outcome.status, SetupOutcome::Status::Ready);
    EXPECT_EQ(session->loginCalls.load(), 2);
    EXPECT_EQ(coordinator->loginController().loginFailureCount(), 0);
}

TEST_F(CoordinatorTest, SetupNeedsReauthAfterTwoRejections)
{
    session->queueLogin(loginFailed(SessionErrorKind::AuthError));
    session->queueLogin(loginFailed(SessionErrorKind::AuthError));
    auto coordinator = makeCoordinator({QStringLiteral("A")});

    const SetupOutcome outcome = coordinator->start();
    EXPECT_EQ(outcome.status, SetupOutcome::Status::NeedsReauth);
    EXPECT_FALSE(coordinator->isStarted());
    EXPECT_EQ(session->discoveryCalls.load(), 0);
    EXPECT_FALSE(coordinator->tick().has_value());
}

TEST_F(CoordinatorTest, SetupNotReadyOnTimeout)
{
    session->queueLogin(loginFailed(SessionErrorKind::Timeout));
    auto coordinator = makeCoordinator({QStringLiteral("A")});

    const SetupOutcome outcome = coordinator->start();
    EXPECT_EQ(outcome.status, SetupOutcome::Status::NotReady);
    EXPECT_EQ(outcome.retryDelayMs, coordinator->settings().login.shortBackoffMs);
    EXPECT_EQ(coordinator->loginController().loginFailureCount(), 0);

    const SetupOutcome retried = coordinator->start();
    EXPECT_TRUE(retried.isReady());
}

TEST_F(CoordinatorTest, SetupDiscoveryFailures)
{
    DiscoveryResult timedOut;
    timedOut.error = test::sessionError(SessionErrorKind::Timeout);
    DiscoveryResult limited;
    limited.error = test::sessionError(SessionErrorKind::RateLimited, 30000);
    DiscoveryResult rejected;
    rejected.error = test::sessionError(SessionErrorKind::AuthError);

    session->queueDiscovery(timedOut);
    session->queueDiscovery(limited);
    session->queueDiscovery(rejected);
    auto coordinator = makeCoordinator({QStringLiteral("A")});

    EXPECT_EQ(coordinator->start().status, SetupOutcome::Status::NotReady);

    const SetupOutcome rateLimited = coordinator->start();
    EXPECT_EQ(rateLimited.status, SetupOutcome::Status::NotReady);
    EXPECT_EQ(rateLimited.retryDelayMs, 30000);
    EXPECT_TRUE(coordinator->loginController().isRateLimited());

    now += 30000;
    EXPECT_EQ(coordinator->start().status, SetupOutcome::Status::NeedsReauth);
    EXPECT_FALSE(coordinator->isStarted());
}

TEST_F(CoordinatorTest, SetupWithoutDevices)
{
    auto coordinator = makeCoordinator({});

    const SetupOutcome outcome = coordinator->start();
    EXPECT_EQ(outcome.status, SetupOutcome::Status::NoDevices);
    EXPECT_FALSE(coordinator->isStarted());
}

TEST_F(CoordinatorTest, RediscoverAddsAndRemovesDevices)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B")});
    session->setDevices({QStringLiteral("B"), QStringLiteral("C")});

    int delivered = 0;
    coordinator->subscribe([&delivered](const CycleResult &) { ++delivered; });

    QString error;
    ASSERT_TRUE(coordinator->rediscover(&error)) << error.toStdString();
    EXPECT_EQ(coordinator->deviceIds(), QStringList({QStringLiteral("B"), QStringLiteral("C")}));
    EXPECT_FALSE(coordinator->currentSnapshot(QStringLiteral("A")).has_value());
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(coordinator->lastResult().snapshots.size(), 2);
}

TEST_F(CoordinatorTest, EmptyRediscoveryKeepsDevices)
{
    auto coordinator = startedCoordinator({QStringLiteral("A"), QStringLiteral("B")});
    session->setDevices({});

    QString error;
    EXPECT_FALSE(coordinator->rediscover(&error));
    EXPECT_EQ(coordinator->deviceIds().size(), 2);
}

TEST_F(CoordinatorTest, WritesDoNotTouchSnapshots)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});
    const DeviceSnapshot before = *coordinator->currentSnapshot(QStringLiteral("A"));

    ControlChange change;
    change.heatSetpoint = 66.0;

    const WriteResult unknown = coordinator->submitChange(QStringLiteral("Z"), change);
    EXPECT_FALSE(unknown.ok);
    EXPECT_EQ(session->writeCalls.load(), 0);

    EXPECT_FALSE(coordinator->submitChange(QStringLiteral("A"), ControlChange()).ok);
    EXPECT_EQ(session->writeCalls.load(), 0);

    ASSERT_TRUE(coordinator->submitChange(QStringLiteral("A"), change).ok);
    EXPECT_EQ(session->writeCalls.load(), 1);
    EXPECT_EQ(session->lastWriteDevice, QStringLiteral("A"));
    ASSERT_TRUE(session->lastWrite.heatSetpoint.has_value());
    EXPECT_DOUBLE_EQ(*session->lastWrite.heatSetpoint, 66.0);

    WriteResult failed;
    failed.error = test::sessionError(SessionErrorKind::ConnectionError);
    session->setWriteResult(failed);
    EXPECT_FALSE(coordinator->submitChange(QStringLiteral("A"), change).ok);

    const DeviceSnapshot after = *coordinator->currentSnapshot(QStringLiteral("A"));
    EXPECT_FALSE(after.stale);
    EXPECT_EQ(after.consecutiveFailures, before.consecutiveFailures);
    EXPECT_DOUBLE_EQ(after.state.heatSetpoint, before.state.heatSetpoint);
    EXPECT_FALSE(coordinator->lastError().has_value());
}

TEST_F(CoordinatorTest, ReplacedSessionServesNextCycle)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});

    auto replacement = std::make_shared<FakeSession>();
    replacement->queueRefresh(QStringLiteral("A"), refreshOk(64.0));
    coordinator->replaceSession(replacement);

    const CycleResult result = coordinator->forceRefreshNow();
    EXPECT_EQ(session->refreshCalls.load(), 0);
    EXPECT_EQ(replacement->refreshCalls.load(), 1);
    EXPECT_DOUBLE_EQ(result.snapshots.value(QStringLiteral("A")).state.indoorTemperature, 64.0);
}

TEST_F(CoordinatorTest, StopDisablesTicks)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});
    coordinator->stop();

    now += kPollMs;
    EXPECT_FALSE(coordinator->tick().has_value());
    EXPECT_EQ(session->refreshCalls.load(), 0);
}

TEST_F(CoordinatorTest, DiagnosticsListsDevices)
{
    auto coordinator = startedCoordinator({QStringLiteral("A")});
    session->queueRefresh(QStringLiteral("A"), refreshFailed(SessionErrorKind::Timeout));
    coordinator->forceRefreshNow();

    const QJsonObject diagnostics = coordinator->diagnostics();
    EXPECT_EQ(diagnostics.value(QStringLiteral("lastError")).toString(), QStringLiteral("Timeout"));

    const QJsonObject device = diagnostics.value(QStringLiteral("Device A")).toObject();
    EXPECT_EQ(device.value(QStringLiteral("Name")).toString(), QStringLiteral("Thermostat A"));
    EXPECT_TRUE(device.value(QStringLiteral("Stale")).toBool());
    EXPECT_EQ(device.value(QStringLiteral("Consecutive Failures")).toInt(), 1);
    EXPECT_TRUE(device.contains(QStringLiteral("UI Data")));
    EXPECT_TRUE(device.contains(QStringLiteral("Fan Data")));
    EXPECT_TRUE(device.contains(QStringLiteral("DR Data")));
}

TEST(SetupOutcomeTest, StatusNames)
{
    EXPECT_EQ(setupStatusName(SetupOutcome::Status::Ready), QStringLiteral("Ready"));
    EXPECT_EQ(setupStatusName(SetupOutcome::Status::NotReady), QStringLiteral("NotReady"));
    EXPECT_EQ(setupStatusName(SetupOutcome::Status::NeedsReauth), QStringLiteral("NeedsReauth"));
    EXPECT_EQ(setupStatusName(SetupOutcome::Status::NoDevices), QStringLiteral("NoDevices"));
}

} // namespace
} // namespace phicore::honeywell

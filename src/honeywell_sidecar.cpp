#include "honeywell_sidecar.h"

#include <algorithm>
#include <iostream>
#include <optional>
#include <utility>

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>

#include "honeywell_channels.h"
#include "honeywell_control.h"
#include "honeywell_schema.h"
#include "honeywell_tcc_session.h"

namespace phicore::honeywell::ipc {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

constexpr int kIdleWaitMs = 250;

QJsonObject parseObject(const std::string &json)
{
    const QByteArray bytes = QByteArray::fromStdString(json);
    if (bytes.trimmed().isEmpty())
        return {};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes);
    return doc.isObject() ? doc.object() : QJsonObject{};
}

v1::CmdStatus statusForSessionError(SessionErrorKind kind)
{
    switch (kind) {
    case SessionErrorKind::Timeout:
    case SessionErrorKind::ConnectionError:
    case SessionErrorKind::RateLimited:
    case SessionErrorKind::EmptyCookie:
        return v1::CmdStatus::TemporarilyOffline;
    default:
        break;
    }
    return v1::CmdStatus::Failure;
}

} // namespace

HoneywellSidecar::HoneywellSidecar() = default;

void HoneywellSidecar::tick()
{
    if (!m_hasBootstrap || !m_coordinator || m_needsReauth || m_setupHalted)
        return;

    if (!m_coordinator->isStarted()) {
        if (nowMs() >= m_nextStartAttemptMs)
            startCoordinator();
        return;
    }

    m_coordinator->tick();
}

int HoneywellSidecar::msUntilNextTick() const
{
    if (!m_hasBootstrap || !m_coordinator || m_needsReauth || m_setupHalted)
        return kIdleWaitMs;

    const std::int64_t due = m_coordinator->isStarted() ? m_coordinator->nextCycleDueMs() : m_nextStartAttemptMs;
    return static_cast<int>(std::clamp<std::int64_t>(due - nowMs(), 0, kIdleWaitMs));
}

void HoneywellSidecar::shutdown()
{
    if (m_coordinator)
        m_coordinator->stop();
    setConnectionState(false);
}

void HoneywellSidecar::onConnected()
{
    std::cerr << "honeywell-ipc connected" << '\n';
}

void HoneywellSidecar::onDisconnected()
{
    setConnectionState(false);
    std::cerr << "honeywell-ipc disconnected" << '\n';
}

void HoneywellSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);

    QString error;
    if (!applyBootstrapAdapter(request.adapter, &error)) {
        m_hasBootstrap = false;
        std::cerr << "honeywell-ipc bootstrap rejected: " << error.toStdString() << '\n';
        sendError(error.toStdString());
        return;
    }

    m_hasBootstrap = true;
    m_needsReauth = false;
    m_setupHalted = false;
    m_nextStartAttemptMs = 0;

    std::cerr << "honeywell-ipc bootstrap adapterId=" << request.adapterId
              << " externalId=" << request.adapter.externalId
              << " user=" << m_config.username.toStdString()
              << " pollIntervalSeconds=" << m_config.pollIntervalSeconds
              << '\n';
}

phicore::adapter::v1::CmdResponse HoneywellSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    if (!m_coordinator || !m_coordinator->isStarted())
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not ready"));

    const QString deviceId = QString::fromStdString(request.deviceExternalId);
    const QString channelId = QString::fromStdString(request.channelExternalId);

    const std::optional<DeviceSnapshot> snapshot = m_coordinator->currentSnapshot(deviceId);
    if (!snapshot)
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Unknown thermostat"));
    if (!request.hasScalarValue)
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("Value missing"));

    ControlChange change;
    QString changeError;
    if (!buildControlChange(channelId,
                            scalarToVariant(request.value),
                            snapshot->state,
                            m_config.awayFor(deviceId),
                            &change,
                            &changeError)) {
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, changeError);
    }

    const WriteResult result = m_coordinator->submitChange(deviceId, change);
    if (!result.ok)
        return failureResponse(request.cmdId, statusForSessionError(result.error.kind), formatError(result.error));

    CmdResponse resp = successResponse(request.cmdId);
    resp.finalValue = request.value;

    v1::Utf8String sendError;
    if (!sendChannelStateUpdated(request.deviceExternalId, request.channelExternalId, request.value, nowMs(), &sendError))
        std::cerr << "honeywell-ipc failed to send channelStateUpdated: " << sendError << '\n';
    return resp;
}

phicore::adapter::v1::ActionResponse HoneywellSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String("probe"))
        return invokeProbe(request);
    if (actionId == QLatin1String("refresh"))
        return invokeRefresh(request);
    if (actionId == QLatin1String("rediscover"))
        return invokeRediscover(request);
    if (actionId == QLatin1String("diagnostics"))
        return invokeDiagnostics(request);

    return actionFailure(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("Unsupported adapter action"));
}

phicore::adapter::v1::Utf8String HoneywellSidecar::displayName() const
{
    return phicore::honeywell::ipc::displayName();
}

phicore::adapter::v1::Utf8String HoneywellSidecar::description() const
{
    return phicore::honeywell::ipc::description();
}

phicore::adapter::v1::Utf8String HoneywellSidecar::iconSvg() const
{
    return phicore::honeywell::ipc::iconSvg();
}

phicore::adapter::v1::Utf8String HoneywellSidecar::apiVersion() const
{
    return "1.0.0";
}

int HoneywellSidecar::timeoutMs() const
{
    // A write or manual refresh may wait for a re-login plus one refresh.
    return m_config.refreshTimeoutSeconds * 1000 * 2 + 10000;
}

phicore::adapter::v1::AdapterCapabilities HoneywellSidecar::capabilities() const
{
    return phicore::honeywell::ipc::capabilities();
}

phicore::adapter::v1::JsonText HoneywellSidecar::configSchemaJson() const
{
    return phicore::honeywell::ipc::configSchemaJson();
}

std::int64_t HoneywellSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

bool HoneywellSidecar::applyBootstrapAdapter(const v1::Adapter &adapter, QString *error)
{
    QJsonObject meta = parseObject(adapter.metaJson);
    const QString token = QString::fromStdString(adapter.token);
    if (!meta.contains(QStringLiteral("password")) && !token.isEmpty())
        meta.insert(QStringLiteral("password"), token);

    InstallationConfig config;
    if (!parseInstallationConfig(meta, &config, error))
        return false;

    const bool sameSchedule = m_coordinator
        && config.pollIntervalSeconds == m_config.pollIntervalSeconds
        && config.refreshTimeoutSeconds == m_config.refreshTimeoutSeconds
        && config.baseUrl == m_config.baseUrl;
    m_config = config;

    auto session = std::make_shared<TccSession>(m_config.username, m_config.password, m_config.baseUrl);
    if (sameSchedule) {
        // Keep the snapshots; the next tick logs in with the new credentials.
        m_coordinator->replaceSession(std::move(session));
        return true;
    }

    resetCoordinator();
    m_coordinator = std::make_unique<Coordinator>(std::move(session), m_config.toCoordinatorSettings());
    m_subscription = m_coordinator->subscribe([this](const CycleResult &result) {
        handleCycle(result);
    });
    return true;
}

void HoneywellSidecar::resetCoordinator()
{
    if (!m_coordinator)
        return;
    m_coordinator->unsubscribe(m_subscription);
    m_coordinator->stop();
    m_coordinator.reset();
    m_subscription = 0;
}

void HoneywellSidecar::startCoordinator()
{
    const SetupOutcome outcome = m_coordinator->start();
    std::cerr << "honeywell-ipc setup " << setupStatusName(outcome.status).toStdString() << '\n';
    switch (outcome.status) {
    case SetupOutcome::Status::Ready:
        std::cerr << "honeywell-ipc ready with " << m_coordinator->deviceIds().size() << " thermostats" << '\n';
        return;
    case SetupOutcome::Status::NotReady: {
        setConnectionState(false);
        const int delayMs = std::max(1000, outcome.retryDelayMs);
        m_nextStartAttemptMs = nowMs() + delayMs;
        std::cerr << "honeywell-ipc setup deferred for " << delayMs << " ms: "
                  << outcome.message.toStdString() << '\n';
        return;
    }
    case SetupOutcome::Status::NeedsReauth:
        reportAuthFailure(outcome.message);
        return;
    case SetupOutcome::Status::NoDevices:
        setConnectionState(false);
        m_setupHalted = true;
        sendError("No thermostats found for this account");
        return;
    }
}

void HoneywellSidecar::handleCycle(const CycleResult &result)
{
    if (result.skipped)
        return;

    QString error;
    if (!publishSnapshots(result, &error))
        std::cerr << "honeywell-ipc publish failed: " << error.toStdString() << '\n';

    if (result.authFailed) {
        reportAuthFailure(result.error);
        return;
    }

    // Stale devices keep serving cached data; only auth failures and setup
    // errors take the adapter offline.
    setConnectionState(result.anyAvailable());
    if (!result.error.isEmpty())
        std::cerr << "honeywell-ipc cycle: " << result.error.toStdString() << '\n';

    v1::Utf8String sendError;
    sendFullSyncCompleted(&sendError);
}

bool HoneywellSidecar::publishSnapshots(const CycleResult &result, QString *error)
{
    v1::Utf8String sendError;

    for (const QString &deviceId : std::as_const(m_publishedDevices)) {
        if (result.snapshots.contains(deviceId))
            continue;
        if (!sendDeviceRemoved(deviceId.toStdString(), &sendError)) {
            if (error)
                *error = QString::fromStdString(sendError);
            return false;
        }
    }

    const std::int64_t ts = result.completedAtMs > 0 ? result.completedAtMs : nowMs();

    QSet<QString> published;
    for (auto it = result.snapshots.cbegin(); it != result.snapshots.cend(); ++it) {
        const DeviceEntry entry = buildDeviceEntry(it.value(), m_config);
        if (!sendDeviceUpdated(entry.device, entry.channels, &sendError)) {
            if (error)
                *error = QString::fromStdString(sendError);
            return false;
        }

        for (const v1::Channel &channel : entry.channels) {
            if (!channel.hasValue)
                continue;
            if (!sendChannelStateUpdated(entry.device.externalId,
                                         channel.externalId,
                                         channel.lastValue,
                                         ts,
                                         &sendError)) {
                if (error)
                    *error = QString::fromStdString(sendError);
                return false;
            }
        }
        published.insert(it.key());
    }

    m_publishedDevices = published;
    return true;
}

void HoneywellSidecar::reportAuthFailure(const QString &message)
{
    m_needsReauth = true;
    if (m_coordinator)
        m_coordinator->stop();
    setConnectionState(false);

    const QString text = message.isEmpty()
        ? QStringLiteral("Honeywell credentials rejected, enter new ones")
        : QStringLiteral("Honeywell credentials rejected: %1").arg(message);
    std::cerr << "honeywell-ipc " << text.toStdString() << '\n';
    sendError(text.toStdString());
}

void HoneywellSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error)) {
        std::cerr << "honeywell-ipc failed to send connectionStateChanged: " << error << '\n';
    }
}

phicore::adapter::v1::ActionResponse HoneywellSidecar::invokeProbe(const sdk::AdapterActionInvokeRequest &request)
{
    QJsonObject meta;
    meta.insert(QStringLiteral("username"), m_config.username);
    meta.insert(QStringLiteral("password"), m_config.password);
    if (m_config.baseUrl.isValid())
        meta.insert(QStringLiteral("baseUrl"), m_config.baseUrl.toString());

    const QJsonObject params = parseObject(request.paramsJson);
    for (auto it = params.constBegin(); it != params.constEnd(); ++it)
        meta.insert(it.key(), it.value());

    InstallationConfig config;
    QString error;
    if (!parseInstallationConfig(meta, &config, &error))
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, error);

    TccSession session(config.username, config.password, config.baseUrl);
    const LoginResult login = session.login(config.toCoordinatorSettings().login.loginTimeoutMs);
    if (!login.ok) {
        return actionFailure(request.cmdId, statusForSessionError(login.error.kind), formatError(login.error));
    }

    return actionSuccess(request.cmdId, QStringLiteral("Signed in as %1").arg(config.username));
}

phicore::adapter::v1::ActionResponse HoneywellSidecar::invokeRefresh(const sdk::AdapterActionInvokeRequest &request)
{
    if (!m_coordinator || !m_coordinator->isStarted())
        return actionFailure(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not ready"));

    const CycleResult result = m_coordinator->forceRefreshNow();
    if (result.skipped)
        return actionFailure(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("A refresh is already running"));
    if (result.authFailed)
        return actionFailure(request.cmdId, CmdStatus::Failure, result.error);

    return actionSuccess(request.cmdId,
                         QStringLiteral("%1 of %2 thermostats refreshed")
                             .arg(result.freshCount())
                             .arg(result.snapshots.size()));
}

phicore::adapter::v1::ActionResponse HoneywellSidecar::invokeRediscover(const sdk::AdapterActionInvokeRequest &request)
{
    if (!m_coordinator || !m_coordinator->isStarted())
        return actionFailure(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not ready"));

    QString error;
    if (!m_coordinator->rediscover(&error))
        return actionFailure(request.cmdId, CmdStatus::Failure, error);

    return actionSuccess(request.cmdId,
                         QStringLiteral("%1 thermostats known").arg(m_coordinator->deviceIds().size()));
}

phicore::adapter::v1::ActionResponse HoneywellSidecar::invokeDiagnostics(const sdk::AdapterActionInvokeRequest &request)
{
    if (!m_coordinator)
        return actionFailure(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));

    const QByteArray json = QJsonDocument(m_coordinator->diagnostics()).toJson(QJsonDocument::Compact);
    return actionSuccess(request.cmdId, QString::fromUtf8(json));
}

phicore::adapter::v1::CmdResponse HoneywellSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::CmdResponse HoneywellSidecar::successResponse(std::uint64_t cmdId) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::ActionResponse HoneywellSidecar::actionFailure(std::uint64_t cmdId,
                                                                     CmdStatus status,
                                                                     const QString &error) const
{
    ActionResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    response.resultType = v1::ActionResultType::None;
    return response;
}

phicore::adapter::v1::ActionResponse HoneywellSidecar::actionSuccess(std::uint64_t cmdId, const QString &message) const
{
    ActionResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    response.resultType = v1::ActionResultType::String;
    response.resultValue = message.toStdString();
    return response;
}

} // namespace phicore::honeywell::ipc

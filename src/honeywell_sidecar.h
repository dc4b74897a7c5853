#pragma once

#include <cstdint>
#include <memory>

#include <QSet>
#include <QString>

#include "honeywell_config.h"
#include "honeywell_coordinator.h"
#include "phi/adapter/sdk/sidecar.h"

namespace phicore::honeywell::ipc {

class HoneywellSidecar final : public phicore::adapter::sdk::AdapterSidecar
{
public:
    HoneywellSidecar();

    void tick();
    // Milliseconds until tick() has work to do; the host loop sleeps at most
    // this long between polls.
    int msUntilNextTick() const;
    // Stops polling before the host connection goes away.
    void shutdown();

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;

    phicore::adapter::v1::Utf8String displayName() const override;
    phicore::adapter::v1::Utf8String description() const override;
    phicore::adapter::v1::Utf8String iconSvg() const override;
    phicore::adapter::v1::Utf8String apiVersion() const override;
    int timeoutMs() const override;
    phicore::adapter::v1::AdapterCapabilities capabilities() const override;
    phicore::adapter::v1::JsonText configSchemaJson() const override;

private:
    using CmdResponse = phicore::adapter::v1::CmdResponse;
    using ActionResponse = phicore::adapter::v1::ActionResponse;
    using CmdStatus = phicore::adapter::v1::CmdStatus;

    static std::int64_t nowMs();

    bool applyBootstrapAdapter(const phicore::adapter::v1::Adapter &adapter, QString *error = nullptr);
    void resetCoordinator();
    void startCoordinator();

    void handleCycle(const CycleResult &result);
    bool publishSnapshots(const CycleResult &result, QString *error = nullptr);
    void reportAuthFailure(const QString &message);
    void setConnectionState(bool connected);

    ActionResponse invokeProbe(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeRefresh(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeRediscover(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeDiagnostics(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);

    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse successResponse(std::uint64_t cmdId) const;
    ActionResponse actionFailure(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    ActionResponse actionSuccess(std::uint64_t cmdId, const QString &message) const;

    InstallationConfig m_config;
    std::unique_ptr<Coordinator> m_coordinator;
    SubscriptionId m_subscription = 0;

    bool m_connected = false;
    bool m_hasBootstrap = false;
    // Credentials were rejected; polling stays off until new ones arrive.
    bool m_needsReauth = false;
    // Setup failed for good (no devices); a new bootstrap starts over.
    bool m_setupHalted = false;

    std::int64_t m_nextStartAttemptMs = 0;
    QSet<QString> m_publishedDevices;
};

} // namespace phicore::honeywell::ipc

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <QCoreApplication>
#include <QEventLoop>

#include "honeywell_schema.h"
#include "honeywell_sidecar.h"
#include "phi/adapter/sdk/sidecar.h"

namespace {

namespace sdk = phicore::adapter::sdk;
namespace v1 = phicore::adapter::v1;
using phicore::honeywell::ipc::HoneywellSidecar;

constexpr int kMinPollMs = 10;
constexpr int kPollFailureBackoffMs = 250;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

class HoneywellFactory final : public sdk::AdapterFactory
{
public:
    v1::Utf8String pluginType() const override
    {
        return phicore::honeywell::ipc::kPluginType;
    }

    std::unique_ptr<sdk::AdapterSidecar> create() const override
    {
        return std::make_unique<HoneywellSidecar>();
    }
};

v1::Utf8String resolveSocketPath(int argc, char **argv)
{
    if (argc > 1)
        return argv[1];
    if (const char *env = std::getenv("PHI_ADAPTER_SOCKET_PATH"))
        return env;
    return "/tmp/phi-adapter-honeywell-ipc.sock";
}

HoneywellSidecar *activeSidecar(sdk::SidecarHost &host)
{
    return dynamic_cast<HoneywellSidecar *>(host.adapter());
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const v1::Utf8String socketPath = resolveSocketPath(argc, argv);
    std::cerr << "phi_adapter_honeywell_ipc: pluginType=" << phicore::honeywell::ipc::kPluginType
              << " socket=" << socketPath << '\n';

    HoneywellFactory factory;
    sdk::SidecarHost host(socketPath, factory);

    v1::Utf8String error;
    if (!host.start(&error)) {
        std::cerr << "phi_adapter_honeywell_ipc: host start failed: " << error << '\n';
        return 1;
    }

    // Cycles run on this thread; refresh calls fan out to the coordinator's
    // pool and are joined before tick() returns. IPC is polled until the next
    // cycle is due.
    while (g_running.load()) {
        HoneywellSidecar *sidecar = activeSidecar(host);
        const int waitMs = sidecar ? std::max(kMinPollMs, sidecar->msUntilNextTick()) : kPollFailureBackoffMs;

        if (!host.pollOnce(std::chrono::milliseconds(waitMs), &error)) {
            std::cerr << "phi_adapter_honeywell_ipc: poll failed: " << error << '\n';
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollFailureBackoffMs));
        }

        if ((sidecar = activeSidecar(host)))
            sidecar->tick();

        QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    }

    if (HoneywellSidecar *sidecar = activeSidecar(host))
        sidecar->shutdown();
    host.stop();
    std::cerr << "phi_adapter_honeywell_ipc: stopped" << '\n';
    return 0;
}

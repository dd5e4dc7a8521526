#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <QCoreApplication>
#include <QEventLoop>

#include "tv_schema.h"
#include "tv_sidecar.h"
#include "phi/adapter/sdk/sidecar.h"

namespace {

namespace sdk = phicore::adapter::sdk;
namespace v1 = phicore::adapter::v1;
using phicore::samsungtv::ipc::SamsungTvSidecar;

constexpr std::chrono::milliseconds kPollSlice(250);
constexpr std::chrono::milliseconds kDrainSlice(50);
constexpr std::chrono::milliseconds kShutdownDrain(2000);
constexpr const char kDefaultSocketPath[] = "/tmp/phi-adapter-samsungtv-ipc.sock";

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

class SamsungTvFactory final : public sdk::AdapterFactory
{
public:
    v1::Utf8String pluginType() const override { return phicore::samsungtv::ipc::kPluginType; }

    std::unique_ptr<sdk::AdapterSidecar> create() const override
    {
        return std::make_unique<SamsungTvSidecar>();
    }
};

// argv[1], then PHI_ADAPTER_SOCKET_PATH, then the default path.
v1::Utf8String socketPathFrom(int argc, char **argv)
{
    if (argc > 1 && argv[1][0] != '\0')
        return argv[1];
    if (const char *env = std::getenv("PHI_ADAPTER_SOCKET_PATH"); env && *env)
        return env;
    return kDefaultSocketPath;
}

SamsungTvSidecar *sidecarOf(sdk::SidecarHost &host)
{
    return dynamic_cast<SamsungTvSidecar *>(host.adapter());
}

void pumpEvents()
{
    QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
}

// Lets UNSUBSCRIBE requests and the final meta patch leave before the host
// socket closes.
void drainAfterShutdown(sdk::SidecarHost &host)
{
    SamsungTvSidecar *sidecar = sidecarOf(host);
    if (!sidecar)
        return;
    sidecar->shutdown();

    v1::Utf8String error;
    const auto deadline = std::chrono::steady_clock::now() + kShutdownDrain;
    while (sidecar->hasPendingRequests() && std::chrono::steady_clock::now() < deadline) {
        if (!host.pollOnce(kDrainSlice, &error))
            break;
        pumpEvents();
    }
    if (sidecar->hasPendingRequests())
        std::cerr << "shutdown drain timed out with requests in flight" << '\n';
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("phi_adapter_samsungtv_ipc"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const v1::Utf8String socketPath = socketPathFrom(argc, argv);
    std::cerr << "starting phi_adapter_samsungtv_ipc for pluginType=" << phicore::samsungtv::ipc::kPluginType
              << " socket=" << socketPath << '\n';

    SamsungTvFactory factory;
    sdk::SidecarHost host(socketPath, factory);

    v1::Utf8String error;
    if (!host.start(&error)) {
        std::cerr << "failed to start sidecar host: " << error << '\n';
        return 1;
    }

    while (g_running.load()) {
        if (!host.pollOnce(kPollSlice, &error)) {
            std::cerr << "poll failed: " << error << '\n';
            std::this_thread::sleep_for(kPollSlice);
        }
        if (SamsungTvSidecar *sidecar = sidecarOf(host))
            sidecar->tick();
        pumpEvents();
    }

    drainAfterShutdown(host);
    host.stop();
    std::cerr << "stopping phi_adapter_samsungtv_ipc" << '\n';
    return 0;
}

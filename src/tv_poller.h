#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <QObject>
#include <QString>

#include "tv_types.h"
#include "tv_upnp.h"

namespace phicore::samsungtv::ipc {

class DiscoveryAggregator;
class NetworkProbes;
class ProtocolAdapter;

struct StatusReport {
    DeviceStatus status;
    // Set when the IP was re-resolved from the MAC.
    QString refreshedIp;
    // RenderingControl URLs learned during audio enrichment.
    std::optional<RenderingControlLocator::Urls> learnedUrls;
};

// One status check per call: liveness and power per api, then UPnP audio
// for whatever the info query left unknown. Tizen and HJ info come from the
// adapters' queryInfo.
class StatusPoller
{
public:
    using Callback = std::function<void(const StatusReport &)>;

    StatusPoller(NetworkProbes *probes,
                 ProtocolAdapter *tizen,
                 ProtocolAdapter *hj,
                 RenderingControlLocator *locator,
                 RenderingControlClient *rendering,
                 DiscoveryAggregator *discovery);

    void check(const Device &device, Callback done);

private:
    struct Run {
        Device device;
        StatusReport report;
        bool ipRetried = false;
        Callback done;
    };

    void checkWithIp(const std::shared_ptr<Run> &run);
    void checkTizen(const std::shared_ptr<Run> &run);
    void checkHj(const std::shared_ptr<Run> &run);
    void checkLegacy(const std::shared_ptr<Run> &run);
    void checkGeneric(const std::shared_ptr<Run> &run);
    void offline(const std::shared_ptr<Run> &run);
    void online(const std::shared_ptr<Run> &run, bool power);
    void enrichAudio(const std::shared_ptr<Run> &run);

    NetworkProbes *m_probes = nullptr;
    ProtocolAdapter *m_tizen = nullptr;
    ProtocolAdapter *m_hj = nullptr;
    RenderingControlLocator *m_locator = nullptr;
    RenderingControlClient *m_rendering = nullptr;
    DiscoveryAggregator *m_discovery = nullptr;
    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc

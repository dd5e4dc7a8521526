#pragma once

#include <cstdint>
#include <memory>

#include <QHash>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QString>

#include "phi/adapter/sdk/sidecar.h"
#include "tv_config.h"
#include "tv_hj.h"
#include "tv_host.h"
#include "tv_http.h"
#include "tv_legacy.h"
#include "tv_mdns.h"
#include "tv_netprobe.h"
#include "tv_secrets.h"
#include "tv_ssdp.h"
#include "tv_tizen.h"

namespace phicore::samsungtv::ipc {

class SamsungTvEngine;

class SamsungTvSidecar final : public phicore::adapter::sdk::AdapterSidecar, public HostBridge
{
public:
    SamsungTvSidecar();
    ~SamsungTvSidecar() override;

    void tick();
    // Stops the engine; UNSUBSCRIBE requests and the last meta patch may
    // still be in flight afterwards.
    void shutdown();
    bool hasPendingRequests() const;

    void persistDevices(const QJsonArray &devices) override;
    void persistSecrets(const QString &blob) override;
    void persistDeviceTrees(const QHash<QString, QString> &trees) override;
    void ensureDeviceTree(const Device &device) override;
    void removeDeviceTree(const QString &name) override;
    void migrateDeviceTree(const QString &oldName, const Device &device) override;
    void setState(const QString &deviceName, const QString &channelId, const QVariant &value) override;
    void reportError(const QString &message) override;

protected:
    void onConnected() override;
    void onDisconnected() override;
    void onBootstrap(const phicore::adapter::sdk::BootstrapRequest &request) override;

    phicore::adapter::v1::CmdResponse onChannelInvoke(
        const phicore::adapter::sdk::ChannelInvokeRequest &request) override;
    phicore::adapter::v1::ActionResponse onAdapterActionInvoke(
        const phicore::adapter::sdk::AdapterActionInvokeRequest &request) override;
    phicore::adapter::v1::CmdResponse onDeviceNameUpdate(
        const phicore::adapter::sdk::DeviceNameUpdateRequest &request) override;

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

    struct PublishedDevice {
        phicore::adapter::v1::Device device;
        phicore::adapter::v1::ChannelList channels;
        QHash<QString, phicore::adapter::v1::ScalarValue> values;
    };

    static std::int64_t nowMs();

    void startEngine(const EngineConfig &config);
    void stopEngine();
    void sendMetaPatch(const QJsonObject &patch);
    void setConnectionState(bool connected);

    ActionResponse invokeDiscover(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeGetDiscovered(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokePair(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);
    ActionResponse invokeAddDevice(const phicore::adapter::sdk::AdapterActionInvokeRequest &request);

    ActionResponse jsonResponse(std::uint64_t cmdId, const QJsonObject &result) const;
    ActionResponse actionFailure(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const;
    CmdResponse successResponse(std::uint64_t cmdId) const;

    QNetworkAccessManager m_network;
    HttpClient m_http;
    SystemNetworkProbes m_probes;
    SsdpDiscovery m_ssdp;
    SecretStore m_secrets;

    std::unique_ptr<MdnsDiscovery> m_mdns;
    std::unique_ptr<TizenAdapter> m_tizen;
    std::unique_ptr<HjAdapter> m_hj;
    std::unique_ptr<LegacyAdapter> m_legacy;
    std::unique_ptr<SamsungTvEngine> m_engine;

    QHash<QString, PublishedDevice> m_published;
    bool m_connected = false;
};

} // namespace phicore::samsungtv::ipc

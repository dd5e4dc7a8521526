#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QTimer>
#include <QVariant>

#include "tv_adapter.h"
#include "tv_config.h"
#include "tv_discovery.h"
#include "tv_registry.h"
#include "tv_types.h"
#include "tv_upnp.h"

namespace phicore::samsungtv::ipc {

class DeviceClassifier;
class HostBridge;
class HttpClient;
class NetworkProbes;
class SecretStore;
class StatusPoller;
struct StatusReport;

enum class ControlAcceptance {
    Accepted,
    UnknownDevice,
    UnknownChannel,
    ReadOnly
};

struct DiscoveryReply {
    CandidateList devices;
    std::int64_t lastScan = 0;

    QJsonObject toJson() const;
};

// Everything the engine talks to. Nothing here is owned by the engine.
struct EngineContext {
    HostBridge *host = nullptr;
    NetworkProbes *probes = nullptr;
    HttpClient *http = nullptr;
    SecretStore *secrets = nullptr;
    ProtocolAdapter *tizen = nullptr;
    ProtocolAdapter *hj = nullptr;
    ProtocolAdapter *legacy = nullptr;
    QList<DiscoveryTransport *> transports;
    RenderingControlLocator::LocateFn locate;
    std::function<std::int64_t()> clock;
};

class SamsungTvEngine
{
public:
    using CommandCallback = ProtocolAdapter::CommandCallback;
    using PairingCallback = ProtocolAdapter::PairingCallback;

    SamsungTvEngine(const EngineConfig &config, const EngineContext &context);
    ~SamsungTvEngine();

    SamsungTvEngine(const SamsungTvEngine &) = delete;
    SamsungTvEngine &operator=(const SamsungTvEngine &) = delete;

    void start();
    // Cancels timers, flushes a pending save and tears down subscriptions.
    void stop();
    bool isRunning() const { return m_running; }

    const EngineConfig &config() const { return m_config; }
    QList<Device> devices() const;
    std::optional<Device> deviceByName(const QString &name) const;
    bool isPaired(const Device &device) const;
    QHash<QString, QString> deviceTrees() const { return m_trees; }

    // Entry point for writes to <device>.control.*. The settled value is
    // written back once the command finishes.
    ControlAcceptance handleControl(const QString &deviceName, const QString &channelId, const QVariant &value);

    void discover(int timeoutSec, std::function<void(const DiscoveryReply &)> done);
    DiscoveryReply discovered() const;

    // seed is used when id does not name a configured device.
    void pair(const QString &id,
              const QString &pin,
              const std::optional<DiscoveredCandidate> &seed,
              PairingCallback done);

    // ipOrId names a discovered candidate; an empty name derives one.
    bool addDevice(const QString &ipOrId, const QString &name, Device *added = nullptr, QString *error = nullptr);
    bool renameDevice(const QString &deviceName, const QString &displayName, QString *newName = nullptr,
                      QString *error = nullptr);

    // Protocol routing with the Tizen -> HJ downgrade and the legacy fallback.
    void sendKey(const QString &deviceId, const QString &key, CommandCallback done);
    void setPower(const QString &deviceId, bool on, CommandCallback done);

    void pollDevice(const QString &deviceId);
    void applyUpnpEvent(const QString &deviceId, const AudioValues &values);

    bool hasPendingRequests() const;
    void flushPendingSave();

private:
    struct DeviceRuntime {
        AudioTelemetry audio;
        bool periodicPollRunning = false;
        std::optional<int> volume;
        std::optional<bool> muted;
    };

    std::optional<Device> device(const QString &id) const;
    std::int64_t now() const;

    void pollAll();
    void runPoll(const QString &deviceId, bool periodic);
    void applyStatus(const QString &deviceId, const StatusReport &report, bool periodic);
    void ensureSubscription(const Device &device);
    void schedulePoll(const QString &deviceId, int delayMs);
    void schedulePowerFallback(const QString &deviceId, bool targetOn, const QString &key, int delayMs);
    void applyPower(const QString &deviceId, bool on, const DeviceStatus &status, CommandCallback done);
    void powerOnFallthrough(const Device &device, const CommandResult &last, CommandCallback done);

    void runDiscovery(bool reconcileKnown, int timeoutSec, std::function<void(const DiscoveryReply &)> done);
    void applyReconcile(const ReconcileResult &result);
    void downgradeToHj(const QString &deviceId);
    void sendViaHj(const QString &deviceId, const QString &key, CommandCallback done);

    void sendVolumeStep(const Device &device, int delta);
    void sendMuteToggle(const Device &device);
    void sendButton(const Device &device, const QString &channelId, const QString &key);
    void reportFailure(const Device &device, const QString &command, const CommandResult &result);

    void updateInfoStates(const Device &device);
    void markSeen(const QString &deviceId);
    void setState(const QString &deviceId, const QString &channelId, const QVariant &value);
    void scheduleSave();
    void scheduleSecretsSave();
    void persistTrees();

    EngineConfig m_config;
    EngineContext m_ctx;

    std::unique_ptr<DeviceClassifier> m_classifier;
    std::unique_ptr<DiscoveryAggregator> m_discovery;
    std::unique_ptr<RenderingControlClient> m_rendering;
    std::unique_ptr<RenderingControlLocator> m_locator;
    std::unique_ptr<StatusPoller> m_poller;
    std::unique_ptr<UpnpSubscriptionManager> m_upnp;
    DeviceRegistry m_registry;

    QHash<QString, DeviceRuntime> m_runtime;
    QHash<QString, QString> m_trees;

    bool m_running = false;
    bool m_devicesDirty = false;
    bool m_secretsDirty = false;
    QTimer m_pollTimer;
    QTimer m_scanTimer;
    QTimer m_saveTimer;
    // Parent of delayed polls and fallbacks; cleared on stop.
    std::unique_ptr<QObject> m_scope;
};

} // namespace phicore::samsungtv::ipc

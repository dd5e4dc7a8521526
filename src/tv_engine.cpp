#include "tv_engine.h"

#include <algorithm>
#include <utility>

#include <QDateTime>
#include <QJsonArray>
#include <QPointer>

#include "tv_classifier.h"
#include "tv_hj.h"
#include "tv_host.h"
#include "tv_http.h"
#include "tv_identity.h"
#include "tv_keys.h"
#include "tv_log.h"
#include "tv_netprobe.h"
#include "tv_poller.h"
#include "tv_secrets.h"
#include "tv_telemetry.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kSaveDebounceMs = 1500;
constexpr int kMinPollDelayMs = 500;
constexpr int kMinFallbackDelayMs = 1000;
constexpr int kAudioRepollMs = 1200;
constexpr int kHjPortProbeMs = 1500;

const QString kControlPrefix = QStringLiteral("control.");

QString stringValue(const QVariant &value)
{
    if (value.typeId() != QMetaType::QString)
        return {};
    return value.toString().trimmed();
}

template <typename T>
QVariant optionalVariant(const std::optional<T> &value)
{
    return value.has_value() ? QVariant::fromValue(*value) : QVariant();
}

} // namespace

QJsonObject DiscoveryReply::toJson() const
{
    QJsonArray list;
    for (const DiscoveredCandidate &candidate : devices)
        list.append(candidate.toJson());
    QJsonObject out;
    out.insert(QStringLiteral("ok"), true);
    out.insert(QStringLiteral("devices"), list);
    out.insert(QStringLiteral("lastScan"), static_cast<double>(lastScan));
    return out;
}

SamsungTvEngine::SamsungTvEngine(const EngineConfig &config, const EngineContext &context)
    : m_config(config)
    , m_ctx(context)
    , m_scope(std::make_unique<QObject>())
{
    if (!m_ctx.clock)
        m_ctx.clock = []() { return QDateTime::currentMSecsSinceEpoch(); };

    m_classifier = std::make_unique<DeviceClassifier>(m_ctx.probes);
    m_discovery = std::make_unique<DiscoveryAggregator>(m_classifier.get(), m_ctx.clock);
    m_discovery->setTransports(m_ctx.transports);
    m_rendering = std::make_unique<RenderingControlClient>(m_ctx.http);
    m_locator = std::make_unique<RenderingControlLocator>(m_ctx.locate, m_ctx.probes, m_ctx.clock);
    m_poller = std::make_unique<StatusPoller>(m_ctx.probes, m_ctx.tizen, m_ctx.hj, m_locator.get(), m_rendering.get(),
                                              m_discovery.get());
    m_upnp = std::make_unique<UpnpSubscriptionManager>(
        m_ctx.http, m_ctx.probes, m_ctx.clock,
        [this](const QString &deviceId, const AudioValues &values) { applyUpnpEvent(deviceId, values); });

    m_saveTimer.setSingleShot(true);
    QObject::connect(&m_saveTimer, &QTimer::timeout, &m_saveTimer, [this]() { flushPendingSave(); });
    QObject::connect(&m_pollTimer, &QTimer::timeout, &m_pollTimer, [this]() { pollAll(); });
    QObject::connect(&m_scanTimer, &QTimer::timeout, &m_scanTimer, [this]() { runDiscovery(true, 0, {}); });
}

SamsungTvEngine::~SamsungTvEngine()
{
    stop();
}

void SamsungTvEngine::start()
{
    if (m_running)
        return;
    m_running = true;

    QString error;
    if (!m_ctx.secrets->load(m_config.tokens, &error))
        qCWarning(tvLog) << "Could not parse stored tokens:" << error;

    m_registry.load(m_config.devices);
    const QList<Device> configured = m_registry.devices();

    const TreePlan plan = planTreeReconciliation(m_config.deviceTrees, configured);
    for (const QString &name : plan.removals) {
        qCInfo(tvLog) << "Removing stale device tree" << name;
        m_ctx.host->removeDeviceTree(name);
    }
    for (const auto &rename : plan.renames) {
        const Device *device = m_registry.deviceByName(rename.second);
        if (!device)
            continue;
        qCInfo(tvLog) << "Renaming device tree" << rename.first << "->" << rename.second;
        m_ctx.host->migrateDeviceTree(rename.first, *device);
    }
    m_trees = plan.trees;

    for (const Device &device : configured) {
        if (!m_runtime.contains(device.id))
            m_runtime.insert(device.id, DeviceRuntime());
        m_ctx.host->ensureDeviceTree(device);
        updateInfoStates(device);
    }
    if (m_trees != m_config.deviceTrees)
        persistTrees();

    qCInfo(tvLog) << "Samsung TV engine started with" << configured.size() << "device(s)";

    m_pollTimer.start(m_config.pollIntervalSec * 1000);
    pollAll();

    if (m_config.autoScan) {
        m_scanTimer.start(m_config.autoScanIntervalSec * 1000);
        runDiscovery(true, 0, {});
    }
}

void SamsungTvEngine::stop()
{
    if (!m_running)
        return;
    m_running = false;

    m_pollTimer.stop();
    m_scanTimer.stop();
    // Cancels delayed polls and fallbacks and drops late callbacks.
    m_scope = std::make_unique<QObject>();
    flushPendingSave();
    m_upnp->dropAll();
    m_upnp->shutdown();
    for (DeviceRuntime &runtime : m_runtime)
        runtime.periodicPollRunning = false;

    qCInfo(tvLog) << "Samsung TV engine stopped";
}

QList<Device> SamsungTvEngine::devices() const
{
    return m_registry.devices();
}

std::optional<Device> SamsungTvEngine::deviceByName(const QString &name) const
{
    const Device *device = m_registry.deviceByName(name);
    if (!device)
        return std::nullopt;
    return *device;
}

bool SamsungTvEngine::isPaired(const Device &device) const
{
    return m_ctx.secrets->isPaired(device);
}

std::optional<Device> SamsungTvEngine::device(const QString &id) const
{
    const Device *device = m_registry.device(id);
    if (!device)
        return std::nullopt;
    return *device;
}

std::int64_t SamsungTvEngine::now() const
{
    return m_ctx.clock();
}

ControlAcceptance SamsungTvEngine::handleControl(const QString &deviceName,
                                                 const QString &channelId,
                                                 const QVariant &value)
{
    const Device *found = m_registry.deviceByName(deviceName);
    if (!found)
        return ControlAcceptance::UnknownDevice;
    const Device device = *found;
    const QString id = device.id;

    if (infoChannelIds().contains(channelId) || stateChannelIds().contains(channelId))
        return ControlAcceptance::ReadOnly;
    if (!controlChannelIds().contains(channelId))
        return ControlAcceptance::UnknownChannel;

    const QString command = channelId.mid(kControlPrefix.size());

    if (command == QLatin1String("power")) {
        const bool on = isTruthyValue(value);
        setPower(id, on, [this, device, id, on](const CommandResult &result) {
            if (!result.ok())
                reportFailure(device, QStringLiteral("power"), result);
            setState(id, QStringLiteral("control.power"), on);
            setState(id, QStringLiteral("state.power"), on);
        });
    } else if (command == QLatin1String("wol")) {
        if (m_config.enableWol && !device.mac.isEmpty()) {
            QString error;
            if (!m_ctx.probes->sendWakeOnLan(device.mac, &error))
                reportFailure(device, command, CommandResult::failure(CommandStatus::TransportError, error));
        }
        setState(id, channelId, false);
    } else if (command == QLatin1String("key")) {
        const QString raw = stringValue(value);
        if (raw.isEmpty()) {
            setState(id, channelId, QString());
            return ControlAcceptance::Accepted;
        }
        sendKey(id, normalizeKeyInput(raw), [this, device, id](const CommandResult &result) {
            if (!result.ok())
                reportFailure(device, QStringLiteral("key"), result);
            setState(id, QStringLiteral("control.key"), QString());
        });
    } else if (command == QLatin1String("volumeUp") || command == QLatin1String("volumeDown")) {
        if (isTruthyValue(value))
            sendVolumeStep(device, command == QLatin1String("volumeUp") ? 1 : -1);
    } else if (command == QLatin1String("mute")) {
        if (isTruthyValue(value))
            sendMuteToggle(device);
    } else if (command == QLatin1String("channelUp")) {
        if (isTruthyValue(value))
            sendButton(device, channelId, QStringLiteral("KEY_CHUP"));
    } else if (command == QLatin1String("channelDown")) {
        if (isTruthyValue(value))
            sendButton(device, channelId, QStringLiteral("KEY_CHDOWN"));
    } else if (command == QLatin1String("launchApp")) {
        const QString appId = stringValue(value);
        if (appId.isEmpty()) {
            setState(id, channelId, QString());
            return ControlAcceptance::Accepted;
        }
        ProtocolAdapter *adapter = device.api == ApiKind::Hj ? m_ctx.hj
            : device.api == ApiKind::Legacy                  ? m_ctx.legacy
                                                             : m_ctx.tizen;
        QPointer<QObject> scope(m_scope.get());
        adapter->launchApp(device, appId, [this, scope, device, id, appId](const CommandResult &result) {
            if (!scope)
                return;
            if (result.ok()) {
                markSeen(id);
                setState(id, QStringLiteral("state.app"), appId);
            } else {
                reportFailure(device, QStringLiteral("launchApp"), result);
            }
            setState(id, QStringLiteral("control.launchApp"), QString());
        });
    } else if (command == QLatin1String("source")) {
        const QString source = stringValue(value);
        if (source.isEmpty()) {
            setState(id, channelId, QString());
            return ControlAcceptance::Accepted;
        }
        sendKey(id, sourceKey(source), [this, device, id, source](const CommandResult &result) {
            if (result.ok())
                setState(id, QStringLiteral("state.source"), source);
            else
                reportFailure(device, QStringLiteral("source"), result);
            setState(id, QStringLiteral("control.source"), QString());
        });
    }
    return ControlAcceptance::Accepted;
}

void SamsungTvEngine::sendVolumeStep(const Device &device, int delta)
{
    const QString id = device.id;
    const QString channelId = delta > 0 ? QStringLiteral("control.volumeUp") : QStringLiteral("control.volumeDown");
    const QString key = delta > 0 ? QStringLiteral("KEY_VOLUP") : QStringLiteral("KEY_VOLDOWN");
    sendKey(id, key, [this, device, id, channelId, delta](const CommandResult &result) {
        setState(id, channelId, false);
        if (!result.ok()) {
            reportFailure(device, channelId.mid(kControlPrefix.size()), result);
            return;
        }
        auto runtime = m_runtime.find(id);
        if (runtime != m_runtime.end()) {
            const std::optional<int> current = runtime->volume.has_value() ? runtime->volume
                                                                           : runtime->audio.lastKnownVolume;
            if (current.has_value()) {
                const int next = std::clamp(*current + delta, 0, 100);
                noteLocalVolume(&runtime->audio, next, now());
                runtime->volume = next;
                setState(id, QStringLiteral("state.volume"), next);
            }
        }
        schedulePoll(id, kAudioRepollMs);
    });
}

void SamsungTvEngine::sendMuteToggle(const Device &device)
{
    const QString id = device.id;
    sendKey(id, QStringLiteral("KEY_MUTE"), [this, device, id](const CommandResult &result) {
        setState(id, QStringLiteral("control.mute"), false);
        if (!result.ok()) {
            reportFailure(device, QStringLiteral("mute"), result);
            return;
        }
        auto runtime = m_runtime.find(id);
        if (runtime != m_runtime.end()) {
            const bool current = runtime->muted.value_or(runtime->audio.lastKnownMuted.value_or(false));
            const bool next = !current;
            noteLocalMute(&runtime->audio, next, now());
            runtime->muted = next;
            setState(id, QStringLiteral("state.muted"), next);
        }
        schedulePoll(id, kAudioRepollMs);
    });
}

void SamsungTvEngine::sendButton(const Device &device, const QString &channelId, const QString &key)
{
    const QString id = device.id;
    sendKey(id, key, [this, device, id, channelId](const CommandResult &result) {
        if (!result.ok())
            reportFailure(device, channelId.mid(kControlPrefix.size()), result);
        setState(id, channelId, false);
    });
}

void SamsungTvEngine::reportFailure(const Device &device, const QString &command, const CommandResult &result)
{
    const QString message = QStringLiteral("Failed to execute %1 for %2 (%3): %4")
                                .arg(command, device.name, commandStatusToString(result.status), result.error);
    qCWarning(tvLog).noquote() << message;
    m_ctx.host->reportError(message);
}

void SamsungTvEngine::sendKey(const QString &deviceId, const QString &key, CommandCallback done)
{
    const std::optional<Device> target = device(deviceId);
    if (!target.has_value()) {
        done(CommandResult::failure(CommandStatus::InvalidArgument,
                                    QStringLiteral("Unknown device %1").arg(deviceId)));
        return;
    }

    QPointer<QObject> scope(m_scope.get());
    auto finish = [this, scope, deviceId, done](const CommandResult &result) {
        if (!scope)
            return;
        if (result.ok())
            markSeen(deviceId);
        done(result);
    };

    switch (target->api) {
    case ApiKind::Hj:
        m_ctx.hj->sendKey(*target, key, finish);
        return;
    case ApiKind::Legacy:
        m_ctx.legacy->sendKey(*target, key, finish);
        return;
    case ApiKind::Tizen:
    case ApiKind::Unknown:
        break;
    }

    const Device snapshot = *target;
    const bool unknownApi = snapshot.api == ApiKind::Unknown;
    m_ctx.tizen->sendKey(snapshot, key, [this, scope, snapshot, key, unknownApi, finish](const CommandResult &result) {
        if (!scope)
            return;
        if (result.ok()) {
            finish(result);
            return;
        }
        if (result.status != CommandStatus::Unsupported) {
            if (unknownApi) {
                qCDebug(tvLog) << "Tizen send failed for" << snapshot.name << "- trying legacy:" << result.error;
                m_ctx.legacy->sendKey(snapshot, key, finish);
                return;
            }
            finish(result);
            return;
        }

        auto onHjPort = [this, scope, snapshot, key, unknownApi, finish, result](bool reachable) {
            if (!scope)
                return;
            if (reachable) {
                downgradeToHj(snapshot.id);
                sendViaHj(snapshot.id, key, finish);
                return;
            }
            if (unknownApi) {
                m_ctx.legacy->sendKey(snapshot, key, finish);
                return;
            }
            finish(result);
        };
        if (snapshot.hjAvailable == std::optional<bool>(true)) {
            onHjPort(true);
            return;
        }
        m_ctx.probes->checkPort(snapshot.ip, kHjSessionPort, kHjPortProbeMs, onHjPort);
    });
}

void SamsungTvEngine::sendViaHj(const QString &deviceId, const QString &key, CommandCallback done)
{
    const std::optional<Device> target = device(deviceId);
    if (!target.has_value()) {
        done(CommandResult::failure(CommandStatus::InvalidArgument,
                                    QStringLiteral("Unknown device %1").arg(deviceId)));
        return;
    }
    m_ctx.hj->sendKey(*target, key, std::move(done));
}

void SamsungTvEngine::downgradeToHj(const QString &deviceId)
{
    const std::optional<Device> target = device(deviceId);
    if (!target.has_value())
        return;
    qCWarning(tvLog).noquote() << QStringLiteral("Tizen remote unsupported for %1, switching to HJ").arg(target->name);

    DeviceAttributes observed;
    observed.api = ApiKind::Hj;
    observed.protocol = QStringLiteral("ws");
    observed.port = kHjSessionPort;
    observed.hjAvailable = true;
    applyReconcile(m_registry.reconcile(observed, deviceId));
}

void SamsungTvEngine::setPower(const QString &deviceId, bool on, CommandCallback done)
{
    const std::optional<Device> target = device(deviceId);
    if (!target.has_value()) {
        done(CommandResult::failure(CommandStatus::InvalidArgument,
                                    QStringLiteral("Unknown device %1").arg(deviceId)));
        return;
    }
    QPointer<QObject> scope(m_scope.get());
    m_poller->check(*target, [this, scope, deviceId, on, done](const StatusReport &report) {
        if (!scope)
            return;
        applyPower(deviceId, on, report.status, done);
    });
}

void SamsungTvEngine::applyPower(const QString &deviceId, bool on, const DeviceStatus &status, CommandCallback done)
{
    const std::optional<Device> target = device(deviceId);
    if (!target.has_value()) {
        done(CommandResult::failure(CommandStatus::InvalidArgument,
                                    QStringLiteral("Unknown device %1").arg(deviceId)));
        return;
    }
    const Device snapshot = *target;
    const bool hj = snapshot.api == ApiKind::Hj;

    if (!on) {
        if (!status.power) {
            done(CommandResult::success());
            return;
        }
        sendKey(deviceId, QStringLiteral("KEY_POWER"), [this, deviceId, hj, done](const CommandResult &result) {
            if (result.ok()) {
                schedulePoll(deviceId, 3000);
                if (hj)
                    schedulePowerFallback(deviceId, false, QStringLiteral("KEY_POWEROFF"), 5000);
                done(result);
                return;
            }
            if (!hj) {
                done(result);
                return;
            }
            qCDebug(tvLog) << "KEY_POWER failed, retrying:" << result.error;
            sendKey(deviceId, QStringLiteral("KEY_POWER"), [this, deviceId, done](const CommandResult &retry) {
                if (retry.ok())
                    schedulePoll(deviceId, 3000);
                done(retry);
            });
        });
        return;
    }

    if (status.power) {
        done(CommandResult::success());
        return;
    }

    if (hj && m_config.enableWol && !snapshot.mac.isEmpty()) {
        QString error;
        if (!m_ctx.probes->sendWakeOnLan(snapshot.mac, &error)) {
            done(CommandResult::failure(CommandStatus::TransportError, error));
            return;
        }
        schedulePoll(deviceId, 6000);
        schedulePowerFallback(deviceId, true, QStringLiteral("KEY_POWER"), 8000);
        done(CommandResult::success());
        return;
    }

    if (!status.online) {
        powerOnFallthrough(snapshot, CommandResult::failure(CommandStatus::TransportError,
                                                            QStringLiteral("%1 is offline").arg(snapshot.name)),
                           done);
        return;
    }

    if (!hj) {
        sendKey(deviceId, QStringLiteral("KEY_POWER"), [this, snapshot, deviceId, done](const CommandResult &result) {
            if (result.ok()) {
                schedulePoll(deviceId, 4000);
                done(result);
                return;
            }
            powerOnFallthrough(snapshot, result, done);
        });
        return;
    }

    sendKey(deviceId, QStringLiteral("KEY_POWERON"), [this, snapshot, deviceId, done](const CommandResult &result) {
        if (result.ok()) {
            schedulePoll(deviceId, 4000);
            schedulePowerFallback(deviceId, true, QStringLiteral("KEY_POWER"), 6000);
            done(result);
            return;
        }
        qCDebug(tvLog) << "KEY_POWERON failed for" << snapshot.name << "- trying KEY_POWER:" << result.error;
        sendKey(deviceId, QStringLiteral("KEY_POWER"), [this, snapshot, deviceId, done](const CommandResult &retry) {
            if (retry.ok()) {
                schedulePoll(deviceId, 4000);
                done(retry);
                return;
            }
            powerOnFallthrough(snapshot, retry, done);
        });
    });
}

void SamsungTvEngine::powerOnFallthrough(const Device &device, const CommandResult &last, CommandCallback done)
{
    if (!m_config.enableWol || device.mac.isEmpty()) {
        done(last);
        return;
    }
    QString error;
    if (!m_ctx.probes->sendWakeOnLan(device.mac, &error)) {
        done(CommandResult::failure(CommandStatus::TransportError, error));
        return;
    }
    schedulePoll(device.id, 6000);
    done(CommandResult::success());
}

void SamsungTvEngine::schedulePowerFallback(const QString &deviceId, bool targetOn, const QString &key, int delayMs)
{
    QTimer::singleShot(std::max(kMinFallbackDelayMs, delayMs), m_scope.get(), [this, deviceId, targetOn, key]() {
        const std::optional<Device> target = device(deviceId);
        if (!target.has_value())
            return;
        QPointer<QObject> scope(m_scope.get());
        m_poller->check(*target, [this, scope, deviceId, targetOn, key](const StatusReport &report) {
            if (!scope)
                return;
            if (!report.status.online || report.status.power == targetOn)
                return;
            qCDebug(tvLog) << "Power fallback" << key << "for" << deviceId;
            sendKey(deviceId, key, [this, deviceId, key](const CommandResult &result) {
                if (!result.ok())
                    qCDebug(tvLog) << "Power fallback" << key << "failed:" << result.error;
                schedulePoll(deviceId, 3000);
            });
        });
    });
}

void SamsungTvEngine::schedulePoll(const QString &deviceId, int delayMs)
{
    QTimer::singleShot(std::max(kMinPollDelayMs, delayMs), m_scope.get(),
                       [this, deviceId]() { runPoll(deviceId, false); });
}

void SamsungTvEngine::pollDevice(const QString &deviceId)
{
    runPoll(deviceId, false);
}

void SamsungTvEngine::pollAll()
{
    for (const Device &device : m_registry.devices()) {
        DeviceRuntime &runtime = m_runtime[device.id];
        if (runtime.periodicPollRunning) {
            qCDebug(tvLog) << "Previous poll still running for" << device.name;
            continue;
        }
        runtime.periodicPollRunning = true;
        runPoll(device.id, true);
    }
}

void SamsungTvEngine::runPoll(const QString &deviceId, bool periodic)
{
    const std::optional<Device> target = device(deviceId);
    if (!target.has_value())
        return;
    QPointer<QObject> scope(m_scope.get());
    m_poller->check(*target, [this, scope, deviceId, periodic](const StatusReport &report) {
        if (!scope)
            return;
        applyStatus(deviceId, report, periodic);
    });
}

void SamsungTvEngine::applyStatus(const QString &deviceId, const StatusReport &report, bool periodic)
{
    if (periodic) {
        auto runtime = m_runtime.find(deviceId);
        if (runtime != m_runtime.end())
            runtime->periodicPollRunning = false;
    }
    if (!m_registry.contains(deviceId))
        return;

    QString id = deviceId;
    DeviceAttributes observed;
    observed.ip = report.refreshedIp;
    observed.mac = report.status.reportedMac;
    if (report.learnedUrls.has_value()) {
        observed.renderingControlUrl = report.learnedUrls->controlUrl;
        observed.renderingControlEventUrl = report.learnedUrls->eventUrl;
    }
    if (!observed.ip.isEmpty() || !observed.mac.isEmpty() || report.learnedUrls.has_value()) {
        const ReconcileResult result = m_registry.reconcile(observed, deviceId);
        applyReconcile(result);
        for (const IdChange &change : result.idChanges) {
            if (change.oldId == id)
                id = change.newId;
        }
    }

    const std::optional<Device> target = device(id);
    if (!target.has_value())
        return;

    DeviceRuntime &runtime = m_runtime[id];
    const DeviceStatus &status = report.status;
    const AudioValues audio = resolveAudioStates(&runtime.audio, status, now());
    runtime.volume = audio.volume;
    runtime.muted = audio.muted;

    setState(id, QStringLiteral("info.online"), status.online);
    setState(id, QStringLiteral("state.power"), status.power);
    setState(id, QStringLiteral("control.power"), status.power);
    setState(id, QStringLiteral("state.volume"), optionalVariant(audio.volume));
    setState(id, QStringLiteral("state.muted"), optionalVariant(audio.muted));

    if (!status.online)
        return;
    markSeen(id);
    if (target->api == ApiKind::Hj)
        ensureSubscription(*target);
}

void SamsungTvEngine::ensureSubscription(const Device &device)
{
    if (!device.renderingControlEventUrl.isEmpty()) {
        m_upnp->ensure(device.id, device.renderingControlEventUrl, device.ip);
        return;
    }

    RenderingControlLocator::Urls known { device.renderingControlUrl, device.renderingControlEventUrl };
    std::optional<RenderingControlLocator::Urls> fromDiscovery;
    const std::optional<DiscoveredCandidate> candidate = m_discovery->discoveredForIp(device.ip);
    if (candidate.has_value()
        && (!candidate->renderingControlUrl.isEmpty() || !candidate->renderingControlEventUrl.isEmpty())) {
        fromDiscovery = RenderingControlLocator::Urls { candidate->renderingControlUrl,
                                                        candidate->renderingControlEventUrl };
    }

    const QString id = device.id;
    QPointer<QObject> scope(m_scope.get());
    m_locator->resolve(id, device.ip, known, fromDiscovery,
                       [this, scope, id](const RenderingControlLocator::Urls &urls) {
        if (!scope || urls.eventUrl.isEmpty())
            return;
        DeviceAttributes observed;
        observed.renderingControlUrl = urls.controlUrl;
        observed.renderingControlEventUrl = urls.eventUrl;
        applyReconcile(m_registry.reconcile(observed, id));
        const std::optional<Device> target = this->device(id);
        if (target.has_value())
            m_upnp->ensure(id, urls.eventUrl, target->ip);
    });
}

void SamsungTvEngine::applyUpnpEvent(const QString &deviceId, const AudioValues &values)
{
    if (!m_registry.contains(deviceId))
        return;

    DeviceStatus status;
    status.online = true;
    status.volume = values.volume;
    status.muted = values.muted;
    if (values.volume.has_value())
        status.volumeSource = AudioSource::Upnp;
    if (values.muted.has_value())
        status.mutedSource = AudioSource::Upnp;

    DeviceRuntime &runtime = m_runtime[deviceId];
    const AudioValues audio = resolveAudioStates(&runtime.audio, status, now());
    if (values.volume.has_value()) {
        runtime.volume = audio.volume;
        setState(deviceId, QStringLiteral("state.volume"), optionalVariant(audio.volume));
    }
    if (values.muted.has_value()) {
        runtime.muted = audio.muted;
        setState(deviceId, QStringLiteral("state.muted"), optionalVariant(audio.muted));
    }
    setState(deviceId, QStringLiteral("info.online"), true);
    markSeen(deviceId);
}

void SamsungTvEngine::discover(int timeoutSec, std::function<void(const DiscoveryReply &)> done)
{
    runDiscovery(false, timeoutSec, std::move(done));
}

DiscoveryReply SamsungTvEngine::discovered() const
{
    DiscoveryReply reply;
    reply.devices = m_discovery->discovered();
    reply.lastScan = m_discovery->lastScan();
    return reply;
}

void SamsungTvEngine::runDiscovery(bool reconcileKnown,
                                   int timeoutSec,
                                   std::function<void(const DiscoveryReply &)> done)
{
    const int seconds = clampDiscoveryTimeoutSec(timeoutSec > 0 ? timeoutSec : m_config.discoveryTimeoutSec);
    QPointer<QObject> scope(m_scope.get());
    m_discovery->scan(seconds * 1000, [this, scope, reconcileKnown, done](const CandidateList &found) {
        if (!scope)
            return;
        qCDebug(tvLog) << "Discovery found" << found.size() << "candidate(s)";
        if (reconcileKnown) {
            for (const DiscoveredCandidate &candidate : found)
                applyReconcile(m_registry.reconcile(candidate));
        }
        if (!done)
            return;
        DiscoveryReply reply;
        reply.devices = found;
        reply.lastScan = m_discovery->lastScan();
        done(reply);
    });
}

void SamsungTvEngine::applyReconcile(const ReconcileResult &result)
{
    for (const IdChange &change : result.idChanges) {
        m_ctx.secrets->renameDevice(change.oldId, change.newId);
        scheduleSecretsSave();
        if (m_runtime.contains(change.oldId)) {
            DeviceRuntime runtime = m_runtime.take(change.oldId);
            runtime.periodicPollRunning = false;
            m_runtime.insert(change.newId, runtime);
        }
        m_locator->forget(change.oldId);
        m_upnp->drop(change.oldId);
        bool treesChanged = false;
        for (auto it = m_trees.begin(); it != m_trees.end(); ++it) {
            if (it.value() == change.oldId) {
                it.value() = change.newId;
                treesChanged = true;
            }
        }
        if (treesChanged)
            persistTrees();
    }
    for (const QString &id : result.changedIds) {
        const std::optional<Device> changed = device(id);
        if (changed.has_value())
            updateInfoStates(*changed);
    }
    if (result.changed)
        scheduleSave();
}

void SamsungTvEngine::pair(const QString &id,
                           const QString &pin,
                           const std::optional<DiscoveredCandidate> &seed,
                           PairingCallback done)
{
    std::optional<Device> target = device(normalizeDeviceId(id));
    if (!target.has_value())
        target = deviceByName(id);
    const bool configured = target.has_value();

    std::optional<DiscoveredCandidate> candidate = seed;
    if (!configured && !candidate.has_value()) {
        const QString wanted = normalizeDeviceId(id);
        for (const DiscoveredCandidate &known : m_discovery->discovered()) {
            if (known.ip == id || (!wanted.isEmpty() && normalizeDeviceId(known.id) == wanted)) {
                candidate = known;
                break;
            }
        }
    }
    if (!configured && candidate.has_value()) {
        DiscoveredCandidate record = *candidate;
        Device transient;
        static_cast<DeviceAttributes &>(transient) = record;
        QString derived;
        for (const QString &value : { record.id, record.uuid, record.usn, id, record.ip }) {
            derived = normalizeDeviceId(value);
            if (!derived.isEmpty())
                break;
        }
        transient.id = derived;
        if (transient.api == ApiKind::Unknown)
            transient.api = ApiKind::Tizen;
        transient.displayName = record.name;
        transient.name = sanitizeName(record.name);
        if (transient.name.isEmpty())
            transient.name = fallbackName(transient.id);
        record.id = transient.id;
        record.sources.insert(QString::fromLatin1(kSourcePair));
        m_discovery->remember(record);
        target = transient;
    }

    if (!target.has_value()) {
        PairingResult result;
        result.error = QStringLiteral("Unknown device: %1").arg(id);
        done(result);
        return;
    }
    if (target->ip.isEmpty()) {
        PairingResult result;
        result.error = QStringLiteral("No IP address known for %1").arg(target->name);
        done(result);
        return;
    }

    QPointer<QObject> scope(m_scope.get());
    const Device snapshot = *target;

    if (snapshot.api == ApiKind::Hj) {
        m_ctx.hj->pair(snapshot, pin, [this, scope, snapshot, configured, done](const PairingResult &result) {
            if (!scope)
                return;
            if (result.ok && result.identity.has_value()) {
                m_ctx.secrets->setHjIdentity(snapshot.id, *result.identity);
                scheduleSecretsSave();
                qCInfo(tvLog) << "Paired HJ device" << snapshot.name;
                if (configured)
                    setState(snapshot.id, QStringLiteral("info.paired"), true);
            } else if (!result.ok) {
                qCWarning(tvLog).noquote() << result.error;
            }
            done(result);
        });
        return;
    }

    if (snapshot.api == ApiKind::Legacy) {
        m_ctx.legacy->pair(snapshot, pin, [scope, snapshot, done](const PairingResult &result) {
            if (!scope)
                return;
            if (result.ok)
                qCInfo(tvLog) << "Legacy remote access granted by" << snapshot.name;
            else
                qCWarning(tvLog).noquote() << "Legacy pairing failed for" << snapshot.name << ":" << result.error;
            done(result);
        });
        return;
    }

    m_ctx.tizen->queryInfo(snapshot, [this, scope, snapshot, configured, done](const InfoResult &info) {
        if (!scope)
            return;
        Device refreshed = snapshot;
        if (info.ok) {
            const TizenInfo parsed = extractTizenInfo(info.info);
            applyTizenInfo(&refreshed, parsed);
            if (configured) {
                DeviceAttributes observed;
                observed.mac = parsed.mac;
                observed.model = parsed.model;
                observed.tokenAuthSupport = parsed.tokenAuthSupport;
                const ReconcileResult result = m_registry.reconcile(observed, refreshed.id);
                applyReconcile(result);
                for (const IdChange &change : result.idChanges) {
                    if (change.oldId == refreshed.id)
                        refreshed.id = change.newId;
                }
                const std::optional<Device> stored = device(refreshed.id);
                if (stored.has_value())
                    refreshed = *stored;
            }
        }

        m_ctx.tizen->pair(refreshed, QString(), [this, scope, refreshed, configured, done](
                                                    const PairingResult &result) {
            if (!scope)
                return;
            if (!result.ok) {
                qCWarning(tvLog).noquote() << "Tizen pairing failed for" << refreshed.name << ":" << result.error
                                           << result.hint;
                done(result);
                return;
            }
            m_ctx.secrets->setTizenToken(refreshed.id, result.token);
            scheduleSecretsSave();
            qCInfo(tvLog) << "Paired Tizen device" << refreshed.name;
            if (configured) {
                if (refreshed.api != ApiKind::Tizen) {
                    DeviceAttributes observed;
                    observed.api = ApiKind::Tizen;
                    applyReconcile(m_registry.reconcile(observed, refreshed.id));
                }
                setState(refreshed.id, QStringLiteral("info.paired"), true);
            }
            done(result);
        });
    });
}

bool SamsungTvEngine::addDevice(const QString &ipOrId, const QString &name, Device *added, QString *error)
{
    const QString key = ipOrId.trimmed();
    const QString wanted = normalizeDeviceId(key);
    std::optional<DiscoveredCandidate> candidate;
    for (const DiscoveredCandidate &known : m_discovery->discovered()) {
        if (known.ip == key || (!wanted.isEmpty() && normalizeDeviceId(known.id) == wanted)) {
            candidate = known;
            break;
        }
    }
    if (!candidate.has_value()) {
        if (error)
            *error = QStringLiteral("No discovered device matches %1").arg(key);
        return false;
    }

    Device device;
    if (!m_registry.addDevice(*candidate, name, &device, error))
        return false;

    m_runtime.insert(device.id, DeviceRuntime());
    m_ctx.host->ensureDeviceTree(device);
    updateInfoStates(device);
    m_trees.insert(device.name, device.id);
    persistTrees();
    scheduleSave();
    if (m_running)
        runPoll(device.id, false);
    if (added)
        *added = device;
    return true;
}

bool SamsungTvEngine::renameDevice(const QString &deviceName,
                                   const QString &displayName,
                                   QString *newName,
                                   QString *error)
{
    const Device *current = m_registry.deviceByName(deviceName);
    if (!current) {
        if (error)
            *error = QStringLiteral("Unknown device: %1").arg(deviceName);
        return false;
    }
    const QString id = current->id;
    const QString oldName = current->name;
    const QString slug = m_registry.rename(id, displayName);
    const std::optional<Device> renamed = device(id);
    if (!renamed.has_value()) {
        if (error)
            *error = QStringLiteral("Unknown device: %1").arg(deviceName);
        return false;
    }

    if (slug != oldName) {
        qCInfo(tvLog) << "Renaming device tree" << oldName << "->" << slug;
        m_ctx.host->migrateDeviceTree(oldName, *renamed);
        m_trees.remove(oldName);
        m_trees.insert(slug, id);
        persistTrees();
    }
    scheduleSave();
    if (newName)
        *newName = slug;
    return true;
}

bool SamsungTvEngine::hasPendingRequests() const
{
    return (m_ctx.http && m_ctx.http->hasPending()) || m_discovery->isRunning();
}

void SamsungTvEngine::updateInfoStates(const Device &device)
{
    HostBridge *host = m_ctx.host;
    host->setState(device.name, QStringLiteral("info.id"), device.id);
    host->setState(device.name, QStringLiteral("info.ip"), device.ip);
    host->setState(device.name, QStringLiteral("info.mac"), device.mac);
    host->setState(device.name, QStringLiteral("info.model"), device.model);
    host->setState(device.name, QStringLiteral("info.uuid"), device.uuid);
    host->setState(device.name, QStringLiteral("info.api"), apiKindToString(device.api));
    host->setState(device.name, QStringLiteral("info.paired"), isPaired(device));
    if (device.tokenAuthSupport.has_value())
        host->setState(device.name, QStringLiteral("info.tokenAuthSupport"), *device.tokenAuthSupport);
}

void SamsungTvEngine::markSeen(const QString &deviceId)
{
    setState(deviceId, QStringLiteral("info.lastSeen"), QVariant::fromValue<qint64>(now()));
}

void SamsungTvEngine::setState(const QString &deviceId, const QString &channelId, const QVariant &value)
{
    const Device *target = m_registry.device(deviceId);
    if (!target)
        return;
    m_ctx.host->setState(target->name, channelId, value);
}

void SamsungTvEngine::scheduleSave()
{
    m_devicesDirty = true;
    m_saveTimer.start(kSaveDebounceMs);
}

void SamsungTvEngine::scheduleSecretsSave()
{
    m_secretsDirty = true;
    m_saveTimer.start(kSaveDebounceMs);
}

void SamsungTvEngine::flushPendingSave()
{
    m_saveTimer.stop();
    if (m_devicesDirty) {
        m_devicesDirty = false;
        m_ctx.host->persistDevices(m_registry.rawDevices());
    }
    if (m_secretsDirty) {
        m_secretsDirty = false;
        m_ctx.host->persistSecrets(m_ctx.secrets->serialize());
    }
}

void SamsungTvEngine::persistTrees()
{
    m_ctx.host->persistDeviceTrees(m_trees);
}

} // namespace phicore::samsungtv::ipc

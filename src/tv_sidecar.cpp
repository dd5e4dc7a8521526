#include "tv_sidecar.h"

#include <iostream>
#include <memory>
#include <optional>

#include <QDateTime>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTimer>

#include "tv_engine.h"
#include "tv_log.h"
#include "tv_schema.h"

namespace phicore::samsungtv::ipc {

namespace {

namespace v1 = phicore::adapter::v1;
namespace sdk = phicore::adapter::sdk;

constexpr int kActionGraceMs = 15000;
constexpr int kPairWaitMs = 45000;

template <typename T>
struct WaitState {
    std::optional<T> value;
    QEventLoop *loop = nullptr;
};

// Runs the event loop until the async operation answers or timeoutMs passes.
template <typename T, typename Start>
std::optional<T> waitFor(Start start, int timeoutMs)
{
    auto state = std::make_shared<WaitState<T>>();
    QEventLoop loop;
    state->loop = &loop;
    start([state](const T &value) {
        state->value = value;
        if (state->loop)
            state->loop->quit();
    });
    if (!state->value.has_value()) {
        QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
        loop.exec();
    }
    state->loop = nullptr;
    return state->value;
}

v1::ScalarValue toScalar(const QVariant &value)
{
    if (!value.isValid() || value.isNull())
        return v1::ScalarValue {};
    switch (value.typeId()) {
    case QMetaType::Bool:
        return value.toBool();
    case QMetaType::Int:
    case QMetaType::LongLong:
    case QMetaType::UInt:
    case QMetaType::ULongLong:
        return static_cast<std::int64_t>(value.toLongLong());
    case QMetaType::Double:
        return value.toDouble();
    default:
        return value.toString().toStdString();
    }
}

QVariant fromScalar(const v1::ScalarValue &value)
{
    if (const auto *b = std::get_if<bool>(&value))
        return *b;
    if (const auto *i = std::get_if<std::int64_t>(&value))
        return QVariant::fromValue<qint64>(*i);
    if (const auto *d = std::get_if<double>(&value))
        return *d;
    if (const auto *s = std::get_if<std::string>(&value))
        return QString::fromStdString(*s);
    return {};
}

v1::Channel makeChannel(const QString &externalId,
                        const char *name,
                        v1::ChannelDataType dataType,
                        bool writable,
                        v1::ChannelKind kind = v1::ChannelKind::Unknown)
{
    v1::Channel channel;
    channel.externalId = externalId.toStdString();
    channel.name = name;
    channel.kind = kind;
    channel.dataType = dataType;
    channel.flags = writable ? v1::kChannelFlagDefaultWrite : v1::kChannelFlagDefaultRead;
    return channel;
}

v1::ChannelList buildChannels()
{
    using DT = v1::ChannelDataType;
    v1::ChannelList channels;
    channels.push_back(makeChannel(QStringLiteral("info.id"), "Device id", DT::String, false));
    channels.push_back(makeChannel(QStringLiteral("info.ip"), "IP address", DT::String, false));
    channels.push_back(makeChannel(QStringLiteral("info.mac"), "MAC address", DT::String, false));
    channels.push_back(makeChannel(QStringLiteral("info.model"), "Model", DT::String, false));
    channels.push_back(makeChannel(QStringLiteral("info.uuid"), "UUID", DT::String, false));
    channels.push_back(makeChannel(QStringLiteral("info.api"), "Protocol", DT::String, false));
    channels.push_back(makeChannel(QStringLiteral("info.lastSeen"), "Last seen", DT::Int, false));
    channels.push_back(makeChannel(QStringLiteral("info.paired"), "Paired", DT::Bool, false));
    channels.push_back(makeChannel(QStringLiteral("info.online"), "Online", DT::Bool, false));
    channels.push_back(makeChannel(QStringLiteral("info.tokenAuthSupport"), "Token auth", DT::Bool, false));

    channels.push_back(makeChannel(QStringLiteral("state.power"), "Power state", DT::Bool, false,
                                   v1::ChannelKind::PowerOnOff));
    v1::Channel volume = makeChannel(QStringLiteral("state.volume"), "Volume", DT::Int, false);
    volume.minValue = 0;
    volume.maxValue = 100;
    volume.stepValue = 1.0;
    channels.push_back(volume);
    channels.push_back(makeChannel(QStringLiteral("state.muted"), "Muted", DT::Bool, false));
    channels.push_back(makeChannel(QStringLiteral("state.app"), "App", DT::String, false));
    channels.push_back(makeChannel(QStringLiteral("state.source"), "Source", DT::String, false));

    channels.push_back(makeChannel(QStringLiteral("control.power"), "Power", DT::Bool, true,
                                   v1::ChannelKind::PowerOnOff));
    channels.push_back(makeChannel(QStringLiteral("control.wol"), "Wake-on-LAN", DT::Bool, true));
    channels.push_back(makeChannel(QStringLiteral("control.key"), "Send key", DT::String, true));
    channels.push_back(makeChannel(QStringLiteral("control.volumeUp"), "Volume up", DT::Bool, true));
    channels.push_back(makeChannel(QStringLiteral("control.volumeDown"), "Volume down", DT::Bool, true));
    channels.push_back(makeChannel(QStringLiteral("control.mute"), "Mute", DT::Bool, true));
    channels.push_back(makeChannel(QStringLiteral("control.channelUp"), "Channel up", DT::Bool, true));
    channels.push_back(makeChannel(QStringLiteral("control.channelDown"), "Channel down", DT::Bool, true));
    channels.push_back(makeChannel(QStringLiteral("control.launchApp"), "Launch app", DT::String, true));
    channels.push_back(makeChannel(QStringLiteral("control.source"), "Source", DT::String, true));
    return channels;
}

v1::Device buildDevice(const Device &device)
{
    v1::Device out;
    out.externalId = device.name.toStdString();
    out.name = (device.displayName.isEmpty() ? device.name : device.displayName).toStdString();
    out.deviceClass = v1::DeviceClass::Unknown;
    out.manufacturer = "Samsung";
    out.model = device.model.toStdString();

    QJsonObject meta;
    meta.insert(QStringLiteral("id"), device.id);
    meta.insert(QStringLiteral("api"), apiKindToString(device.api));
    out.metaJson = QJsonDocument(meta).toJson(QJsonDocument::Compact).toStdString();
    return out;
}

QJsonObject parseParams(const sdk::AdapterActionInvokeRequest &request)
{
    if (request.paramsJson.empty())
        return {};
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(request.paramsJson));
    return doc.isObject() ? doc.object() : QJsonObject();
}

QJsonObject pairingToJson(const PairingResult &result)
{
    QJsonObject out;
    out.insert(QStringLiteral("ok"), result.ok);
    if (result.needsPin)
        out.insert(QStringLiteral("needsPin"), true);
    if (!result.token.isEmpty())
        out.insert(QStringLiteral("token"), result.token);
    if (result.identity.has_value())
        out.insert(QStringLiteral("identity"), result.identity->toJson());
    if (!result.ok) {
        out.insert(QStringLiteral("error"), result.error);
        if (!result.hint.isEmpty())
            out.insert(QStringLiteral("hint"), result.hint);
    }
    return out;
}

} // namespace

SamsungTvSidecar::SamsungTvSidecar()
    : m_http(&m_network)
    , m_probes(&m_http)
{
}

SamsungTvSidecar::~SamsungTvSidecar()
{
    stopEngine();
}

void SamsungTvSidecar::tick()
{
    setConnectionState(m_engine && m_engine->isRunning());
}

void SamsungTvSidecar::shutdown()
{
    stopEngine();
}

bool SamsungTvSidecar::hasPendingRequests() const
{
    return m_http.hasPending();
}

void SamsungTvSidecar::onConnected()
{
    std::cerr << "samsungtv-ipc connected" << '\n';
}

void SamsungTvSidecar::onDisconnected()
{
    setConnectionState(false);
    std::cerr << "samsungtv-ipc disconnected" << '\n';
}

void SamsungTvSidecar::onBootstrap(const sdk::BootstrapRequest &request)
{
    AdapterSidecar::onBootstrap(request);

    QJsonObject meta;
    const QByteArray metaBytes = QByteArray::fromStdString(request.adapter.metaJson);
    if (!metaBytes.trimmed().isEmpty()) {
        const QJsonDocument metaDoc = QJsonDocument::fromJson(metaBytes);
        if (metaDoc.isObject())
            meta = metaDoc.object();
    }
    const EngineConfig config = EngineConfig::fromMeta(meta);

    std::cerr << "samsungtv-ipc bootstrap adapterId=" << request.adapterId
              << " devices=" << config.devices.size()
              << " pollInterval=" << config.pollIntervalSec
              << " autoScan=" << (config.autoScan ? "true" : "false")
              << '\n';

    stopEngine();
    startEngine(config);
}

void SamsungTvSidecar::startEngine(const EngineConfig &config)
{
    m_tizen = std::make_unique<TizenAdapter>(&m_secrets, &m_probes, config.clientName);
    m_hj = std::make_unique<HjAdapter>(&m_http, &m_secrets, &m_probes, config.hjKeyFile);
    m_legacy = std::make_unique<LegacyAdapter>(&m_probes, config.clientName);

    EngineContext context;
    context.host = this;
    context.probes = &m_probes;
    context.http = &m_http;
    context.secrets = &m_secrets;
    context.tizen = m_tizen.get();
    context.hj = m_hj.get();
    context.legacy = m_legacy.get();
    if (config.enableSsdp)
        context.transports.append(&m_ssdp);
    if (config.enableMdns) {
        m_mdns = std::make_unique<MdnsDiscovery>(config.mdnsServices);
        context.transports.append(m_mdns.get());
    }
    context.locate = [this](const QString &ip,
                            const QString &searchTarget,
                            int timeoutMs,
                            std::function<void(const QString &)> done) {
        m_ssdp.locate(ip, searchTarget, timeoutMs, std::move(done));
    };

    m_engine = std::make_unique<SamsungTvEngine>(config, context);
    m_engine->start();
    setConnectionState(true);
}

void SamsungTvSidecar::stopEngine()
{
    if (!m_engine)
        return;
    m_engine->stop();
    m_engine.reset();
    m_legacy.reset();
    m_hj.reset();
    m_tizen.reset();
    m_mdns.reset();
    setConnectionState(false);
}

phicore::adapter::v1::CmdResponse SamsungTvSidecar::onChannelInvoke(const sdk::ChannelInvokeRequest &request)
{
    if (!m_engine)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));

    const QString deviceName = QString::fromStdString(request.deviceExternalId);
    const QString channelId = QString::fromStdString(request.channelExternalId);
    const QVariant value = request.hasScalarValue ? fromScalar(request.value) : QVariant();

    switch (m_engine->handleControl(deviceName, channelId, value)) {
    case ControlAcceptance::UnknownDevice:
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument,
                               QStringLiteral("Unknown device %1").arg(deviceName));
    case ControlAcceptance::UnknownChannel:
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument,
                               QStringLiteral("Unknown channel %1").arg(channelId));
    case ControlAcceptance::ReadOnly:
        return failureResponse(request.cmdId, CmdStatus::NotSupported,
                               QStringLiteral("Channel %1 is read-only").arg(channelId));
    case ControlAcceptance::Accepted:
        break;
    }
    return successResponse(request.cmdId);
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::onAdapterActionInvoke(const sdk::AdapterActionInvokeRequest &request)
{
    if (!m_engine)
        return actionFailure(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));

    const QString actionId = QString::fromStdString(request.actionId);
    if (actionId == QLatin1String("discover"))
        return invokeDiscover(request);
    if (actionId == QLatin1String("getDiscovered"))
        return invokeGetDiscovered(request);
    if (actionId == QLatin1String("pair"))
        return invokePair(request);
    if (actionId == QLatin1String("addDevice"))
        return invokeAddDevice(request);

    return actionFailure(request.cmdId, CmdStatus::NotImplemented, QStringLiteral("Unsupported adapter action"));
}

phicore::adapter::v1::CmdResponse SamsungTvSidecar::onDeviceNameUpdate(const sdk::DeviceNameUpdateRequest &request)
{
    if (request.deviceExternalId.empty())
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("deviceExternalId missing"));
    if (request.name.empty())
        return failureResponse(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("name missing"));
    if (!m_engine)
        return failureResponse(request.cmdId, CmdStatus::TemporarilyOffline, QStringLiteral("Adapter not bootstrapped"));

    QString error;
    if (!m_engine->renameDevice(QString::fromStdString(request.deviceExternalId),
                                QString::fromStdString(request.name),
                                nullptr,
                                &error)) {
        return failureResponse(request.cmdId, CmdStatus::Failure, error);
    }
    return successResponse(request.cmdId);
}

phicore::adapter::v1::Utf8String SamsungTvSidecar::displayName() const
{
    return phicore::samsungtv::ipc::displayName();
}

phicore::adapter::v1::Utf8String SamsungTvSidecar::description() const
{
    return phicore::samsungtv::ipc::description();
}

phicore::adapter::v1::Utf8String SamsungTvSidecar::iconSvg() const
{
    return phicore::samsungtv::ipc::iconSvg();
}

phicore::adapter::v1::Utf8String SamsungTvSidecar::apiVersion() const
{
    return "1.0.0";
}

int SamsungTvSidecar::timeoutMs() const
{
    return kPairWaitMs + 5000;
}

phicore::adapter::v1::AdapterCapabilities SamsungTvSidecar::capabilities() const
{
    return phicore::samsungtv::ipc::capabilities();
}

phicore::adapter::v1::JsonText SamsungTvSidecar::configSchemaJson() const
{
    return phicore::samsungtv::ipc::configSchemaJson();
}

std::int64_t SamsungTvSidecar::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

void SamsungTvSidecar::persistDevices(const QJsonArray &devices)
{
    QJsonObject patch;
    patch.insert(QStringLiteral("devices"), devices);
    sendMetaPatch(patch);
}

void SamsungTvSidecar::persistSecrets(const QString &blob)
{
    QJsonObject patch;
    patch.insert(QStringLiteral("tokens"), blob);
    sendMetaPatch(patch);
}

void SamsungTvSidecar::persistDeviceTrees(const QHash<QString, QString> &trees)
{
    QJsonObject map;
    for (auto it = trees.cbegin(); it != trees.cend(); ++it)
        map.insert(it.key(), it.value());
    QJsonObject patch;
    patch.insert(QStringLiteral("deviceTrees"), map);
    sendMetaPatch(patch);
}

void SamsungTvSidecar::sendMetaPatch(const QJsonObject &patch)
{
    v1::Utf8String sendError;
    const QByteArray bytes = QJsonDocument(patch).toJson(QJsonDocument::Compact);
    if (!sendAdapterMetaUpdated(bytes.toStdString(), &sendError))
        qCWarning(tvLog) << "Failed to persist adapter meta:" << QString::fromStdString(sendError);
}

void SamsungTvSidecar::ensureDeviceTree(const Device &device)
{
    PublishedDevice &published = m_published[device.name];
    published.device = buildDevice(device);
    if (published.channels.empty())
        published.channels = buildChannels();

    v1::Utf8String sendError;
    if (!sendDeviceUpdated(published.device, published.channels, &sendError))
        qCWarning(tvLog) << "Failed to publish device" << device.name << ":" << QString::fromStdString(sendError);
}

void SamsungTvSidecar::removeDeviceTree(const QString &name)
{
    m_published.remove(name);
    v1::Utf8String sendError;
    if (!sendDeviceRemoved(name.toStdString(), &sendError))
        qCWarning(tvLog) << "Failed to remove device" << name << ":" << QString::fromStdString(sendError);
}

void SamsungTvSidecar::migrateDeviceTree(const QString &oldName, const Device &device)
{
    const QHash<QString, v1::ScalarValue> cached = m_published.value(oldName).values;
    ensureDeviceTree(device);

    const std::int64_t ts = nowMs();
    PublishedDevice &published = m_published[device.name];
    v1::Utf8String sendError;
    for (auto it = cached.cbegin(); it != cached.cend(); ++it) {
        published.values.insert(it.key(), it.value());
        if (!sendChannelStateUpdated(device.name.toStdString(), it.key().toStdString(), it.value(), ts, &sendError))
            qCWarning(tvLog) << "Failed to copy" << it.key() << "to" << device.name << ":"
                             << QString::fromStdString(sendError);
    }
    if (oldName != device.name)
        removeDeviceTree(oldName);
}

void SamsungTvSidecar::setState(const QString &deviceName, const QString &channelId, const QVariant &value)
{
    const v1::ScalarValue scalar = toScalar(value);
    m_published[deviceName].values.insert(channelId, scalar);

    v1::Utf8String sendError;
    if (!sendChannelStateUpdated(deviceName.toStdString(), channelId.toStdString(), scalar, nowMs(), &sendError))
        qCDebug(tvLog) << "Failed to update" << deviceName << channelId << ":" << QString::fromStdString(sendError);
}

void SamsungTvSidecar::reportError(const QString &message)
{
    sendError(message.toStdString());
}

void SamsungTvSidecar::setConnectionState(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    v1::Utf8String error;
    if (!sendConnectionStateChanged(connected, &error)) {
        std::cerr << "samsungtv-ipc failed to send connectionStateChanged: " << error << '\n';
    }
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::invokeDiscover(const sdk::AdapterActionInvokeRequest &request)
{
    const QJsonObject params = parseParams(request);
    const int timeoutSec = readIntSetting(params, QStringLiteral("timeout"), 0);
    const int waitMs = clampDiscoveryTimeoutSec(timeoutSec > 0 ? timeoutSec : m_engine->config().discoveryTimeoutSec)
            * 1000
        + kActionGraceMs;

    SamsungTvEngine *engine = m_engine.get();
    const std::optional<DiscoveryReply> reply = waitFor<DiscoveryReply>(
        [engine, timeoutSec](std::function<void(const DiscoveryReply &)> done) {
            engine->discover(timeoutSec, std::move(done));
        },
        waitMs);
    if (!reply.has_value())
        return actionFailure(request.cmdId, CmdStatus::Failure, QStringLiteral("Discovery timed out"));
    return jsonResponse(request.cmdId, reply->toJson());
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::invokeGetDiscovered(const sdk::AdapterActionInvokeRequest &request)
{
    return jsonResponse(request.cmdId, m_engine->discovered().toJson());
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::invokePair(const sdk::AdapterActionInvokeRequest &request)
{
    const QJsonObject params = parseParams(request);
    const QString id = params.value(QStringLiteral("id")).toString().trimmed();
    const QString pin = params.value(QStringLiteral("pin")).toVariant().toString().trimmed();
    std::optional<DiscoveredCandidate> seed;
    if (params.value(QStringLiteral("device")).isObject())
        seed = DiscoveredCandidate::fromJson(params.value(QStringLiteral("device")).toObject());
    if (id.isEmpty() && !seed.has_value())
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("id missing"));

    SamsungTvEngine *engine = m_engine.get();
    const std::optional<PairingResult> result = waitFor<PairingResult>(
        [engine, id, pin, seed](std::function<void(const PairingResult &)> done) {
            engine->pair(id, pin, seed, std::move(done));
        },
        kPairWaitMs);
    if (!result.has_value())
        return actionFailure(request.cmdId, CmdStatus::Failure, QStringLiteral("Pairing timed out"));
    return jsonResponse(request.cmdId, pairingToJson(*result));
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::invokeAddDevice(const sdk::AdapterActionInvokeRequest &request)
{
    const QJsonObject params = parseParams(request);
    QString key = params.value(QStringLiteral("ip")).toString().trimmed();
    if (key.isEmpty())
        key = params.value(QStringLiteral("id")).toString().trimmed();
    if (key.isEmpty())
        return actionFailure(request.cmdId, CmdStatus::InvalidArgument, QStringLiteral("ip or id missing"));

    Device added;
    QString error;
    if (!m_engine->addDevice(key, params.value(QStringLiteral("name")).toString(), &added, &error)) {
        QJsonObject out;
        out.insert(QStringLiteral("ok"), false);
        out.insert(QStringLiteral("error"), error);
        return jsonResponse(request.cmdId, out);
    }

    QJsonObject device;
    device.insert(QStringLiteral("id"), added.id);
    device.insert(QStringLiteral("name"), added.name);
    QJsonObject out;
    out.insert(QStringLiteral("ok"), true);
    out.insert(QStringLiteral("device"), device);
    return jsonResponse(request.cmdId, out);
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::jsonResponse(std::uint64_t cmdId, const QJsonObject &result) const
{
    ActionResponse response;
    response.id = cmdId;
    response.tsMs = nowMs();
    response.status = CmdStatus::Success;
    response.resultType = v1::ActionResultType::String;
    response.resultValue = QJsonDocument(result).toJson(QJsonDocument::Compact).toStdString();
    return response;
}

phicore::adapter::v1::ActionResponse SamsungTvSidecar::actionFailure(std::uint64_t cmdId,
                                                                     CmdStatus status,
                                                                     const QString &error) const
{
    ActionResponse response;
    response.id = cmdId;
    response.tsMs = nowMs();
    response.status = status;
    response.error = error.toStdString();
    response.resultType = v1::ActionResultType::None;
    return response;
}

phicore::adapter::v1::CmdResponse SamsungTvSidecar::failureResponse(std::uint64_t cmdId, CmdStatus status, const QString &error) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = status;
    response.error = error.toStdString();
    response.tsMs = nowMs();
    return response;
}

phicore::adapter::v1::CmdResponse SamsungTvSidecar::successResponse(std::uint64_t cmdId) const
{
    CmdResponse response;
    response.id = cmdId;
    response.status = CmdStatus::Success;
    response.tsMs = nowMs();
    return response;
}

} // namespace phicore::samsungtv::ipc

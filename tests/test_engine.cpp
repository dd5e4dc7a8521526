#include "tv_engine.h"

#include <memory>
#include <optional>

#include <QJsonArray>
#include <QJsonObject>
#include <QNetworkAccessManager>

#include <gtest/gtest.h>

#include "fakes.h"
#include "tv_http.h"
#include "tv_secrets.h"

using namespace phicore::samsungtv::ipc;
using namespace phicore::samsungtv::ipc::testing;

namespace {

const QString kLivingIp = QStringLiteral("192.168.1.20");

QJsonObject tizenInfo(const QString &power, int volume, bool muted)
{
    return QJsonObject {
        { QStringLiteral("device"),
          QJsonObject {
              { QStringLiteral("PowerState"), power },
              { QStringLiteral("volume"), volume },
              { QStringLiteral("mute"), muted },
          } },
    };
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        config.pollIntervalSec = 3600;
        config.devices = QJsonArray {
            QJsonObject {
                { QStringLiteral("id"), QStringLiteral("uuid:aaaa-1111") },
                { QStringLiteral("name"), QStringLiteral("Living Room") },
                { QStringLiteral("ip"), QStringLiteral("192.168.1.20") },
                { QStringLiteral("mac"), QStringLiteral("aa:bb:cc:dd:ee:01") },
                { QStringLiteral("api"), QStringLiteral("tizen") },
            },
            QJsonObject {
                { QStringLiteral("ip"), QStringLiteral("192.168.1.30") },
                { QStringLiteral("name"), QStringLiteral("Den") },
            },
        };
    }

    void TearDown() override
    {
        if (engine)
            engine->stop();
    }

    void start()
    {
        EngineContext context;
        context.host = &host;
        context.probes = &probes;
        context.http = &http;
        context.secrets = &secrets;
        context.tizen = &tizen;
        context.hj = &hj;
        context.legacy = &legacy;
        context.transports = { &transport };
        context.clock = [this]() { return now; };
        engine = std::make_unique<SamsungTvEngine>(config, context);
        engine->start();
    }

    QString deviceId(const QString &name) const
    {
        const std::optional<Device> device = engine->deviceByName(name);
        return device.has_value() ? device->id : QString();
    }

    EngineConfig config;
    FakeHost host;
    FakeProbes probes;
    QNetworkAccessManager manager;
    HttpClient http { &manager };
    SecretStore secrets;
    FakeAdapter tizen { ApiKind::Tizen };
    FakeAdapter hj { ApiKind::Hj };
    FakeAdapter legacy { ApiKind::Legacy };
    FakeTransport transport;
    std::int64_t now = 100000;
    std::unique_ptr<SamsungTvEngine> engine;
};

// ============================================================
// Startup
// ============================================================

TEST_F(EngineTest, StartPublishesTreesAndInfo)
{
    start();

    EXPECT_TRUE(host.trees.contains(QStringLiteral("living-room")));
    EXPECT_TRUE(host.trees.contains(QStringLiteral("den")));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("info.api")).toString(), QStringLiteral("tizen"));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("info.paired")).toBool(), false);
    EXPECT_EQ(host.persistedTrees.value(QStringLiteral("living-room")), QStringLiteral("aaaa-1111"));
    EXPECT_EQ(host.persistedTrees.value(QStringLiteral("den")), QStringLiteral("192.168.1.30"));
}

TEST_F(EngineTest, StartReconcilesPublishedTrees)
{
    config.deviceTrees = {
        { QStringLiteral("old-living"), QStringLiteral("aaaa-1111") },
        { QStringLiteral("ghost"), QStringLiteral("zzzz") },
    };
    start();

    EXPECT_EQ(host.removed, QStringList { QStringLiteral("ghost") });
    ASSERT_EQ(host.migrations.size(), 1);
    EXPECT_EQ(host.migrations.first().first, QStringLiteral("old-living"));
    EXPECT_EQ(host.migrations.first().second, QStringLiteral("living-room"));
    EXPECT_FALSE(engine->deviceTrees().contains(QStringLiteral("ghost")));
}

TEST_F(EngineTest, StartupPollWritesOnlineState)
{
    tizen.infoByIp.insert(kLivingIp, tizenInfo(QStringLiteral("on"), 20, false));
    start();

    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("info.online")).toBool(), true);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.power")).toBool(), true);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.volume")).toInt(), 20);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.muted")).toBool(), false);
    EXPECT_TRUE(host.hasState(QStringLiteral("living-room"), QStringLiteral("info.lastSeen")));

    EXPECT_EQ(host.state(QStringLiteral("den"), QStringLiteral("info.online")).toBool(), false);
    EXPECT_FALSE(host.state(QStringLiteral("den"), QStringLiteral("state.volume")).isValid());
}

TEST_F(EngineTest, PollFollowsDeviceToNewIpFromMac)
{
    probes.ipByMac.insert(QStringLiteral("aa:bb:cc:dd:ee:01"), QStringLiteral("192.168.1.21"));
    tizen.infoByIp.insert(QStringLiteral("192.168.1.21"), tizenInfo(QStringLiteral("on"), 10, false));
    start();

    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("info.ip")).toString(),
              QStringLiteral("192.168.1.21"));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("info.online")).toBool(), true);

    engine->flushPendingSave();
    EXPECT_EQ(host.devicePersists, 1);
    EXPECT_EQ(host.persistedDevices.at(0).toObject().value(QStringLiteral("ip")).toString(),
              QStringLiteral("192.168.1.21"));
}

TEST_F(EngineTest, PollAsksAdaptersForInfo)
{
    config.devices.append(QJsonObject {
        { QStringLiteral("id"), QStringLiteral("hj-bedroom") },
        { QStringLiteral("name"), QStringLiteral("Bedroom") },
        { QStringLiteral("ip"), QStringLiteral("192.168.1.40") },
        { QStringLiteral("api"), QStringLiteral("hj") },
    });
    tizen.infoByIp.insert(kLivingIp, tizenInfo(QStringLiteral("on"), 20, false));
    hj.infoByIp.insert(QStringLiteral("192.168.1.40"), tizenInfo(QStringLiteral("on"), 12, true));
    start();

    EXPECT_EQ(tizen.infoQueries, QStringList { kLivingIp });
    EXPECT_EQ(hj.infoQueries, QStringList { QStringLiteral("192.168.1.40") });
    EXPECT_TRUE(probes.fetchedUrls.isEmpty());
    EXPECT_EQ(host.state(QStringLiteral("bedroom"), QStringLiteral("info.online")).toBool(), true);
    EXPECT_EQ(host.state(QStringLiteral("bedroom"), QStringLiteral("state.power")).toBool(), true);
    EXPECT_EQ(host.state(QStringLiteral("bedroom"), QStringLiteral("state.volume")).toInt(), 12);
    EXPECT_EQ(host.state(QStringLiteral("bedroom"), QStringLiteral("state.muted")).toBool(), true);
}

TEST_F(EngineTest, HjPollFallsBackToPingWithoutInfo)
{
    config.devices.append(QJsonObject {
        { QStringLiteral("id"), QStringLiteral("hj-bedroom") },
        { QStringLiteral("name"), QStringLiteral("Bedroom") },
        { QStringLiteral("ip"), QStringLiteral("192.168.1.40") },
        { QStringLiteral("api"), QStringLiteral("hj") },
    });
    probes.pingable.insert(QStringLiteral("192.168.1.40"));
    start();

    EXPECT_EQ(hj.infoQueries, QStringList { QStringLiteral("192.168.1.40") });
    EXPECT_EQ(host.state(QStringLiteral("bedroom"), QStringLiteral("info.online")).toBool(), true);
    EXPECT_EQ(host.state(QStringLiteral("bedroom"), QStringLiteral("state.power")).toBool(), false);
}

TEST_F(EngineTest, PollAnsweredAfterTeardownIsDropped)
{
    tizen.holdInfo = true;
    start();
    ASSERT_FALSE(tizen.heldInfo.isEmpty());

    const QStringList checksBefore = probes.portChecks;
    engine->stop();
    engine.reset();
    tizen.releaseInfo();

    EXPECT_EQ(probes.portChecks, checksBefore);
    EXPECT_FALSE(probes.portChecks.contains(QStringLiteral("192.168.1.20:8001")));
    EXPECT_FALSE(host.hasState(QStringLiteral("living-room"), QStringLiteral("info.online")));
}

TEST_F(EngineTest, ScanUpgradesIpOnlyDeviceId)
{
    config.autoScan = true;
    DiscoveredCandidate seen;
    seen.ip = QStringLiteral("192.168.1.30");
    seen.sources.insert(QString::fromLatin1(kSourceSsdp));
    transport.batch = { seen };
    probes.json.insert(QStringLiteral("https://192.168.1.30:8002/api/v2/"), QJsonObject {
        { QStringLiteral("device"),
          QJsonObject {
              { QStringLiteral("name"), QStringLiteral("[TV] Den") },
              { QStringLiteral("id"), QStringLiteral("uuid:cccc-3333") },
          } },
    });
    start();

    EXPECT_EQ(transport.scans, 1);
    EXPECT_EQ(deviceId(QStringLiteral("den")), QStringLiteral("cccc-3333"));
    EXPECT_EQ(engine->deviceTrees().value(QStringLiteral("den")), QStringLiteral("cccc-3333"));
    EXPECT_EQ(host.persistedTrees.value(QStringLiteral("den")), QStringLiteral("cccc-3333"));
}

// ============================================================
// Control channels
// ============================================================

TEST_F(EngineTest, ControlAcceptance)
{
    start();

    EXPECT_EQ(engine->handleControl(QStringLiteral("attic"), QStringLiteral("control.key"), QStringLiteral("home")),
              ControlAcceptance::UnknownDevice);
    EXPECT_EQ(engine->handleControl(QStringLiteral("living-room"), QStringLiteral("state.power"), true),
              ControlAcceptance::ReadOnly);
    EXPECT_EQ(engine->handleControl(QStringLiteral("living-room"), QStringLiteral("info.ip"), QStringLiteral("x")),
              ControlAcceptance::ReadOnly);
    EXPECT_EQ(engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.bogus"), true),
              ControlAcceptance::UnknownChannel);
    EXPECT_TRUE(tizen.sent.isEmpty());
}

TEST_F(EngineTest, KeyIsNormalizedAndCleared)
{
    start();

    EXPECT_EQ(engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.key"), QStringLiteral("volup")),
              ControlAcceptance::Accepted);
    EXPECT_EQ(tizen.keys(), QStringList { QStringLiteral("KEY_VOLUP") });
    EXPECT_EQ(tizen.sent.first().first, QStringLiteral("aaaa-1111"));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.key")).toString(), QString());
    EXPECT_TRUE(host.errors.isEmpty());
}

TEST_F(EngineTest, EmptyKeyIsIgnored)
{
    start();

    EXPECT_EQ(engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.key"), QStringLiteral("  ")),
              ControlAcceptance::Accepted);
    EXPECT_TRUE(tizen.sent.isEmpty());
    ASSERT_TRUE(host.hasState(QStringLiteral("living-room"), QStringLiteral("control.key")));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.key")).toString(), QString());
}

TEST_F(EngineTest, EmptyAppAndSourceWritesAreSettled)
{
    start();

    EXPECT_EQ(engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.launchApp"), QString()),
              ControlAcceptance::Accepted);
    EXPECT_EQ(engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.source"), QStringLiteral(" ")),
              ControlAcceptance::Accepted);
    EXPECT_TRUE(tizen.sent.isEmpty());
    ASSERT_TRUE(host.hasState(QStringLiteral("living-room"), QStringLiteral("control.launchApp")));
    ASSERT_TRUE(host.hasState(QStringLiteral("living-room"), QStringLiteral("control.source")));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.launchApp")).toString(), QString());
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.source")).toString(), QString());
    EXPECT_FALSE(host.hasState(QStringLiteral("living-room"), QStringLiteral("state.source")));
}

TEST_F(EngineTest, FailedKeyIsReported)
{
    tizen.defaultResult = CommandResult::failure(CommandStatus::TransportError, QStringLiteral("boom"));
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.key"), QStringLiteral("KEY_HOME"));
    ASSERT_EQ(host.errors.size(), 1);
    EXPECT_EQ(host.errors.first(), QStringLiteral("Failed to execute key for living-room (transport error): boom"));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.key")).toString(), QString());
}

TEST_F(EngineTest, VolumeStepUpdatesStateOptimistically)
{
    tizen.infoByIp.insert(kLivingIp, tizenInfo(QStringLiteral("on"), 20, false));
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.volumeUp"), true);
    EXPECT_EQ(tizen.keys(), QStringList { QStringLiteral("KEY_VOLUP") });
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.volume")).toInt(), 21);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.volumeUp")).toBool(), false);

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.volumeDown"), true);
    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.volumeDown"), true);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.volume")).toInt(), 19);
}

TEST_F(EngineTest, FalseVolumeWriteSendsNothing)
{
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.volumeUp"), false);
    EXPECT_TRUE(tizen.sent.isEmpty());
}

TEST_F(EngineTest, MuteTogglesKnownState)
{
    tizen.infoByIp.insert(kLivingIp, tizenInfo(QStringLiteral("on"), 20, false));
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.mute"), true);
    EXPECT_EQ(tizen.keys(), QStringList { QStringLiteral("KEY_MUTE") });
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.muted")).toBool(), true);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.mute")).toBool(), false);
}

TEST_F(EngineTest, ChannelButtonsSendKeys)
{
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.channelUp"), true);
    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.channelDown"), QStringLiteral("1"));
    EXPECT_EQ(tizen.keys(), (QStringList { QStringLiteral("KEY_CHUP"), QStringLiteral("KEY_CHDOWN") }));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.channelUp")).toBool(), false);
}

TEST_F(EngineTest, SourceSelectionUpdatesState)
{
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.source"), QStringLiteral("hdmi1"));
    EXPECT_EQ(tizen.keys(), QStringList { QStringLiteral("KEY_HDMI1") });
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.source")).toString(),
              QStringLiteral("hdmi1"));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.source")).toString(), QString());
}

TEST_F(EngineTest, LaunchAppFailureIsReportedAndCleared)
{
    start();

    engine->handleControl(QStringLiteral("den"), QStringLiteral("control.launchApp"), QStringLiteral("Netflix"));
    EXPECT_EQ(host.errors.size(), 1);
    EXPECT_FALSE(host.hasState(QStringLiteral("den"), QStringLiteral("state.app")));
    EXPECT_EQ(host.state(QStringLiteral("den"), QStringLiteral("control.launchApp")).toString(), QString());
}

TEST_F(EngineTest, WakeOnLanUsesMac)
{
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.wol"), true);
    EXPECT_EQ(probes.wolSent, QStringList { QStringLiteral("aa:bb:cc:dd:ee:01") });
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.wol")).toBool(), false);
}

TEST_F(EngineTest, WakeOnLanFailureIsReported)
{
    probes.wolFails = true;
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.wol"), true);
    EXPECT_EQ(host.errors.size(), 1);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.wol")).toBool(), false);
}

TEST_F(EngineTest, WakeOnLanDisabledSendsNothing)
{
    config.enableWol = false;
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.wol"), true);
    EXPECT_TRUE(probes.wolSent.isEmpty());
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.wol")).toBool(), false);
}

// ============================================================
// Power
// ============================================================

TEST_F(EngineTest, PowerOffWhenAlreadyOffSendsNothing)
{
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.power"), false);
    EXPECT_TRUE(tizen.sent.isEmpty());
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.power")).toBool(), false);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.power")).toBool(), false);
}

TEST_F(EngineTest, PowerOffSendsPowerKey)
{
    tizen.infoByIp.insert(kLivingIp, tizenInfo(QStringLiteral("on"), 20, false));
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.power"), false);
    EXPECT_EQ(tizen.keys(), QStringList { QStringLiteral("KEY_POWER") });
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.power")).toBool(), false);
}

TEST_F(EngineTest, PowerOnOfflineDeviceFallsThroughToWakeOnLan)
{
    start();

    engine->handleControl(QStringLiteral("living-room"), QStringLiteral("control.power"), true);
    EXPECT_TRUE(tizen.sent.isEmpty());
    EXPECT_EQ(probes.wolSent, QStringList { QStringLiteral("aa:bb:cc:dd:ee:01") });
    EXPECT_TRUE(host.errors.isEmpty());
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("control.power")).toBool(), true);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.power")).toBool(), true);
}

TEST_F(EngineTest, PowerOnOfflineWithoutMacIsReported)
{
    start();

    engine->handleControl(QStringLiteral("den"), QStringLiteral("control.power"), true);
    EXPECT_TRUE(probes.wolSent.isEmpty());
    ASSERT_EQ(host.errors.size(), 1);
    EXPECT_TRUE(host.errors.first().contains(QStringLiteral("offline")));
}

// ============================================================
// Protocol routing
// ============================================================

TEST_F(EngineTest, UnsupportedTizenDowngradesToHj)
{
    tizen.perKey.insert(QStringLiteral("KEY_HOME"),
                        CommandResult::failure(CommandStatus::Unsupported, QStringLiteral("unrecognized method")));
    probes.openPorts.insert(QStringLiteral("192.168.1.20:8000"));
    start();

    std::optional<CommandResult> result;
    engine->sendKey(QStringLiteral("aaaa-1111"), QStringLiteral("KEY_HOME"),
                    [&result](const CommandResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ok());
    EXPECT_EQ(hj.keys(), QStringList { QStringLiteral("KEY_HOME") });
    EXPECT_EQ(engine->deviceByName(QStringLiteral("living-room"))->api, ApiKind::Hj);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("info.api")).toString(), QStringLiteral("hj"));

    engine->flushPendingSave();
    EXPECT_EQ(host.persistedDevices.at(0).toObject().value(QStringLiteral("api")).toString(), QStringLiteral("hj"));
}

TEST_F(EngineTest, UnsupportedTizenWithoutHjPortFails)
{
    tizen.defaultResult = CommandResult::failure(CommandStatus::Unsupported, QStringLiteral("unrecognized method"));
    start();

    std::optional<CommandResult> result;
    engine->sendKey(QStringLiteral("aaaa-1111"), QStringLiteral("KEY_HOME"),
                    [&result](const CommandResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, CommandStatus::Unsupported);
    EXPECT_TRUE(hj.sent.isEmpty());
    EXPECT_TRUE(probes.portChecks.contains(QStringLiteral("192.168.1.20:8000")));
    EXPECT_EQ(engine->deviceByName(QStringLiteral("living-room"))->api, ApiKind::Tizen);
}

TEST_F(EngineTest, UnknownApiFallsBackToLegacy)
{
    tizen.defaultResult = CommandResult::failure(CommandStatus::TransportError, QStringLiteral("refused"));
    start();

    std::optional<CommandResult> result;
    engine->sendKey(QStringLiteral("192.168.1.30"), QStringLiteral("KEY_MUTE"),
                    [&result](const CommandResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ok());
    EXPECT_EQ(tizen.keys(), QStringList { QStringLiteral("KEY_MUTE") });
    EXPECT_EQ(legacy.keys(), QStringList { QStringLiteral("KEY_MUTE") });
}

TEST_F(EngineTest, TizenFailureDoesNotFallBackForKnownApi)
{
    tizen.defaultResult = CommandResult::failure(CommandStatus::TransportError, QStringLiteral("refused"));
    start();

    std::optional<CommandResult> result;
    engine->sendKey(QStringLiteral("aaaa-1111"), QStringLiteral("KEY_MUTE"),
                    [&result](const CommandResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, CommandStatus::TransportError);
    EXPECT_TRUE(legacy.sent.isEmpty());
}

TEST_F(EngineTest, UnknownDeviceKeyIsInvalid)
{
    start();

    std::optional<CommandResult> result;
    engine->sendKey(QStringLiteral("nope"), QStringLiteral("KEY_MUTE"), [&result](const CommandResult &r) { result = r; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, CommandStatus::InvalidArgument);
}

// ============================================================
// UPnP events
// ============================================================

TEST_F(EngineTest, UpnpZeroVolumeIsHeldUntilTrusted)
{
    tizen.infoByIp.insert(kLivingIp, tizenInfo(QStringLiteral("on"), 20, false));
    start();

    AudioValues event;
    event.volume = 0;
    engine->applyUpnpEvent(QStringLiteral("aaaa-1111"), event);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.volume")).toInt(), 20);

    event.volume = 15;
    engine->applyUpnpEvent(QStringLiteral("aaaa-1111"), event);
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("state.volume")).toInt(), 15);
}

// ============================================================
// Pairing
// ============================================================

TEST_F(EngineTest, TizenPairingStoresToken)
{
    tizen.pairResult.ok = true;
    tizen.pairResult.token = QStringLiteral("tok123");
    start();

    std::optional<PairingResult> result;
    engine->pair(QStringLiteral("living-room"), QString(), std::nullopt,
                 [&result](const PairingResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ok);
    EXPECT_EQ(secrets.tizenToken(QStringLiteral("aaaa-1111")), QStringLiteral("tok123"));
    EXPECT_EQ(host.state(QStringLiteral("living-room"), QStringLiteral("info.paired")).toBool(), true);
    EXPECT_TRUE(engine->isPaired(*engine->deviceByName(QStringLiteral("living-room"))));

    EXPECT_EQ(host.secretPersists, 0);
    engine->flushPendingSave();
    EXPECT_EQ(host.secretPersists, 1);
    EXPECT_TRUE(host.persistedSecrets.contains(QStringLiteral("tok123")));
}

TEST_F(EngineTest, TizenPairingRefreshesInfoFirst)
{
    tizen.pairResult.ok = true;
    tizen.pairResult.token = QStringLiteral("tok123");
    start();
    tizen.infoQueries.clear();
    tizen.infoByIp.insert(kLivingIp, QJsonObject {
        { QStringLiteral("device"),
          QJsonObject {
              { QStringLiteral("modelName"), QStringLiteral("QE55Q80T") },
              { QStringLiteral("TokenAuthSupport"), QStringLiteral("true") },
          } },
    });

    std::optional<PairingResult> result;
    engine->pair(QStringLiteral("living-room"), QString(), std::nullopt,
                 [&result](const PairingResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ok);
    EXPECT_EQ(tizen.infoQueries, QStringList { kLivingIp });
    ASSERT_EQ(tizen.pairedDevices.size(), 1);
    EXPECT_EQ(tizen.pairedDevices.first().tokenAuthSupport, std::optional<bool>(true));
    EXPECT_TRUE(probes.fetchedUrls.isEmpty());
}

TEST_F(EngineTest, FailedPairingStoresNothing)
{
    tizen.pairResult.error = QStringLiteral("denied");
    start();

    std::optional<PairingResult> result;
    engine->pair(QStringLiteral("aaaa-1111"), QString(), std::nullopt,
                 [&result](const PairingResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->ok);
    EXPECT_TRUE(secrets.tizenToken(QStringLiteral("aaaa-1111")).isEmpty());
}

TEST_F(EngineTest, HjPairingStoresIdentity)
{
    config.devices.append(QJsonObject {
        { QStringLiteral("id"), QStringLiteral("hj-bedroom") },
        { QStringLiteral("name"), QStringLiteral("Bedroom") },
        { QStringLiteral("ip"), QStringLiteral("192.168.1.40") },
        { QStringLiteral("api"), QStringLiteral("hj") },
    });
    HjIdentity identity;
    identity.sessionId = 3;
    identity.aesKey = QByteArray(16, '\x11');
    hj.pairResult.ok = true;
    hj.pairResult.identity = identity;
    start();

    std::optional<PairingResult> result;
    engine->pair(QStringLiteral("bedroom"), QStringLiteral("1234"), std::nullopt,
                 [&result](const PairingResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ok);
    EXPECT_EQ(hj.pins, QStringList { QStringLiteral("1234") });
    ASSERT_TRUE(secrets.hjIdentity(QStringLiteral("hj-bedroom")).has_value());
    EXPECT_EQ(secrets.hjIdentity(QStringLiteral("hj-bedroom"))->sessionId, 3);
    EXPECT_EQ(host.state(QStringLiteral("bedroom"), QStringLiteral("info.paired")).toBool(), true);
}

TEST_F(EngineTest, PairingDiscoveredCandidate)
{
    tizen.pairResult.ok = true;
    tizen.pairResult.token = QStringLiteral("tok-new");
    start();

    DiscoveredCandidate seed;
    seed.id = QStringLiteral("uuid:dddd-4444");
    seed.ip = QStringLiteral("192.168.1.50");
    seed.name = QStringLiteral("[TV] Office");

    std::optional<PairingResult> result;
    engine->pair(QStringLiteral("192.168.1.50"), QString(), seed, [&result](const PairingResult &r) { result = r; });

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ok);
    EXPECT_EQ(secrets.tizenToken(QStringLiteral("dddd-4444")), QStringLiteral("tok-new"));
    EXPECT_EQ(tizen.pairedDevices.first().api, ApiKind::Tizen);
    EXPECT_EQ(engine->discovered().devices.size(), 1);
}

TEST_F(EngineTest, PairingUnknownDeviceFails)
{
    start();

    std::optional<PairingResult> result;
    engine->pair(QStringLiteral("attic"), QString(), std::nullopt, [&result](const PairingResult &r) { result = r; });
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->ok);
    EXPECT_EQ(result->error, QStringLiteral("Unknown device: attic"));
    EXPECT_TRUE(tizen.pairedDevices.isEmpty());
}

// ============================================================
// Adding and renaming devices
// ============================================================

TEST_F(EngineTest, AddDiscoveredDevice)
{
    DiscoveredCandidate seen;
    seen.ip = QStringLiteral("192.168.1.50");
    seen.sources.insert(QString::fromLatin1(kSourceSsdp));
    transport.batch = { seen };
    probes.json.insert(QStringLiteral("https://192.168.1.50:8002/api/v2/"), QJsonObject {
        { QStringLiteral("device"),
          QJsonObject {
              { QStringLiteral("name"), QStringLiteral("[TV] Office") },
              { QStringLiteral("id"), QStringLiteral("uuid:dddd-4444") },
          } },
    });
    start();

    std::optional<DiscoveryReply> reply;
    engine->discover(3, [&reply](const DiscoveryReply &r) { reply = r; });
    ASSERT_TRUE(reply.has_value());
    ASSERT_EQ(reply->devices.size(), 1);
    EXPECT_EQ(reply->lastScan, now);

    Device added;
    QString error;
    ASSERT_TRUE(engine->addDevice(QStringLiteral("192.168.1.50"), QStringLiteral("Office"), &added, &error)) << error.toStdString();
    EXPECT_EQ(added.id, QStringLiteral("dddd-4444"));
    EXPECT_EQ(added.name, QStringLiteral("office"));
    EXPECT_TRUE(host.trees.contains(QStringLiteral("office")));
    EXPECT_EQ(host.persistedTrees.value(QStringLiteral("office")), QStringLiteral("dddd-4444"));

    engine->flushPendingSave();
    EXPECT_EQ(host.persistedDevices.size(), 3);
}

TEST_F(EngineTest, AddUnknownCandidateFails)
{
    start();

    QString error;
    EXPECT_FALSE(engine->addDevice(QStringLiteral("192.168.1.77"), QString(), nullptr, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_EQ(engine->devices().size(), 2);
}

TEST_F(EngineTest, RenameMigratesTreeAndDebouncesSave)
{
    start();

    QString slug;
    ASSERT_TRUE(engine->renameDevice(QStringLiteral("living-room"), QStringLiteral("Lounge"), &slug));
    EXPECT_EQ(slug, QStringLiteral("lounge"));
    ASSERT_EQ(host.migrations.size(), 1);
    EXPECT_EQ(host.migrations.first().first, QStringLiteral("living-room"));
    EXPECT_EQ(host.migrations.first().second, QStringLiteral("lounge"));
    EXPECT_EQ(engine->deviceTrees().value(QStringLiteral("lounge")), QStringLiteral("aaaa-1111"));
    EXPECT_FALSE(engine->deviceTrees().contains(QStringLiteral("living-room")));

    EXPECT_EQ(host.devicePersists, 0);
    engine->stop();
    EXPECT_EQ(host.devicePersists, 1);
    EXPECT_FALSE(engine->isRunning());
}

TEST_F(EngineTest, RenameUnknownDeviceFails)
{
    start();

    QString error;
    EXPECT_FALSE(engine->renameDevice(QStringLiteral("attic"), QStringLiteral("Loft"), nullptr, &error));
    EXPECT_EQ(error, QStringLiteral("Unknown device: attic"));
}

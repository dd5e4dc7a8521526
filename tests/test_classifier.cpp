#include "tv_classifier.h"

#include <memory>

#include <QJsonObject>

#include <gtest/gtest.h>

#include "fakes.h"

using namespace phicore::samsungtv::ipc;
using phicore::samsungtv::ipc::testing::FakeProbes;

namespace {

const QString kIp = QStringLiteral("192.168.1.20");

QJsonObject tizenInfo(const QString &model, const QString &id)
{
    return QJsonObject {
        { QStringLiteral("device"),
          QJsonObject {
              { QStringLiteral("name"), QStringLiteral("[TV] Samsung") },
              { QStringLiteral("modelName"), model },
              { QStringLiteral("id"), id },
              { QStringLiteral("wifiMac"), QStringLiteral("AA:BB:CC:DD:EE:01") },
              { QStringLiteral("TokenAuthSupport"), QStringLiteral("true") },
          } },
    };
}

} // namespace

class ClassifierTest : public ::testing::Test {
protected:
    std::optional<DiscoveredCandidate> classify(const DiscoveredCandidate &seed)
    {
        std::optional<DiscoveredCandidate> out;
        bool called = false;
        classifier.classify(seed, [&](const std::optional<DiscoveredCandidate> &result) {
            out = result;
            called = true;
        });
        EXPECT_TRUE(called);
        return out;
    }

    DiscoveredCandidate seed() const
    {
        DiscoveredCandidate candidate;
        candidate.ip = kIp;
        return candidate;
    }

    FakeProbes probes;
    DeviceClassifier classifier { &probes };
};

// ============================================================
// Info document helpers
// ============================================================

TEST(ClassifierHelpers, InfoUrls)
{
    EXPECT_EQ(tizenInfoUrl(kIp, QStringLiteral("wss"), 8002), QStringLiteral("https://192.168.1.20:8002/api/v2/"));
    EXPECT_EQ(tizenInfoUrl(kIp, QStringLiteral("ws"), 8001), QStringLiteral("http://192.168.1.20:8001/api/v2/"));
    EXPECT_EQ(hjInfoUrl(kIp), QStringLiteral("http://192.168.1.20:8001/ms/1.0/"));
}

TEST(ClassifierHelpers, ExtractsTizenInfo)
{
    const TizenInfo info = extractTizenInfo(tizenInfo(QStringLiteral("QE55Q80T"), QStringLiteral("uuid:abc")));
    EXPECT_EQ(info.model, QStringLiteral("QE55Q80T"));
    EXPECT_EQ(info.uuid, QStringLiteral("uuid:abc"));
    EXPECT_EQ(info.mac, QStringLiteral("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ(info.tokenAuthSupport, std::optional<bool>(true));
}

TEST(ClassifierHelpers, TokenAuthSupportMayBeAbsent)
{
    EXPECT_FALSE(parseTokenAuthSupport(QJsonObject { { QStringLiteral("device"), QJsonObject() } }).has_value());
    EXPECT_EQ(parseTokenAuthSupport(QJsonObject { { QStringLiteral("tokenAuthSupport"), false } }),
              std::optional<bool>(false));
}

TEST(ClassifierHelpers, ExtractsHjInfo)
{
    const HjInfo info = extractHjInfo(QJsonObject {
        { QStringLiteral("DeviceName"), QStringLiteral("[TV] Bedroom") },
        { QStringLiteral("ModelName"), QStringLiteral("UE40H6200") },
        { QStringLiteral("DeviceID"), QStringLiteral("uuid:hj-1") },
    });
    EXPECT_EQ(info.name, QStringLiteral("[TV] Bedroom"));
    EXPECT_EQ(info.model, QStringLiteral("UE40H6200"));
    EXPECT_EQ(info.id, QStringLiteral("hj-1"));
}

TEST(ClassifierHelpers, HjSeriesHeuristic)
{
    EXPECT_TRUE(isLikelyHjSeries(QStringLiteral("UE48H6400"), QString()));
    EXPECT_TRUE(isLikelyHjSeries(QStringLiteral("UE55JU6400"), QString()));
    EXPECT_TRUE(isLikelyHjSeries(QStringLiteral("ue40j5200"), QString()));
    EXPECT_TRUE(isLikelyHjSeries(QString(), QStringLiteral("14_HAWKM_2P")));
    EXPECT_FALSE(isLikelyHjSeries(QStringLiteral("QE55Q80T"), QString()));
    EXPECT_FALSE(isLikelyHjSeries(QStringLiteral("UN55MU8000"), QString()));
    EXPECT_FALSE(isLikelyHjSeries(QString(), QString()));
}

// ============================================================
// Probe chain
// ============================================================

TEST_F(ClassifierTest, SecureTizenEndpointWins)
{
    probes.json.insert(QStringLiteral("https://192.168.1.20:8002/api/v2/"),
                       tizenInfo(QStringLiteral("QE55Q80T"), QStringLiteral("uuid:abc")));

    const auto result = classify(seed());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->api, ApiKind::Tizen);
    EXPECT_EQ(result->protocol, QStringLiteral("wss"));
    EXPECT_EQ(result->port, 8002);
    EXPECT_EQ(result->id, QStringLiteral("abc"));
    EXPECT_EQ(result->mac, QStringLiteral("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ(result->tokenAuthSupport, std::optional<bool>(true));
    EXPECT_FALSE(result->hjAvailable.has_value());
}

TEST_F(ClassifierTest, InsecureTizenEndpointIsTriedSecond)
{
    probes.json.insert(QStringLiteral("http://192.168.1.20:8001/api/v2/"),
                       tizenInfo(QStringLiteral("UE55MU8000"), QStringLiteral("uuid:def")));

    const auto result = classify(seed());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->api, ApiKind::Tizen);
    EXPECT_EQ(result->protocol, QStringLiteral("ws"));
    EXPECT_EQ(result->port, 8001);
}

TEST_F(ClassifierTest, HjModelOverridesTizenAnswer)
{
    probes.json.insert(QStringLiteral("http://192.168.1.20:8001/api/v2/"),
                       tizenInfo(QStringLiteral("UE48H6400"), QStringLiteral("uuid:h1")));
    probes.json.insert(QStringLiteral("http://192.168.1.20:8001/ms/1.0/"), QJsonObject {
        { QStringLiteral("DeviceID"), QStringLiteral("uuid:h1") },
    });

    const auto result = classify(seed());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->api, ApiKind::Hj);
    EXPECT_EQ(result->protocol, QStringLiteral("ws"));
    EXPECT_EQ(result->port, 8000);
    EXPECT_EQ(result->hjAvailable, std::optional<bool>(true));
}

TEST_F(ClassifierTest, HjModelWithoutHjEvidenceIsForced)
{
    probes.json.insert(QStringLiteral("https://192.168.1.20:8002/api/v2/"),
                       tizenInfo(QStringLiteral("UE40J5200"), QStringLiteral("uuid:j1")));

    const auto result = classify(seed());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->api, ApiKind::Hj);
    EXPECT_EQ(result->port, 8000);
    EXPECT_TRUE(probes.portChecks.contains(QStringLiteral("192.168.1.20:8000")));
    EXPECT_FALSE(result->hjAvailable.has_value());
}

TEST_F(ClassifierTest, HjPortProbeMarksAvailability)
{
    probes.json.insert(QStringLiteral("https://192.168.1.20:8002/api/v2/"),
                       tizenInfo(QStringLiteral("UE40J5200"), QStringLiteral("uuid:j1")));
    probes.openPorts.insert(QStringLiteral("192.168.1.20:8000"));

    const auto result = classify(seed());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->hjAvailable, std::optional<bool>(true));
}

TEST_F(ClassifierTest, HjInfoAloneSelectsHj)
{
    probes.json.insert(QStringLiteral("http://192.168.1.20:8001/ms/1.0/"), QJsonObject {
        { QStringLiteral("DeviceName"), QStringLiteral("[TV] Kitchen") },
        { QStringLiteral("ModelName"), QStringLiteral("UE40ES6800") },
        { QStringLiteral("DeviceID"), QStringLiteral("uuid:es-1") },
    });

    const auto result = classify(seed());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->api, ApiKind::Hj);
    EXPECT_EQ(result->id, QStringLiteral("es-1"));
    EXPECT_EQ(result->name, QStringLiteral("[TV] Kitchen"));
}

TEST_F(ClassifierTest, SilentDeviceFallsBackToMacIdentity)
{
    probes.macByIp.insert(kIp, QStringLiteral("AA:BB:CC:DD:EE:02"));

    const auto result = classify(seed());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->api, ApiKind::Unknown);
    EXPECT_EQ(result->id, QStringLiteral("aa:bb:cc:dd:ee:02"));
    EXPECT_EQ(result->mac, QStringLiteral("aa:bb:cc:dd:ee:02"));
}

TEST_F(ClassifierTest, SilentDeviceWithoutMacKeepsIpIdentity)
{
    const auto result = classify(seed());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->id, kIp);
}

TEST_F(ClassifierTest, DescriptionFillsRenderingControl)
{
    DiscoveredCandidate candidate = seed();
    candidate.location = QStringLiteral("http://192.168.1.20:7676/dmr");
    probes.text.insert(candidate.location, QByteArrayLiteral(
        "<root><device><friendlyName>[TV] Den</friendlyName><modelName>QE65Q90R</modelName>"
        "<UDN>uuid:desc-1</UDN><serviceList><service>"
        "<serviceType>urn:schemas-upnp-org:service:RenderingControl:1</serviceType>"
        "<controlURL>/upnp/control/RenderingControl1</controlURL>"
        "<eventSubURL>/upnp/event/RenderingControl1</eventSubURL>"
        "</service></serviceList></device></root>"));

    const auto result = classify(candidate);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->model, QStringLiteral("QE65Q90R"));
    EXPECT_EQ(result->id, QStringLiteral("desc-1"));
    EXPECT_EQ(result->renderingControlUrl, QStringLiteral("http://192.168.1.20:7676/upnp/control/RenderingControl1"));
}

// ============================================================
// Repeated classification
// ============================================================

TEST_F(ClassifierTest, RepeatedTizenClassificationIsStable)
{
    probes.json.insert(QStringLiteral("https://192.168.1.20:8002/api/v2/"),
                       tizenInfo(QStringLiteral("QE55Q80T"), QStringLiteral("uuid:abc")));
    probes.macByIp.insert(kIp, QStringLiteral("AA:BB:CC:DD:EE:01"));

    const auto first = classify(seed());
    const auto second = classify(seed());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->api, ApiKind::Tizen);
    EXPECT_EQ(second->api, first->api);
    EXPECT_EQ(second->protocol, first->protocol);
    EXPECT_EQ(second->port, first->port);
    EXPECT_EQ(second->id, first->id);
}

TEST_F(ClassifierTest, RepeatedHjModelOverTizenEndpointIsStable)
{
    probes.json.insert(QStringLiteral("https://192.168.1.20:8002/api/v2/"),
                       tizenInfo(QStringLiteral("UE40H6400"), QStringLiteral("uuid:h2")));
    probes.openPorts.insert(QStringLiteral("192.168.1.20:8000"));

    const auto first = classify(seed());
    const auto second = classify(seed());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->api, ApiKind::Hj);
    EXPECT_EQ(first->protocol, QStringLiteral("ws"));
    EXPECT_EQ(first->port, 8000);
    EXPECT_EQ(second->api, first->api);
    EXPECT_EQ(second->protocol, first->protocol);
    EXPECT_EQ(second->port, first->port);
    EXPECT_EQ(second->hjAvailable, first->hjAvailable);
}

TEST_F(ClassifierTest, RepeatedSilentClassificationIsStable)
{
    probes.macByIp.insert(kIp, QStringLiteral("AA:BB:CC:DD:EE:02"));

    const auto first = classify(seed());
    const auto second = classify(seed());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->api, ApiKind::Unknown);
    EXPECT_EQ(second->api, first->api);
    EXPECT_EQ(second->port, first->port);
    EXPECT_EQ(second->id, first->id);
}

TEST_F(ClassifierTest, DestroyedClassifierIgnoresLateAnswer)
{
    probes.deferJson = true;
    auto owned = std::make_unique<DeviceClassifier>(&probes);
    bool called = false;
    owned->classify(seed(), [&called](const std::optional<DiscoveredCandidate> &) { called = true; });
    ASSERT_EQ(probes.deferred.size(), 1);

    owned.reset();
    probes.deferJson = false;
    probes.releaseDeferred();

    EXPECT_FALSE(called);
    EXPECT_EQ(probes.fetchedUrls.size(), 1);
}

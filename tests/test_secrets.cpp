#include "tv_secrets.h"

#include <QJsonDocument>
#include <QJsonObject>

#include <gtest/gtest.h>

using namespace phicore::samsungtv::ipc;

namespace {

HjIdentity sampleIdentity()
{
    HjIdentity identity;
    identity.sessionId = 7;
    identity.aesKey = QByteArray::fromHex("00112233445566778899aabbccddeeff");
    return identity;
}

Device tizenDevice(const QString &id)
{
    Device device;
    device.id = id;
    device.name = QStringLiteral("living");
    device.api = ApiKind::Tizen;
    return device;
}

} // namespace

class SecretStoreTest : public ::testing::Test {
protected:
    SecretStore store;
};

// ============================================================
// Loading and serializing
// ============================================================

TEST_F(SecretStoreTest, EmptyBlobLoadsAsEmpty)
{
    QString error;
    EXPECT_TRUE(store.load(QString(), &error));
    EXPECT_TRUE(store.tizenToken(QStringLiteral("abc")).isEmpty());
}

TEST_F(SecretStoreTest, MalformedBlobReportsError)
{
    QString error;
    EXPECT_FALSE(store.load(QStringLiteral("{not json"), &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(SecretStoreTest, SerializedBlobHasBothNamespaces)
{
    store.setTizenToken(QStringLiteral("abc"), QStringLiteral("12345"));
    store.setHjIdentity(QStringLiteral("def"), sampleIdentity());

    const QJsonObject root = QJsonDocument::fromJson(store.serialize().toUtf8()).object();
    EXPECT_EQ(root.value(QStringLiteral("tizen")).toObject().value(QStringLiteral("abc")).toString(),
              QStringLiteral("12345"));
    EXPECT_TRUE(root.value(QStringLiteral("hj")).toObject().contains(QStringLiteral("def")));

    SecretStore reloaded;
    ASSERT_TRUE(reloaded.load(store.serialize()));
    ASSERT_TRUE(reloaded.hjIdentity(QStringLiteral("def")).has_value());
    EXPECT_EQ(reloaded.hjIdentity(QStringLiteral("def"))->sessionId, 7);
}

TEST_F(SecretStoreTest, RejectsIdentityWithShortKey)
{
    const QJsonObject obj {
        { QStringLiteral("sessionId"), 1 },
        { QStringLiteral("aesKey"), QStringLiteral("0011") },
    };
    EXPECT_FALSE(HjIdentity::fromJson(obj).has_value());
}

// ============================================================
// No-token sentinel
// ============================================================

TEST_F(SecretStoreTest, EmptyTokenStoresSentinel)
{
    store.setTizenToken(QStringLiteral("abc"), QString());
    EXPECT_EQ(store.tizenToken(QStringLiteral("abc")), QLatin1String(kNoTokenSentinel));
    EXPECT_TRUE(store.tizenAuthToken(QStringLiteral("abc")).isEmpty());
}

TEST_F(SecretStoreTest, SentinelCountsAsPairedUnlessTokenAuthRequired)
{
    store.setTizenToken(QStringLiteral("abc"), QString());

    Device device = tizenDevice(QStringLiteral("abc"));
    EXPECT_TRUE(store.isPaired(device));

    device.tokenAuthSupport = false;
    EXPECT_TRUE(store.isPaired(device));

    device.tokenAuthSupport = true;
    EXPECT_FALSE(store.isPaired(device));
}

TEST_F(SecretStoreTest, RealTokenIsPaired)
{
    store.setTizenToken(QStringLiteral("abc"), QStringLiteral("12345"));
    Device device = tizenDevice(QStringLiteral("abc"));
    device.tokenAuthSupport = true;
    EXPECT_TRUE(store.isPaired(device));
    EXPECT_FALSE(store.isPaired(tizenDevice(QStringLiteral("other"))));
}

TEST_F(SecretStoreTest, HjPairingUsesIdentity)
{
    Device device = tizenDevice(QStringLiteral("hj1"));
    device.api = ApiKind::Hj;
    EXPECT_FALSE(store.isPaired(device));
    store.setHjIdentity(QStringLiteral("hj1"), sampleIdentity());
    EXPECT_TRUE(store.isPaired(device));
}

// ============================================================
// Id changes
// ============================================================

TEST_F(SecretStoreTest, RenameMovesBothNamespaces)
{
    store.setTizenToken(QStringLiteral("old"), QStringLiteral("t"));
    store.setHjIdentity(QStringLiteral("old"), sampleIdentity());

    store.renameDevice(QStringLiteral("old"), QStringLiteral("new"));

    EXPECT_TRUE(store.tizenToken(QStringLiteral("old")).isEmpty());
    EXPECT_EQ(store.tizenToken(QStringLiteral("new")), QStringLiteral("t"));
    EXPECT_FALSE(store.hjIdentity(QStringLiteral("old")).has_value());
    EXPECT_TRUE(store.hjIdentity(QStringLiteral("new")).has_value());
}

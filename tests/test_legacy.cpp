#include "tv_legacy.h"

#include <functional>
#include <optional>

#include <QEventLoop>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>

#include <gtest/gtest.h>

#include "fakes.h"

using namespace phicore::samsungtv::ipc;
using phicore::samsungtv::ipc::testing::FakeProbes;

namespace {

QByteArray replyFrame(const QByteArray &payload)
{
    QByteArray out;
    out.append('\x02');
    const QByteArray app("iapp.samsung");
    out.append(static_cast<char>(app.size()));
    out.append('\x00');
    out.append(app);
    out.append(static_cast<char>(payload.size()));
    out.append('\x00');
    out.append(payload);
    return out;
}

bool waitUntil(const std::function<bool()> &ready, int timeoutMs = 5000)
{
    QEventLoop loop;
    QTimer poll;
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (ready())
            loop.quit();
    });
    poll.start(10);
    QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
    if (!ready())
        loop.exec();
    return ready();
}

} // namespace

// ============================================================
// Frames
// ============================================================

TEST(LegacyFrames, AuthFrameLayout)
{
    const QByteArray frame = buildLegacyAuthFrame(QStringLiteral("10.0.0.5"), QStringLiteral("host"),
                                                  QStringLiteral("phi-core"));
    ASSERT_GT(frame.size(), 3);
    EXPECT_EQ(frame.at(0), '\x00');
    const int appLen = static_cast<unsigned char>(frame.at(1));
    EXPECT_EQ(frame.mid(3, appLen), QByteArray(kLegacyAuthApp));

    const QByteArray payload = frame.mid(3 + appLen + 2);
    EXPECT_TRUE(payload.startsWith(QByteArray("\x64\x00", 2)));
    EXPECT_TRUE(payload.contains(QByteArray("10.0.0.5").toBase64()));
    EXPECT_TRUE(payload.contains(QByteArray("phi-core").toBase64()));
}

TEST(LegacyFrames, KeyFrameCarriesBase64Key)
{
    const QByteArray frame = buildLegacyKeyFrame(QStringLiteral("KEY_VOLUP"));
    const int appLen = static_cast<unsigned char>(frame.at(1));
    EXPECT_EQ(frame.mid(3, appLen), QByteArray(kLegacyKeyApp));
    EXPECT_TRUE(frame.endsWith(QByteArray("KEY_VOLUP").toBase64()));
}

TEST(LegacyFrames, ClassifiesReplies)
{
    int consumed = 0;
    EXPECT_EQ(parseLegacyReply(replyFrame(QByteArray("\x64\x00\x01\x00", 4)), &consumed), LegacyReply::Granted);
    EXPECT_EQ(consumed, replyFrame(QByteArray("\x64\x00\x01\x00", 4)).size());
    EXPECT_EQ(parseLegacyReply(replyFrame(QByteArray("\x64\x00\x00\x00", 4)), &consumed), LegacyReply::Denied);
    EXPECT_EQ(parseLegacyReply(replyFrame(QByteArray("\x65\x00", 2)), &consumed), LegacyReply::Denied);
    EXPECT_EQ(parseLegacyReply(replyFrame(QByteArray("\x0a\x00\x02\x00", 4)), &consumed), LegacyReply::Waiting);
    EXPECT_EQ(parseLegacyReply(replyFrame(QByteArray("\x00\x00\x00\x00", 4)), &consumed), LegacyReply::Other);
}

TEST(LegacyFrames, PartialReplyIsIncomplete)
{
    const QByteArray full = replyFrame(QByteArray("\x64\x00\x01\x00", 4));
    int consumed = -1;
    EXPECT_EQ(parseLegacyReply(full.left(2), &consumed), LegacyReply::Incomplete);
    EXPECT_EQ(parseLegacyReply(full.left(full.size() - 1), &consumed), LegacyReply::Incomplete);
    EXPECT_EQ(consumed, -1);
}

// ============================================================
// LegacyAdapter
// ============================================================

class LegacyAdapterTest : public ::testing::Test {
protected:
    Device device(const QString &ip) const
    {
        Device d;
        d.id = QStringLiteral("legacy1");
        d.name = QStringLiteral("kitchen");
        d.ip = ip;
        d.api = ApiKind::Legacy;
        return d;
    }

    FakeProbes probes;
    LegacyAdapter adapter { &probes, QStringLiteral("phi-core") };
};

TEST_F(LegacyAdapterTest, MissingIpIsInvalid)
{
    std::optional<CommandResult> result;
    adapter.sendKey(device(QString()), QStringLiteral("KEY_MUTE"), [&result](const CommandResult &r) { result = r; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, CommandStatus::InvalidArgument);
}

TEST_F(LegacyAdapterTest, QueryInfoIsUnavailable)
{
    std::optional<InfoResult> result;
    adapter.queryInfo(device(QStringLiteral("10.0.0.9")), [&result](const InfoResult &r) { result = r; });
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->ok);
}

TEST_F(LegacyAdapterTest, LaunchAppIsUnsupported)
{
    std::optional<CommandResult> result;
    adapter.launchApp(device(QStringLiteral("10.0.0.9")), QStringLiteral("Netflix"),
                      [&result](const CommandResult &r) { result = r; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, CommandStatus::Unsupported);
}

TEST_F(LegacyAdapterTest, PairingGrantedOverLoopback)
{
    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, kLegacyPort))
        GTEST_SKIP() << "port 55000 unavailable";

    QByteArray received;
    QObject::connect(&server, &QTcpServer::newConnection, &server, [&]() {
        QTcpSocket *socket = server.nextPendingConnection();
        QObject::connect(socket, &QTcpSocket::readyRead, socket, [&received, socket]() {
            received.append(socket->readAll());
            if (received.contains(QByteArray(kLegacyAuthApp))) {
                socket->write(replyFrame(QByteArray("\x0a\x00\x02\x00", 4)));
                socket->write(replyFrame(QByteArray("\x64\x00\x01\x00", 4)));
            }
        });
    });

    std::optional<PairingResult> result;
    adapter.pair(device(QStringLiteral("127.0.0.1")), QString(), [&result](const PairingResult &r) { result = r; });
    ASSERT_TRUE(waitUntil([&]() { return result.has_value(); }));
    EXPECT_TRUE(result->ok);
}

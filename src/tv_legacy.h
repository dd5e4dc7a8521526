#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>
#include <QTimer>

#include "tv_adapter.h"

class QTcpSocket;

namespace phicore::samsungtv::ipc {

class NetworkProbes;

inline constexpr int kLegacyPort = 55000;
inline constexpr int kLegacyCloseDelayMs = 200;
inline constexpr int kLegacyPairTimeoutMs = 30000;
inline constexpr const char kLegacyAuthApp[] = "iphone..iapp.samsung";
inline constexpr const char kLegacyKeyApp[] = "iphone.UN60D6000.iapp.samsung";

QByteArray buildLegacyAuthFrame(const QString &localIp, const QString &remoteId, const QString &clientName);
QByteArray buildLegacyKeyFrame(const QString &key);

enum class LegacyReply {
    Incomplete,
    Granted,
    Waiting,
    Denied,
    Other
};

// Reads one reply frame from the front of buffer; consumed is set for
// every result except Incomplete.
LegacyReply parseLegacyReply(const QByteArray &buffer, int *consumed);

class LegacySession
{
public:
    enum class Mode {
        Key,
        Pair
    };

    LegacySession(Mode mode, const QByteArray &frames);
    ~LegacySession();

    LegacySession(const LegacySession &) = delete;
    LegacySession &operator=(const LegacySession &) = delete;

    void start(const QString &ip, std::function<void(const CommandResult &)> done);

private:
    void handleReadyRead();
    void finish(const CommandResult &result);

    Mode m_mode;
    QByteArray m_frames;
    QByteArray m_buffer;
    bool m_finished = false;
    QTcpSocket *m_socket = nullptr;
    QTimer m_deadline;
    QObject m_scope;
    std::function<void(const CommandResult &)> m_done;
};

class LegacyAdapter final : public ProtocolAdapter
{
public:
    LegacyAdapter(NetworkProbes *probes, const QString &clientName);
    ~LegacyAdapter() override;

    ApiKind api() const override { return ApiKind::Legacy; }
    void sendKey(const Device &device, const QString &key, CommandCallback done) override;
    void pair(const Device &device, const QString &pin, PairingCallback done) override;
    void queryInfo(const Device &device, InfoCallback done) override;

private:
    void runSession(LegacySession::Mode mode,
                    const QString &ip,
                    const QByteArray &frames,
                    std::function<void(const CommandResult &)> done);
    QByteArray authFrame(const QString &ip);

    NetworkProbes *m_probes = nullptr;
    QString m_clientName;
    std::uint64_t m_nextSession = 1;
    QHash<std::uint64_t, std::shared_ptr<LegacySession>> m_sessions;
    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include "tv_adapter.h"

class QWebSocket;

namespace phicore::samsungtv::ipc {

class NetworkProbes;

inline constexpr int kTizenCommandDeadlineMs = 5000;
inline constexpr int kTizenPairingDeadlineMs = 20000;
inline constexpr int kTizenSendDelayMs = 200;

// Own protocol/port first, then wss/8002 and ws/8001; v2 before v3 each.
QStringList buildTizenChannelUrls(const Device &device, const QString &token, const QString &clientName);
QString tizenOrigin(const QString &channelUrl);

QByteArray buildTizenKeyPayload(const QString &key);
QByteArray buildTizenLaunchPayload(const QString &appId);

struct TizenMessage {
    enum class Kind {
        Ignored,
        ChannelConnect,
        ChannelReady,
        Denied,
        Error
    };

    Kind kind = Kind::Ignored;
    QString event;
    QString token;
    QString errorMessage;
};

TizenMessage parseTizenMessage(const QString &text);
// Server errors that mean the set has no ms.remote.control channel at all.
bool isRemoteUnsupportedError(const QString &message);

// One WebSocket exchange against one channel URL, driven by a single
// deadline. Command mode sends the payload once the channel is up; pairing
// mode ends on ms.channel.connect and reports the granted token.
class TizenSession
{
public:
    enum class Mode {
        Command,
        Pairing
    };

    enum class State {
        Idle,
        Connecting,
        AwaitingChannel,
        Sending,
        Settling,
        Succeeded,
        Denied,
        TimedOut,
        TransportError,
        Unsupported,
        Failed
    };

    struct Outcome {
        State state = State::Failed;
        QString token;
        QString error;
    };

    TizenSession(Mode mode, const QByteArray &payload);
    // Drops the socket without invoking the callback.
    ~TizenSession();

    TizenSession(const TizenSession &) = delete;
    TizenSession &operator=(const TizenSession &) = delete;

    void start(const QString &url, std::function<void(const Outcome &)> done);
    State state() const { return m_state; }

private:
    void handleText(const QString &text);
    void sendPayload();
    void finish(State state, const QString &error, const QString &token = {});

    Mode m_mode;
    QByteArray m_payload;
    State m_state = State::Idle;
    QString m_safeUrl;
    QWebSocket *m_socket = nullptr;
    QTimer m_deadline;
    QObject m_scope;
    std::function<void(const Outcome &)> m_done;
};

CommandStatus commandStatusForSession(TizenSession::State state);

class TizenAdapter final : public ProtocolAdapter
{
public:
    TizenAdapter(const SecretStore *secrets, NetworkProbes *probes, const QString &clientName);
    ~TizenAdapter() override;

    ApiKind api() const override { return ApiKind::Tizen; }
    void sendKey(const Device &device, const QString &key, CommandCallback done) override;
    void pair(const Device &device, const QString &pin, PairingCallback done) override;
    void queryInfo(const Device &device, InfoCallback done) override;
    void launchApp(const Device &device, const QString &appId, CommandCallback done) override;

private:
    void send(const Device &device, const QByteArray &payload, CommandCallback done);
    void sendAt(const QStringList &urls, int index, const QByteArray &payload, CommandResult best, CommandCallback done);
    void pairAt(const Device &device, const QStringList &urls, int index, PairingResult last, PairingCallback done);
    void runSession(TizenSession::Mode mode,
                    const QString &url,
                    const QByteArray &payload,
                    std::function<void(const TizenSession::Outcome &)> done);

    const SecretStore *m_secrets = nullptr;
    NetworkProbes *m_probes = nullptr;
    QString m_clientName;
    std::uint64_t m_nextSession = 1;
    QHash<std::uint64_t, std::shared_ptr<TizenSession>> m_sessions;
    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc

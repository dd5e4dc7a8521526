#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>
#include <QTimer>

#include "tv_adapter.h"
#include "tv_hj_crypto.h"

class QWebSocket;

namespace phicore::samsungtv::ipc {

class HttpClient;
class NetworkProbes;

inline constexpr const char kHjAppId[] = "721b6fce-4ee6-48ba-8045-955a539edadb";
inline constexpr const char kHjUserId[] = "654321";
inline constexpr int kHjPairingPort = 8080;
inline constexpr int kHjSessionPort = 8000;
inline constexpr int kHjPowerKeyHoldMs = 150;

// Stable per installation: derived from the app and user ids.
QString hjDeviceId();

QString hjPairingUrl(const QString &ip, int step);
// "<state>running</state>" -> "running".
QString parsePinPageState(const QByteArray &page);
// Reply bodies carry "auth_data" as a JSON string.
std::optional<QJsonObject> parseHjAuthData(const QByteArray &body);
QByteArray buildHjHelloRequest(const QByteArray &serverHello);
QByteArray buildHjAckRequest(const QString &requestId, const QString &serverAck);

// "<id>:<heartbeat>:<timeout>:<transports>" -> "<id>".
QString parseSocketIoHandshake(const QByteArray &body);
QByteArray buildHjKeyCommand(const QString &key, const QString &type);
QString buildHjEmitFrame(qint64 sessionId, const QByteArray &encryptedBody);

struct HjKeyEvent {
    QString type;
    // Wait before this event is sent.
    int delayMs = 0;
};

// Click for ordinary keys, Press/Release for power keys.
QList<HjKeyEvent> hjKeyEvents(const QString &key);

// socket.io 0.9 session on port 8000: handshake, endpoint connect, then the
// encrypted key events. Single deadline; the callback fires once.
class HjSession
{
public:
    enum class State {
        Idle,
        Handshake,
        Connecting,
        AwaitingEndpoint,
        Sending,
        Settling,
        Succeeded,
        TimedOut,
        TransportError,
        Failed
    };

    HjSession(HttpClient *http, const HjIdentity &identity);
    ~HjSession();

    HjSession(const HjSession &) = delete;
    HjSession &operator=(const HjSession &) = delete;

    void start(const QString &ip, const QString &key, std::function<void(const CommandResult &)> done);
    State state() const { return m_state; }

private:
    void openSocket(const QString &ip, const QString &handshakeId);
    void handleText(const QString &text);
    void sendNext();
    void finish(State state, const QString &error);

    HttpClient *m_http = nullptr;
    HjIdentity m_identity;
    State m_state = State::Idle;
    QString m_key;
    QList<HjKeyEvent> m_events;
    QWebSocket *m_socket = nullptr;
    QTimer m_deadline;
    QObject m_scope;
    std::function<void(const CommandResult &)> m_done;
};

class HjAdapter final : public ProtocolAdapter
{
public:
    HjAdapter(HttpClient *http, const SecretStore *secrets, NetworkProbes *probes, const QString &keyFile);
    ~HjAdapter() override;

    ApiKind api() const override { return ApiKind::Hj; }
    void sendKey(const Device &device, const QString &key, CommandCallback done) override;
    // Empty pin: show the PIN on the TV. Otherwise confirm it.
    void pair(const Device &device, const QString &pin, PairingCallback done) override;
    void queryInfo(const Device &device, InfoCallback done) override;

    bool hasPendingPin(const QString &deviceId) const { return m_pendingPin.contains(deviceId); }

private:
    void runSession(const Device &device, const QString &key, const HjIdentity &identity, CommandCallback done);
    void requestPin(const Device &device, PairingCallback done);
    void confirmPin(const Device &device, const QString &pin, PairingCallback done);

    HttpClient *m_http = nullptr;
    const SecretStore *m_secrets = nullptr;
    NetworkProbes *m_probes = nullptr;
    QString m_keyFile;
    QSet<QString> m_pendingPin;
    std::uint64_t m_nextSession = 1;
    QHash<std::uint64_t, std::shared_ptr<HjSession>> m_sessions;
    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc

#include "tv_tizen.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkRequest>
#include <QPointer>
#include <QRegularExpression>
#include <QSet>
#include <QUrl>
#include <QWebSocket>

#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

#include "tv_classifier.h"
#include "tv_log.h"
#include "tv_netprobe.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kInfoTimeoutMs = 2000;

const char kPairingHint[] =
    "Check Device Connection Manager > Access Notification, clear the Device List, and ensure same subnet.";

QString sessionStateName(TizenSession::State state)
{
    switch (state) {
    case TizenSession::State::Idle:
        return QStringLiteral("idle");
    case TizenSession::State::Connecting:
        return QStringLiteral("connecting");
    case TizenSession::State::AwaitingChannel:
        return QStringLiteral("awaiting-channel");
    case TizenSession::State::Sending:
        return QStringLiteral("sending");
    case TizenSession::State::Settling:
        return QStringLiteral("settling");
    case TizenSession::State::Succeeded:
        return QStringLiteral("succeeded");
    case TizenSession::State::Denied:
        return QStringLiteral("denied");
    case TizenSession::State::TimedOut:
        return QStringLiteral("timed-out");
    case TizenSession::State::TransportError:
        return QStringLiteral("transport-error");
    case TizenSession::State::Unsupported:
        return QStringLiteral("unsupported");
    case TizenSession::State::Failed:
        break;
    }
    return QStringLiteral("failed");
}

bool isTerminal(TizenSession::State state)
{
    return state == TizenSession::State::Succeeded || state == TizenSession::State::Denied
        || state == TizenSession::State::TimedOut || state == TizenSession::State::TransportError
        || state == TizenSession::State::Unsupported || state == TizenSession::State::Failed;
}

int failureRank(CommandStatus status)
{
    switch (status) {
    case CommandStatus::Unsupported:
        return 4;
    case CommandStatus::Denied:
        return 3;
    case CommandStatus::Failed:
        return 2;
    case CommandStatus::TimedOut:
        return 1;
    default:
        return 0;
    }
}

} // namespace

QStringList buildTizenChannelUrls(const Device &device, const QString &token, const QString &clientName)
{
    const QString name = QString::fromLatin1(clientName.toUtf8().toBase64());
    const QString authToken = token == QLatin1String(kNoTokenSentinel) ? QString() : token;
    static const char *const versions[] = { "v2", "v3" };

    QStringList urls;
    QSet<QString> seen;
    auto add = [&](const QString &protocol, int port) {
        for (const char *version : versions) {
            const QString key = QStringLiteral("%1:%2:%3").arg(protocol).arg(port).arg(QLatin1String(version));
            if (seen.contains(key))
                continue;
            seen.insert(key);
            QString url = QStringLiteral("%1://%2:%3/api/%4/channels/samsung.remote.control?name=%5")
                              .arg(protocol, device.ip)
                              .arg(port)
                              .arg(QLatin1String(version), name);
            if (!authToken.isEmpty())
                url += QStringLiteral("&token=%1").arg(authToken);
            urls.append(url);
        }
    };

    if (!device.protocol.isEmpty() && device.port > 0)
        add(device.protocol, device.port);
    add(QStringLiteral("wss"), 8002);
    add(QStringLiteral("ws"), 8001);
    return urls;
}

QString tizenOrigin(const QString &channelUrl)
{
    const QUrl url(channelUrl);
    const QString scheme = url.scheme() == QLatin1String("wss") ? QStringLiteral("https") : QStringLiteral("http");
    return QStringLiteral("%1://%2:%3").arg(scheme, url.host()).arg(url.port());
}

QByteArray buildTizenKeyPayload(const QString &key)
{
    QJsonObject params;
    params.insert(QStringLiteral("Cmd"), QStringLiteral("Click"));
    params.insert(QStringLiteral("DataOfCmd"), key);
    params.insert(QStringLiteral("Option"), QStringLiteral("false"));
    params.insert(QStringLiteral("TypeOfRemote"), QStringLiteral("SendRemoteKey"));

    QJsonObject message;
    message.insert(QStringLiteral("method"), QStringLiteral("ms.remote.control"));
    message.insert(QStringLiteral("params"), params);
    return QJsonDocument(message).toJson(QJsonDocument::Compact);
}

QByteArray buildTizenLaunchPayload(const QString &appId)
{
    QJsonObject data;
    data.insert(QStringLiteral("action_type"), QStringLiteral("NATIVE_LAUNCH"));
    data.insert(QStringLiteral("appId"), appId);

    QJsonObject params;
    params.insert(QStringLiteral("event"), QStringLiteral("ed.apps.launch"));
    params.insert(QStringLiteral("to"), QStringLiteral("host"));
    params.insert(QStringLiteral("data"), data);

    QJsonObject message;
    message.insert(QStringLiteral("method"), QStringLiteral("ms.channel.emit"));
    message.insert(QStringLiteral("params"), params);
    return QJsonDocument(message).toJson(QJsonDocument::Compact);
}

TizenMessage parseTizenMessage(const QString &text)
{
    TizenMessage out;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8());
    if (!doc.isObject())
        return out;

    const QJsonObject obj = doc.object();
    out.event = obj.value(QStringLiteral("event")).toString();
    const QJsonObject data = obj.value(QStringLiteral("data")).toObject();

    if (out.event == QLatin1String("ms.channel.timeOut") || out.event == QLatin1String("ms.channel.unauthorized")
        || out.event == QLatin1String("ms.channel.error")) {
        out.kind = TizenMessage::Kind::Denied;
    } else if (out.event == QLatin1String("ms.error")) {
        out.kind = TizenMessage::Kind::Error;
        out.errorMessage = data.value(QStringLiteral("message")).toString();
        if (out.errorMessage.isEmpty())
            out.errorMessage = QStringLiteral("Tizen error");
    } else if (out.event == QLatin1String("ms.channel.connect")) {
        out.kind = TizenMessage::Kind::ChannelConnect;
        out.token = data.value(QStringLiteral("token")).toString();
        if (out.token.isEmpty())
            out.token = data.value(QStringLiteral("data")).toObject().value(QStringLiteral("token")).toString();
    } else if (out.event == QLatin1String("ms.channel.ready")) {
        out.kind = TizenMessage::Kind::ChannelReady;
    }
    return out;
}

bool isRemoteUnsupportedError(const QString &message)
{
    static const QRegularExpression re(QStringLiteral("unrecognized method value|ms\\.remote\\.control"),
                                       QRegularExpression::CaseInsensitiveOption);
    return re.match(message).hasMatch();
}

TizenSession::TizenSession(Mode mode, const QByteArray &payload)
    : m_mode(mode)
    , m_payload(payload)
{
    m_deadline.setSingleShot(true);
    QObject::connect(&m_deadline, &QTimer::timeout, &m_scope, [this]() {
        finish(State::TimedOut,
               m_mode == Mode::Pairing ? QStringLiteral("Pairing timeout") : QStringLiteral("WebSocket timeout"));
    });
}

TizenSession::~TizenSession()
{
    m_deadline.stop();
    if (m_socket) {
        QObject::disconnect(m_socket, nullptr, &m_scope, nullptr);
        m_socket->abort();
        m_socket->deleteLater();
        m_socket = nullptr;
    }
}

void TizenSession::start(const QString &url, std::function<void(const Outcome &)> done)
{
    m_done = std::move(done);
    m_safeUrl = maskToken(url);
    m_state = State::Connecting;

    m_socket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest);
#if QT_CONFIG(ssl)
    QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
    ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
    m_socket->setSslConfiguration(ssl);
    QObject::connect(m_socket, &QWebSocket::sslErrors, &m_scope, [this](const QList<QSslError> &) {
        if (m_socket)
            m_socket->ignoreSslErrors();
    });
#endif

    QObject::connect(m_socket, &QWebSocket::connected, &m_scope, [this]() {
        qCDebug(tvLog).noquote() << "WS connected:" << m_safeUrl;
        if (m_state == State::Connecting)
            m_state = State::AwaitingChannel;
    });
    QObject::connect(m_socket, &QWebSocket::textMessageReceived, &m_scope, [this](const QString &text) {
        handleText(text);
    });
    QObject::connect(m_socket, &QWebSocket::errorOccurred, &m_scope, [this](QAbstractSocket::SocketError) {
        const QString error = m_socket ? m_socket->errorString() : QStringLiteral("WebSocket error");
        qCDebug(tvLog).noquote() << "WS error:" << m_safeUrl << ":" << error;
        finish(State::TransportError, error);
    });
    QObject::connect(m_socket, &QWebSocket::disconnected, &m_scope, [this]() {
        qCDebug(tvLog).noquote() << "WS closed:" << m_safeUrl;
        finish(State::TransportError, QStringLiteral("Connection closed"));
    });

    m_deadline.start(m_mode == Mode::Pairing ? kTizenPairingDeadlineMs : kTizenCommandDeadlineMs);

    QNetworkRequest request{QUrl(url)};
    request.setRawHeader("Origin", tizenOrigin(url).toUtf8());
    request.setRawHeader("User-Agent", "phi-adapter-samsungtv-ipc/1.0");
    m_socket->open(request);
}

void TizenSession::handleText(const QString &text)
{
    if (isTerminal(m_state))
        return;

    const TizenMessage message = parseTizenMessage(text);
    switch (message.kind) {
    case TizenMessage::Kind::Ignored:
        return;
    case TizenMessage::Kind::Denied:
        finish(State::Denied, QStringLiteral("Tizen WS denied: %1").arg(message.event));
        return;
    case TizenMessage::Kind::Error:
        if (isRemoteUnsupportedError(message.errorMessage))
            finish(State::Unsupported, QStringLiteral("Tizen remote unsupported"));
        else
            finish(State::Failed, QStringLiteral("Tizen error: %1").arg(message.errorMessage));
        return;
    case TizenMessage::Kind::ChannelConnect:
        if (m_mode == Mode::Pairing) {
            finish(State::Succeeded, QString(), message.token);
            return;
        }
        break;
    case TizenMessage::Kind::ChannelReady:
        if (m_mode == Mode::Pairing)
            return;
        break;
    }

    if (m_state != State::Connecting && m_state != State::AwaitingChannel)
        return;
    m_state = State::Sending;
    QTimer::singleShot(kTizenSendDelayMs, &m_scope, [this]() { sendPayload(); });
}

void TizenSession::sendPayload()
{
    if (m_state != State::Sending || !m_socket)
        return;
    m_socket->sendTextMessage(QString::fromUtf8(m_payload));
    m_state = State::Settling;
    QTimer::singleShot(kTizenSendDelayMs, &m_scope, [this]() {
        if (m_state == State::Settling)
            finish(State::Succeeded, QString());
    });
}

void TizenSession::finish(State state, const QString &error, const QString &token)
{
    if (isTerminal(m_state))
        return;
    m_state = state;
    m_deadline.stop();
    if (m_socket) {
        QObject::disconnect(m_socket, nullptr, &m_scope, nullptr);
        if (state == State::TimedOut)
            m_socket->abort();
        else
            m_socket->close();
    }

    qCDebug(tvLog).noquote() << "Tizen session" << m_safeUrl << "->" << sessionStateName(state);

    auto done = std::move(m_done);
    m_done = nullptr;
    if (done)
        done(Outcome { state, token, error });
}

CommandStatus commandStatusForSession(TizenSession::State state)
{
    switch (state) {
    case TizenSession::State::Succeeded:
        return CommandStatus::Ok;
    case TizenSession::State::Denied:
        return CommandStatus::Denied;
    case TizenSession::State::TimedOut:
        return CommandStatus::TimedOut;
    case TizenSession::State::TransportError:
        return CommandStatus::TransportError;
    case TizenSession::State::Unsupported:
        return CommandStatus::Unsupported;
    default:
        return CommandStatus::Failed;
    }
}

TizenAdapter::TizenAdapter(const SecretStore *secrets, NetworkProbes *probes, const QString &clientName)
    : m_secrets(secrets)
    , m_probes(probes)
    , m_clientName(clientName)
{
}

TizenAdapter::~TizenAdapter()
{
    m_sessions.clear();
}

void TizenAdapter::runSession(TizenSession::Mode mode,
                              const QString &url,
                              const QByteArray &payload,
                              std::function<void(const TizenSession::Outcome &)> done)
{
    const std::uint64_t id = m_nextSession++;
    auto session = std::make_shared<TizenSession>(mode, payload);
    m_sessions.insert(id, session);
    session->start(url, [this, id, done](const TizenSession::Outcome &outcome) {
        // The session is still on the stack; release it on the next turn.
        QTimer::singleShot(0, &m_scope, [this, id]() { m_sessions.remove(id); });
        done(outcome);
    });
}

void TizenAdapter::sendKey(const Device &device, const QString &key, CommandCallback done)
{
    send(device, buildTizenKeyPayload(key), std::move(done));
}

void TizenAdapter::launchApp(const Device &device, const QString &appId, CommandCallback done)
{
    if (appId.trimmed().isEmpty()) {
        done(CommandResult::failure(CommandStatus::InvalidArgument, QStringLiteral("Missing app id")));
        return;
    }
    send(device, buildTizenLaunchPayload(appId.trimmed()), std::move(done));
}

void TizenAdapter::send(const Device &device, const QByteArray &payload, CommandCallback done)
{
    if (device.ip.isEmpty()) {
        done(CommandResult::failure(CommandStatus::InvalidArgument, QStringLiteral("No IP")));
        return;
    }
    const QString token = m_secrets->tizenAuthToken(device.id);
    if (device.tokenAuthSupport == std::optional<bool>(true) && token.isEmpty()) {
        done(CommandResult::failure(CommandStatus::NotPaired, QStringLiteral("Not paired (Tizen)")));
        return;
    }
    const QStringList urls = buildTizenChannelUrls(device, token, m_clientName);
    sendAt(urls, 0, payload,
           CommandResult::failure(CommandStatus::TransportError, QStringLiteral("Tizen WS failed")),
           std::move(done));
}

void TizenAdapter::sendAt(const QStringList &urls,
                          int index,
                          const QByteArray &payload,
                          CommandResult best,
                          CommandCallback done)
{
    if (index >= urls.size()) {
        done(best);
        return;
    }
    runSession(TizenSession::Mode::Command, urls.at(index), payload,
               [this, urls, index, payload, best, done](const TizenSession::Outcome &outcome) {
        const CommandStatus status = commandStatusForSession(outcome.state);
        if (status == CommandStatus::Ok) {
            done(CommandResult::success());
            return;
        }
        if (status == CommandStatus::Unsupported) {
            done(CommandResult::failure(status, outcome.error));
            return;
        }
        CommandResult next = best;
        if (failureRank(status) >= failureRank(best.status))
            next = CommandResult::failure(status, outcome.error);
        sendAt(urls, index + 1, payload, next, done);
    });
}

void TizenAdapter::pair(const Device &device, const QString &pin, PairingCallback done)
{
    Q_UNUSED(pin);
    if (device.ip.isEmpty()) {
        PairingResult result;
        result.error = QStringLiteral("No IP");
        done(result);
        return;
    }
    qCDebug(tvLog) << "Pairing (Tizen) started for" << device.name << "(" << device.ip << ")";
    const QStringList urls = buildTizenChannelUrls(device, QString(), m_clientName);
    PairingResult initial;
    initial.error = QStringLiteral("Pairing failed");
    pairAt(device, urls, 0, initial, std::move(done));
}

void TizenAdapter::pairAt(const Device &device,
                          const QStringList &urls,
                          int index,
                          PairingResult last,
                          PairingCallback done)
{
    if (index >= urls.size()) {
        static const QRegularExpression promptless(
            QStringLiteral("Pairing timeout|ms\\.channel\\.timeOut|ms\\.channel\\.unauthorized"));
        if (promptless.match(last.error).hasMatch()) {
            last.hint = QString::fromLatin1(kPairingHint);
            qCWarning(tvLog).noquote() << "Pairing failed: no prompt/authorization from TV." << last.hint;
        }
        done(last);
        return;
    }

    const QString url = urls.at(index);
    runSession(TizenSession::Mode::Pairing, url, QByteArray(),
               [this, device, urls, index, last, done, url](const TizenSession::Outcome &outcome) {
        const QString scheme = url.startsWith(QLatin1String("wss://")) ? QStringLiteral("wss") : QStringLiteral("ws");
        const QString version = url.contains(QLatin1String("/api/v3/")) ? QStringLiteral("v3") : QStringLiteral("v2");

        PairingResult result;
        if (outcome.state == TizenSession::State::Succeeded) {
            const bool noToken = outcome.token.isEmpty();
            if (noToken && device.tokenAuthSupport == std::optional<bool>(true)) {
                result.error = QStringLiteral("Token required but not granted by TV");
            } else {
                qCDebug(tvLog).noquote() << "Pairing (Tizen) succeeded" << (noToken ? "without token " : "")
                                         << "for" << device.name << "via" << scheme << version;
                result.ok = true;
                result.token = noToken ? QString::fromLatin1(kNoTokenSentinel) : outcome.token;
                done(result);
                return;
            }
        } else {
            result.error = outcome.error;
        }
        qCDebug(tvLog).noquote() << "Pairing (Tizen) failed for" << device.name << "via" << scheme << version
                                 << ":" << result.error;
        pairAt(device, urls, index + 1, result, done);
    });
}

void TizenAdapter::queryInfo(const Device &device, InfoCallback done)
{
    if (device.ip.isEmpty()) {
        done(InfoResult { false, QJsonObject(), QStringLiteral("No IP") });
        return;
    }
    const QString protocol = device.protocol.isEmpty() ? QStringLiteral("wss") : device.protocol;
    const int port = device.port > 0 ? device.port : 8002;
    const QString ip = device.ip;
    QPointer<QObject> guard(&m_scope);
    m_probes->fetchJson(tizenInfoUrl(ip, protocol, port), kInfoTimeoutMs,
                        [this, guard, ip, protocol, port, done](const JsonFetch &fetch) {
        if (!guard)
            return;
        if (fetch.ok || (protocol == QLatin1String("ws") && port == 8001)) {
            done(InfoResult { fetch.ok, fetch.body, fetch.error });
            return;
        }
        m_probes->fetchJson(tizenInfoUrl(ip, QStringLiteral("ws"), 8001), kInfoTimeoutMs,
                            [done](const JsonFetch &insecure) {
            done(InfoResult { insecure.ok, insecure.body, insecure.error });
        });
    });
}

} // namespace phicore::samsungtv::ipc

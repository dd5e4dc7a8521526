#include "tv_hj.h"

#include <QDateTime>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkRequest>
#include <QPointer>
#include <QRegularExpression>
#include <QUrl>
#include <QUuid>
#include <QWebSocket>

#include "tv_classifier.h"
#include "tv_http.h"
#include "tv_keys.h"
#include "tv_log.h"
#include "tv_netprobe.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kPairingHttpTimeoutMs = 5000;
constexpr int kSessionDeadlineMs = 5000;
constexpr int kSessionSendDelayMs = 200;
constexpr int kInfoTimeoutMs = 1500;

const char kCompanionEndpoint[] = "/com.samsung.companion";

PairingResult pairingFailure(const QString &reason)
{
    PairingResult result;
    result.error = QStringLiteral("HJ pairing failed: %1").arg(reason);
    return result;
}

} // namespace

QString hjDeviceId()
{
    return QUuid::createUuidV5(QUuid(QString::fromLatin1(kHjAppId)), QString::fromLatin1(kHjUserId))
        .toString(QUuid::WithoutBraces);
}

QString hjPairingUrl(const QString &ip, int step)
{
    QString url = QStringLiteral("http://%1:%2/ws/pairing?step=%3&app_id=%4&device_id=%5")
                      .arg(ip)
                      .arg(kHjPairingPort)
                      .arg(step)
                      .arg(QLatin1String(kHjAppId), hjDeviceId());
    if (step == 0)
        url += QStringLiteral("&type=1");
    return url;
}

QString parsePinPageState(const QByteArray &page)
{
    static const QRegularExpression re(QStringLiteral("<state>(.*?)</state>"),
                                       QRegularExpression::DotMatchesEverythingOption);
    const QRegularExpressionMatch match = re.match(QString::fromUtf8(page));
    return match.hasMatch() ? match.captured(1).trimmed() : QString();
}

std::optional<QJsonObject> parseHjAuthData(const QByteArray &body)
{
    const QJsonDocument outer = QJsonDocument::fromJson(body);
    if (!outer.isObject())
        return std::nullopt;
    const QJsonValue authData = outer.object().value(QStringLiteral("auth_data"));
    if (authData.isObject())
        return authData.toObject();
    const QJsonDocument inner = QJsonDocument::fromJson(authData.toString().toUtf8());
    if (!inner.isObject())
        return std::nullopt;
    return inner.object();
}

QByteArray buildHjHelloRequest(const QByteArray &serverHello)
{
    QJsonObject auth;
    auth.insert(QStringLiteral("auth_type"), QStringLiteral("SPC"));
    auth.insert(QStringLiteral("GeneratorServerHello"), QString::fromLatin1(serverHello.toHex().toUpper()));
    QJsonObject root;
    root.insert(QStringLiteral("auth_Data"), auth);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray buildHjAckRequest(const QString &requestId, const QString &serverAck)
{
    QJsonObject auth;
    auth.insert(QStringLiteral("auth_type"), QStringLiteral("SPC"));
    auth.insert(QStringLiteral("request_id"), requestId);
    auth.insert(QStringLiteral("ServerAckMsg"), serverAck);
    QJsonObject root;
    root.insert(QStringLiteral("auth_Data"), auth);
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QString parseSocketIoHandshake(const QByteArray &body)
{
    const QString text = QString::fromUtf8(body).trimmed();
    const int colon = text.indexOf(QLatin1Char(':'));
    return colon > 0 ? text.left(colon) : QString();
}

QByteArray buildHjKeyCommand(const QString &key, const QString &type)
{
    QJsonObject body;
    body.insert(QStringLiteral("plugin"), QStringLiteral("RemoteControl"));
    body.insert(QStringLiteral("param1"), QStringLiteral("uuid:12345"));
    body.insert(QStringLiteral("param2"), type);
    body.insert(QStringLiteral("param3"), key);
    body.insert(QStringLiteral("param4"), false);
    body.insert(QStringLiteral("api"), QStringLiteral("SendRemoteKey"));
    body.insert(QStringLiteral("version"), QStringLiteral("1.000"));

    QJsonObject command;
    command.insert(QStringLiteral("method"), QStringLiteral("POST"));
    command.insert(QStringLiteral("body"), body);
    return QJsonDocument(command).toJson(QJsonDocument::Compact);
}

QString buildHjEmitFrame(qint64 sessionId, const QByteArray &encryptedBody)
{
    QJsonObject arg;
    arg.insert(QStringLiteral("Session_Id"), static_cast<double>(sessionId));
    arg.insert(QStringLiteral("body"), formatByteList(encryptedBody));

    QJsonObject message;
    message.insert(QStringLiteral("name"), QStringLiteral("callCommon"));
    message.insert(QStringLiteral("args"), QJsonArray { arg });
    return QStringLiteral("5::%1:%2")
        .arg(QLatin1String(kCompanionEndpoint),
             QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact)));
}

QList<HjKeyEvent> hjKeyEvents(const QString &key)
{
    if (isPowerKey(key))
        return { HjKeyEvent { QStringLiteral("Press"), 0 }, HjKeyEvent { QStringLiteral("Release"), kHjPowerKeyHoldMs } };
    return { HjKeyEvent { QStringLiteral("Click"), 0 } };
}

HjSession::HjSession(HttpClient *http, const HjIdentity &identity)
    : m_http(http)
    , m_identity(identity)
{
    m_deadline.setSingleShot(true);
    QObject::connect(&m_deadline, &QTimer::timeout, &m_scope, [this]() {
        finish(State::TimedOut, QStringLiteral("HJ session timeout"));
    });
}

HjSession::~HjSession()
{
    m_deadline.stop();
    if (m_socket) {
        QObject::disconnect(m_socket, nullptr, &m_scope, nullptr);
        m_socket->abort();
        m_socket->deleteLater();
        m_socket = nullptr;
    }
}

void HjSession::start(const QString &ip, const QString &key, std::function<void(const CommandResult &)> done)
{
    m_done = std::move(done);
    m_key = key;
    m_events = hjKeyEvents(key);
    m_state = State::Handshake;
    m_deadline.start(kSessionDeadlineMs);

    const QUrl url(QStringLiteral("http://%1:%2/socket.io/1/?t=%3")
                       .arg(ip)
                       .arg(kHjSessionPort)
                       .arg(QDateTime::currentMSecsSinceEpoch()));
    // The client outlives the session; results arriving late are dropped.
    QPointer<QObject> guard(&m_scope);
    m_http->get(url, kSessionDeadlineMs, [this, guard, ip](const HttpResult &result) {
        if (!guard || m_state != State::Handshake)
            return;
        if (!result.ok) {
            finish(State::TransportError, QStringLiteral("socket.io handshake failed: %1").arg(result.error));
            return;
        }
        const QString handshakeId = parseSocketIoHandshake(result.payload);
        if (handshakeId.isEmpty()) {
            finish(State::Failed, QStringLiteral("socket.io handshake returned no session"));
            return;
        }
        openSocket(ip, handshakeId);
    });
}

void HjSession::openSocket(const QString &ip, const QString &handshakeId)
{
    m_state = State::Connecting;
    m_socket = new QWebSocket(QString(), QWebSocketProtocol::VersionLatest);
    QObject::connect(m_socket, &QWebSocket::connected, &m_scope, [this]() {
        if (m_state == State::Connecting)
            m_state = State::AwaitingEndpoint;
    });
    QObject::connect(m_socket, &QWebSocket::textMessageReceived, &m_scope, [this](const QString &text) {
        handleText(text);
    });
    QObject::connect(m_socket, &QWebSocket::errorOccurred, &m_scope, [this](QAbstractSocket::SocketError) {
        finish(State::TransportError, m_socket ? m_socket->errorString() : QStringLiteral("WebSocket error"));
    });
    QObject::connect(m_socket, &QWebSocket::disconnected, &m_scope, [this]() {
        finish(State::TransportError, QStringLiteral("Connection closed"));
    });

    const QUrl url(QStringLiteral("ws://%1:%2/socket.io/1/websocket/%3").arg(ip).arg(kHjSessionPort).arg(handshakeId));
    m_socket->open(url);
}

void HjSession::handleText(const QString &text)
{
    if (text.startsWith(QLatin1String("2::"))) {
        m_socket->sendTextMessage(QStringLiteral("2::"));
        return;
    }
    if (text.startsWith(QLatin1String("0::"))) {
        finish(State::TransportError, QStringLiteral("Session closed by TV"));
        return;
    }
    if (text.startsWith(QLatin1String("7:"))) {
        finish(State::Failed, QStringLiteral("socket.io error: %1").arg(text));
        return;
    }
    if (m_state != State::AwaitingEndpoint && m_state != State::Connecting)
        return;
    if (text == QLatin1String("1::")) {
        m_socket->sendTextMessage(QStringLiteral("1::%1").arg(QLatin1String(kCompanionEndpoint)));
        m_state = State::Sending;
        QTimer::singleShot(kSessionSendDelayMs, &m_scope, [this]() { sendNext(); });
    }
}

void HjSession::sendNext()
{
    if (m_state != State::Sending || !m_socket)
        return;
    if (m_events.isEmpty()) {
        m_state = State::Settling;
        QTimer::singleShot(kSessionSendDelayMs, &m_scope, [this]() {
            if (m_state == State::Settling)
                finish(State::Succeeded, QString());
        });
        return;
    }

    const HjKeyEvent event = m_events.takeFirst();
    QString error;
    const QByteArray encrypted = hjEncryptCommand(m_identity.aesKey, buildHjKeyCommand(m_key, event.type), &error);
    if (encrypted.isEmpty()) {
        finish(State::Failed, error);
        return;
    }
    m_socket->sendTextMessage(buildHjEmitFrame(m_identity.sessionId, encrypted));

    const int delay = m_events.isEmpty() ? 0 : m_events.first().delayMs;
    if (delay > 0)
        QTimer::singleShot(delay, &m_scope, [this]() { sendNext(); });
    else
        sendNext();
}

void HjSession::finish(State state, const QString &error)
{
    if (m_state == State::Succeeded || m_state == State::TimedOut || m_state == State::TransportError
        || m_state == State::Failed)
        return;
    m_state = state;
    m_deadline.stop();
    if (m_socket) {
        QObject::disconnect(m_socket, nullptr, &m_scope, nullptr);
        if (state == State::Succeeded)
            m_socket->close();
        else
            m_socket->abort();
    }

    CommandResult result = CommandResult::success();
    if (state == State::TimedOut)
        result = CommandResult::failure(CommandStatus::TimedOut, error);
    else if (state == State::TransportError)
        result = CommandResult::failure(CommandStatus::TransportError, error);
    else if (state != State::Succeeded)
        result = CommandResult::failure(CommandStatus::Failed, error);

    auto done = std::move(m_done);
    m_done = nullptr;
    if (done)
        done(result);
}

HjAdapter::HjAdapter(HttpClient *http, const SecretStore *secrets, NetworkProbes *probes, const QString &keyFile)
    : m_http(http)
    , m_secrets(secrets)
    , m_probes(probes)
    , m_keyFile(keyFile)
{
}

HjAdapter::~HjAdapter()
{
    m_sessions.clear();
}

void HjAdapter::runSession(const Device &device, const QString &key, const HjIdentity &identity, CommandCallback done)
{
    const std::uint64_t id = m_nextSession++;
    auto session = std::make_shared<HjSession>(m_http, identity);
    m_sessions.insert(id, session);
    session->start(device.ip, key, [this, id, done](const CommandResult &result) {
        QTimer::singleShot(0, &m_scope, [this, id]() { m_sessions.remove(id); });
        done(result);
    });
}

void HjAdapter::sendKey(const Device &device, const QString &key, CommandCallback done)
{
    if (device.ip.isEmpty()) {
        done(CommandResult::failure(CommandStatus::InvalidArgument, QStringLiteral("No IP")));
        return;
    }
    const auto identity = m_secrets->hjIdentity(device.id);
    if (!identity.has_value()) {
        done(CommandResult::failure(CommandStatus::NotPaired, QStringLiteral("Not paired (HJ)")));
        return;
    }

    runSession(device, key, *identity, [this, device, key, identity, done](const CommandResult &first) {
        if (first.ok()) {
            qCDebug(tvLog) << "HJ sendKey" << key << "to" << device.name;
            done(first);
            return;
        }
        qCDebug(tvLog) << "HJ sendKey failed (" << key << ") for" << device.name << ":" << first.error;
        runSession(device, key, *identity, [device, key, done](const CommandResult &retry) {
            if (retry.ok())
                qCDebug(tvLog) << "HJ sendKey retry" << key << "to" << device.name;
            done(retry);
        });
    });
}

void HjAdapter::pair(const Device &device, const QString &pin, PairingCallback done)
{
    if (device.ip.isEmpty()) {
        done(pairingFailure(QStringLiteral("No IP")));
        return;
    }
    if (pin.trimmed().isEmpty())
        requestPin(device, std::move(done));
    else
        confirmPin(device, pin.trimmed(), std::move(done));
}

void HjAdapter::requestPin(const Device &device, PairingCallback done)
{
    qCDebug(tvLog) << "Pairing (HJ) PIN requested for" << device.name << "(" << device.ip << ")";
    const QString base = QStringLiteral("http://%1:%2").arg(device.ip).arg(kHjPairingPort);
    const QString deviceId = device.id;
    const QString ip = device.ip;
    QPointer<QObject> guard(&m_scope);

    auto firstStep = [this, guard, ip, deviceId, done]() {
        m_http->get(QUrl(hjPairingUrl(ip, 0)), kPairingHttpTimeoutMs, [this, guard, deviceId, done](const HttpResult &result) {
            if (!guard)
                return;
            if (!result.ok) {
                done(pairingFailure(QStringLiteral("pairing step 0: %1").arg(result.error)));
                return;
            }
            m_pendingPin.insert(deviceId);
            PairingResult out;
            out.ok = true;
            out.needsPin = true;
            done(out);
        });
    };

    m_http->get(QUrl(base + QStringLiteral("/ws/apps/CloudPINPage")), kPairingHttpTimeoutMs,
                [this, guard, base, firstStep, done](const HttpResult &page) {
        if (!guard)
            return;
        if (!page.ok) {
            done(pairingFailure(QStringLiteral("PIN page unavailable: %1").arg(page.error)));
            return;
        }
        if (parsePinPageState(page.payload) == QLatin1String("running")) {
            firstStep();
            return;
        }
        HttpHeaders headers;
        headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("text/plain") });
        m_http->send(QByteArrayLiteral("POST"), QUrl(base + QStringLiteral("/ws/apps/CloudPINPage")), headers,
                     QByteArrayLiteral("pin4"), kPairingHttpTimeoutMs, [guard, firstStep, done](const HttpResult &shown) {
            if (!guard)
                return;
            if (!shown.ok) {
                done(pairingFailure(QStringLiteral("could not show PIN: %1").arg(shown.error)));
                return;
            }
            firstStep();
        });
    });
}

void HjAdapter::confirmPin(const Device &device, const QString &pin, PairingCallback done)
{
    if (!m_pendingPin.contains(device.id)) {
        done(pairingFailure(QStringLiteral("PIN was not requested")));
        return;
    }
    QString error;
    const auto keys = HjKeyMaterial::loadFromFile(m_keyFile, &error);
    if (!keys.has_value()) {
        done(pairingFailure(error));
        return;
    }
    auto crypto = std::make_shared<HjPairingCrypto>(*keys);
    HjServerHello hello;
    if (!crypto->generateServerHello(QString::fromLatin1(kHjUserId), pin, &hello, &error)) {
        done(pairingFailure(error));
        return;
    }

    qCDebug(tvLog) << "Pairing (HJ) confirm PIN for" << device.name << "(" << device.ip << ")";
    const QString ip = device.ip;
    const QString deviceId = device.id;
    const QString name = device.name;
    QPointer<QObject> guard(&m_scope);

    m_http->postJson(QUrl(hjPairingUrl(ip, 1)), buildHjHelloRequest(hello.message), kPairingHttpTimeoutMs,
                     [this, guard, crypto, hello, ip, deviceId, name, done](const HttpResult &stepOne) {
        if (!guard)
            return;
        if (!stepOne.ok) {
            done(pairingFailure(QStringLiteral("hello exchange: %1").arg(stepOne.error)));
            return;
        }
        const auto auth = parseHjAuthData(stepOne.payload);
        if (!auth.has_value()) {
            done(pairingFailure(QStringLiteral("invalid hello reply")));
            return;
        }
        const QJsonValue requestIdValue = auth->value(QStringLiteral("request_id"));
        const QString requestId = requestIdValue.isDouble() ? QString::number(requestIdValue.toInt())
                                                             : requestIdValue.toString();
        const QByteArray clientHello =
            QByteArray::fromHex(auth->value(QStringLiteral("GeneratorClientHello")).toString().toLatin1());

        HjClientHello parsed;
        QString cryptoError;
        if (!crypto->parseClientHello(clientHello, hello, QString::fromLatin1(kHjUserId), &parsed, &cryptoError)) {
            done(pairingFailure(cryptoError));
            return;
        }

        const QByteArray ack = buildHjAckRequest(requestId, HjPairingCrypto::serverAcknowledge(parsed.skPrime));
        m_http->postJson(QUrl(hjPairingUrl(ip, 2)), ack, kPairingHttpTimeoutMs,
                         [this, guard, parsed, ip, deviceId, name, done](const HttpResult &stepTwo) {
            if (!guard)
                return;
            if (!stepTwo.ok) {
                done(pairingFailure(QStringLiteral("acknowledge exchange: %1").arg(stepTwo.error)));
                return;
            }
            if (stepTwo.payload.contains("secure-mode")) {
                done(pairingFailure(QStringLiteral("TV requested unsupported secure-mode encryption")));
                return;
            }
            const auto auth = parseHjAuthData(stepTwo.payload);
            if (!auth.has_value()) {
                done(pairingFailure(QStringLiteral("invalid acknowledge reply")));
                return;
            }
            if (!HjPairingCrypto::verifyClientAcknowledge(auth->value(QStringLiteral("ClientAckMsg")).toString(),
                                                          parsed.skPrime)) {
                done(pairingFailure(QStringLiteral("client acknowledge mismatch")));
                return;
            }
            const QJsonValue sessionValue = auth->value(QStringLiteral("session_id"));
            HjIdentity identity;
            identity.sessionId = sessionValue.isDouble() ? static_cast<qint64>(sessionValue.toDouble())
                                                         : sessionValue.toString().toLongLong();
            identity.aesKey = parsed.sessionKey;
            m_pendingPin.remove(deviceId);

            const QUrl closeUrl(QStringLiteral("http://%1:%2/ws/apps/CloudPINPage/run").arg(ip).arg(kHjPairingPort));
            m_http->send(QByteArrayLiteral("DELETE"), closeUrl, {}, {}, kPairingHttpTimeoutMs,
                         [identity, name, done](const HttpResult &closed) {
                if (!closed.ok)
                    qCDebug(tvLog) << "Closing PIN page failed for" << name << ":" << closed.error;
                qCInfo(tvLog) << "Pairing (HJ) succeeded for" << name;
                PairingResult out;
                out.ok = true;
                out.identity = identity;
                done(out);
            });
        });
    });
}

void HjAdapter::queryInfo(const Device &device, InfoCallback done)
{
    if (device.ip.isEmpty()) {
        done(InfoResult { false, QJsonObject(), QStringLiteral("No IP") });
        return;
    }
    m_probes->fetchJson(hjInfoUrl(device.ip), kInfoTimeoutMs, [done](const JsonFetch &fetch) {
        done(InfoResult { fetch.ok, fetch.body, fetch.error });
    });
}

} // namespace phicore::samsungtv::ipc

#include "tv_legacy.h"

#include <QSysInfo>
#include <QTcpSocket>
#include <QtEndian>

#include "tv_log.h"
#include "tv_netprobe.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kConnectTimeoutMs = 5000;

void appendField(QByteArray *out, const QByteArray &bytes)
{
    uchar len[2];
    qToLittleEndian(static_cast<quint16>(bytes.size()), len);
    out->append(reinterpret_cast<const char *>(len), 2);
    out->append(bytes);
}

QByteArray frame(const QByteArray &app, const QByteArray &payload)
{
    QByteArray out;
    out.append('\x00');
    appendField(&out, app);
    appendField(&out, payload);
    return out;
}

quint16 readLe16(const QByteArray &data, int pos)
{
    return qFromLittleEndian<quint16>(reinterpret_cast<const uchar *>(data.constData() + pos));
}

} // namespace

QByteArray buildLegacyAuthFrame(const QString &localIp, const QString &remoteId, const QString &clientName)
{
    QByteArray payload("\x64\x00", 2);
    appendField(&payload, localIp.toUtf8().toBase64());
    appendField(&payload, remoteId.toUtf8().toBase64());
    appendField(&payload, clientName.toUtf8().toBase64());
    return frame(QByteArrayLiteral(kLegacyAuthApp), payload);
}

QByteArray buildLegacyKeyFrame(const QString &key)
{
    QByteArray payload("\x00\x00\x00", 3);
    appendField(&payload, key.toUtf8().toBase64());
    return frame(QByteArrayLiteral(kLegacyKeyApp), payload);
}

LegacyReply parseLegacyReply(const QByteArray &buffer, int *consumed)
{
    if (buffer.size() < 3)
        return LegacyReply::Incomplete;
    const int appLen = readLe16(buffer, 1);
    const int payloadLenPos = 3 + appLen;
    if (buffer.size() < payloadLenPos + 2)
        return LegacyReply::Incomplete;
    const int payloadLen = readLe16(buffer, payloadLenPos);
    const int payloadPos = payloadLenPos + 2;
    if (buffer.size() < payloadPos + payloadLen)
        return LegacyReply::Incomplete;

    *consumed = payloadPos + payloadLen;
    const QByteArray payload = buffer.mid(payloadPos, payloadLen);
    if (payload.startsWith(QByteArray("\x64\x00\x01\x00", 4)))
        return LegacyReply::Granted;
    if (payload.startsWith(QByteArray("\x64\x00\x00\x00", 4)))
        return LegacyReply::Denied;
    if (payload.startsWith('\x65'))
        return LegacyReply::Denied;
    if (payload.startsWith('\x0a'))
        return LegacyReply::Waiting;
    return LegacyReply::Other;
}

LegacySession::LegacySession(Mode mode, const QByteArray &frames)
    : m_mode(mode)
    , m_frames(frames)
{
    m_deadline.setSingleShot(true);
    QObject::connect(&m_deadline, &QTimer::timeout, &m_scope, [this]() {
        finish(CommandResult::failure(CommandStatus::TimedOut,
                                      m_mode == Mode::Pair ? QStringLiteral("Pairing timeout")
                                                           : QStringLiteral("Legacy remote timeout")));
    });
}

LegacySession::~LegacySession()
{
    m_deadline.stop();
    if (m_socket) {
        QObject::disconnect(m_socket, nullptr, &m_scope, nullptr);
        m_socket->abort();
        m_socket->deleteLater();
        m_socket = nullptr;
    }
}

void LegacySession::start(const QString &ip, std::function<void(const CommandResult &)> done)
{
    m_done = std::move(done);
    m_socket = new QTcpSocket();

    QObject::connect(m_socket, &QTcpSocket::connected, &m_scope, [this]() {
        m_socket->write(m_frames);
        m_socket->flush();
        if (m_mode == Mode::Key) {
            QTimer::singleShot(kLegacyCloseDelayMs, &m_scope, [this]() { finish(CommandResult::success()); });
        } else {
            m_deadline.start(kLegacyPairTimeoutMs);
        }
    });
    QObject::connect(m_socket, &QTcpSocket::readyRead, &m_scope, [this]() { handleReadyRead(); });
    QObject::connect(m_socket, &QTcpSocket::errorOccurred, &m_scope, [this](QAbstractSocket::SocketError) {
        finish(CommandResult::failure(CommandStatus::TransportError, m_socket->errorString()));
    });

    m_deadline.start(kConnectTimeoutMs);
    m_socket->connectToHost(ip, kLegacyPort);
}

void LegacySession::handleReadyRead()
{
    m_buffer.append(m_socket->readAll());
    for (;;) {
        int consumed = 0;
        const LegacyReply reply = parseLegacyReply(m_buffer, &consumed);
        if (reply == LegacyReply::Incomplete)
            return;
        m_buffer.remove(0, consumed);

        if (reply == LegacyReply::Denied) {
            finish(CommandResult::failure(CommandStatus::Denied, QStringLiteral("Access denied by TV")));
            return;
        }
        if (reply == LegacyReply::Granted && m_mode == Mode::Pair) {
            finish(CommandResult::success());
            return;
        }
        if (reply == LegacyReply::Waiting)
            qCDebug(tvLog) << "Legacy remote waiting for user confirmation";
    }
}

void LegacySession::finish(const CommandResult &result)
{
    if (m_finished)
        return;
    m_finished = true;
    m_deadline.stop();
    if (m_socket) {
        QObject::disconnect(m_socket, nullptr, &m_scope, nullptr);
        m_socket->abort();
    }
    auto done = std::move(m_done);
    m_done = nullptr;
    if (done)
        done(result);
}

LegacyAdapter::LegacyAdapter(NetworkProbes *probes, const QString &clientName)
    : m_probes(probes)
    , m_clientName(clientName)
{
}

LegacyAdapter::~LegacyAdapter()
{
    m_sessions.clear();
}

QByteArray LegacyAdapter::authFrame(const QString &ip)
{
    QString remoteId = QSysInfo::machineHostName();
    if (remoteId.isEmpty())
        remoteId = m_clientName;
    return buildLegacyAuthFrame(m_probes->localAddressFor(ip), remoteId, m_clientName);
}

void LegacyAdapter::runSession(LegacySession::Mode mode,
                               const QString &ip,
                               const QByteArray &frames,
                               std::function<void(const CommandResult &)> done)
{
    const std::uint64_t id = m_nextSession++;
    auto session = std::make_shared<LegacySession>(mode, frames);
    m_sessions.insert(id, session);
    session->start(ip, [this, id, done](const CommandResult &result) {
        QTimer::singleShot(0, &m_scope, [this, id]() { m_sessions.remove(id); });
        done(result);
    });
}

void LegacyAdapter::sendKey(const Device &device, const QString &key, CommandCallback done)
{
    if (device.ip.isEmpty()) {
        done(CommandResult::failure(CommandStatus::InvalidArgument, QStringLiteral("No IP")));
        return;
    }
    const QByteArray frames = authFrame(device.ip) + buildLegacyKeyFrame(key);
    runSession(LegacySession::Mode::Key, device.ip, frames, [device, key, done](const CommandResult &result) {
        if (result.ok())
            qCDebug(tvLog) << "Legacy sendKey" << key << "to" << device.name;
        done(result);
    });
}

void LegacyAdapter::pair(const Device &device, const QString &pin, PairingCallback done)
{
    Q_UNUSED(pin);
    if (device.ip.isEmpty()) {
        PairingResult result;
        result.error = QStringLiteral("No IP");
        done(result);
        return;
    }
    runSession(LegacySession::Mode::Pair, device.ip, authFrame(device.ip), [device, done](const CommandResult &result) {
        PairingResult out;
        out.ok = result.ok();
        if (!out.ok) {
            out.error = result.error;
            out.hint = QStringLiteral("Accept the remote on the TV screen when it asks.");
        } else {
            qCInfo(tvLog) << "Pairing (legacy) accepted by" << device.name;
        }
        done(out);
    });
}

void LegacyAdapter::queryInfo(const Device &device, InfoCallback done)
{
    Q_UNUSED(device);
    done(InfoResult { false, QJsonObject(), QStringLiteral("queryInfo is not available on legacy sets") });
}

} // namespace phicore::samsungtv::ipc

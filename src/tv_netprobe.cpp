#include "tv_netprobe.h"

#include <algorithm>
#include <cmath>
#include <memory>

#include <QDateTime>
#include <QHostAddress>
#include <QJsonDocument>
#include <QNetworkInterface>
#include <QProcess>
#include <QRegularExpression>
#include <QTcpSocket>
#include <QTimer>
#include <QUdpSocket>
#include <QUrl>

#include "tv_http.h"
#include "tv_identity.h"
#include "tv_log.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr std::int64_t kNeighbourCacheMs = 10000;
constexpr quint16 kWakeOnLanPort = 9;

} // namespace

QHash<QString, QString> parseNeighbourTable(const QString &text)
{
    static const QRegularExpression re(QStringLiteral("^([0-9.]+)\\s+.*lladdr\\s+([0-9a-f:]{17})"),
                                       QRegularExpression::CaseInsensitiveOption);
    QHash<QString, QString> out;
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        const QRegularExpressionMatch m = re.match(line.trimmed());
        if (m.hasMatch())
            out.insert(normalizeMac(m.captured(2)), m.captured(1));
    }
    return out;
}

QHash<QString, QString> parseArpTable(const QString &text)
{
    static const QRegularExpression re(QStringLiteral("\\(([0-9.]+)\\)\\s+at\\s+([0-9a-f:]{17})"),
                                       QRegularExpression::CaseInsensitiveOption);
    QHash<QString, QString> out;
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        const QRegularExpressionMatch m = re.match(line);
        if (m.hasMatch())
            out.insert(normalizeMac(m.captured(2)), m.captured(1));
    }
    return out;
}

QString parseMacFromNeighbourLine(const QString &text)
{
    static const QRegularExpression re(QStringLiteral("lladdr\\s+([0-9a-f:]{17})"),
                                       QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch m = re.match(text);
    return m.hasMatch() ? normalizeMac(m.captured(1)) : QString();
}

QString parseMacFromArpLine(const QString &text)
{
    static const QRegularExpression re(QStringLiteral("(([0-9a-f]{2}:){5}[0-9a-f]{2})"),
                                       QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch m = re.match(text);
    return m.hasMatch() ? normalizeMac(m.captured(1)) : QString();
}

QByteArray buildMagicPacket(const QString &mac, QString *error)
{
    QString hex = mac.trimmed();
    hex.remove(QLatin1Char(':'));
    hex.remove(QLatin1Char('-'));
    const QByteArray raw = QByteArray::fromHex(hex.toLatin1());
    if (hex.size() != 12 || raw.size() != 6) {
        if (error)
            *error = QStringLiteral("Invalid MAC address: %1").arg(mac);
        return {};
    }

    QByteArray packet(6, char(0xff));
    for (int i = 0; i < 16; ++i)
        packet.append(raw);
    if (error)
        error->clear();
    return packet;
}

SystemNetworkProbes::SystemNetworkProbes(HttpClient *http)
    : m_http(http)
{
}

SystemNetworkProbes::~SystemNetworkProbes()
{
    const QObjectList pending = m_scope.children();
    for (QObject *child : pending)
        QObject::disconnect(child, nullptr, nullptr, nullptr);
}

void SystemNetworkProbes::checkPort(const QString &ip, int port, int timeoutMs, std::function<void(bool)> done)
{
    auto *socket = new QTcpSocket(&m_scope);
    auto *timer = new QTimer(socket);
    timer->setSingleShot(true);
    auto finished = std::make_shared<bool>(false);

    auto finish = [socket, finished, done](bool ok) {
        if (*finished)
            return;
        *finished = true;
        socket->abort();
        socket->deleteLater();
        done(ok);
    };

    QObject::connect(socket, &QTcpSocket::connected, socket, [finish]() { finish(true); });
    QObject::connect(socket, &QTcpSocket::errorOccurred, socket, [finish](QAbstractSocket::SocketError) {
        finish(false);
    });
    QObject::connect(timer, &QTimer::timeout, socket, [finish]() { finish(false); });

    timer->start(timeoutMs);
    socket->connectToHost(ip, static_cast<quint16>(port));
}

void SystemNetworkProbes::fetchJson(const QString &url, int timeoutMs, std::function<void(const JsonFetch &)> done)
{
    m_http->get(QUrl(url), timeoutMs, [done](const HttpResult &result) {
        JsonFetch out;
        if (!result.ok) {
            out.error = result.error;
            done(out);
            return;
        }
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(result.payload, &parseError);
        if (!doc.isObject()) {
            out.error = parseError.error != QJsonParseError::NoError
                ? parseError.errorString()
                : QStringLiteral("Response is not a JSON object");
            done(out);
            return;
        }
        out.ok = true;
        out.body = doc.object();
        done(out);
    });
}

void SystemNetworkProbes::fetchText(const QString &url, int timeoutMs, std::function<void(const TextFetch &)> done)
{
    m_http->get(QUrl(url), timeoutMs, [done](const HttpResult &result) {
        TextFetch out;
        out.ok = result.ok;
        out.error = result.error;
        if (result.ok)
            out.body = result.payload;
        done(out);
    });
}

void SystemNetworkProbes::ping(const QString &ip, int timeoutMs, std::function<void(PingResult)> done)
{
    if (m_pingUnavailable) {
        done(PingResult::Unavailable);
        return;
    }

    const int waitSec = std::max(1, static_cast<int>(std::ceil(timeoutMs / 1000.0)));
    const QStringList args{ QStringLiteral("-c"), QStringLiteral("1"),
                            QStringLiteral("-W"), QString::number(waitSec), ip };
    runProcess(QStringLiteral("ping"), args, timeoutMs + 500, [this, done](const ProcessOutput &out) {
        if (!out.started) {
            qCDebug(tvLog) << "ping is not available, ICMP checks disabled";
            m_pingUnavailable = true;
            done(PingResult::Unavailable);
            return;
        }
        done(out.exitCode == 0 ? PingResult::Reachable : PingResult::Unreachable);
    });
}

void SystemNetworkProbes::macForIp(const QString &ip, std::function<void(const QString &)> done)
{
    if (ip.isEmpty()) {
        done(QString());
        return;
    }

    runProcess(QStringLiteral("ip"), { QStringLiteral("neigh"), QStringLiteral("show"), ip }, 2000,
               [this, ip, done](const ProcessOutput &out) {
        const QString mac = out.started ? parseMacFromNeighbourLine(QString::fromUtf8(out.stdOut)) : QString();
        if (!mac.isEmpty()) {
            done(mac);
            return;
        }
        runProcess(QStringLiteral("arp"), { QStringLiteral("-n"), ip }, 2000, [done](const ProcessOutput &arp) {
            done(arp.started ? parseMacFromArpLine(QString::fromUtf8(arp.stdOut)) : QString());
        });
    });
}

void SystemNetworkProbes::ipForMac(const QString &mac, std::function<void(const QString &)> done)
{
    const QString wanted = normalizeMac(mac);
    if (wanted.isEmpty()) {
        done(QString());
        return;
    }

    const std::int64_t now = QDateTime::currentMSecsSinceEpoch();
    if (m_ipByMacTs > 0 && now - m_ipByMacTs < kNeighbourCacheMs) {
        done(m_ipByMac.value(wanted));
        return;
    }

    refreshNeighbourTable([this, wanted, done]() { done(m_ipByMac.value(wanted)); });
}

void SystemNetworkProbes::refreshNeighbourTable(std::function<void()> done)
{
    runProcess(QStringLiteral("ip"), { QStringLiteral("neigh") }, 2000, [this, done](const ProcessOutput &out) {
        QHash<QString, QString> table;
        if (out.started)
            table = parseNeighbourTable(QString::fromUtf8(out.stdOut));
        if (!table.isEmpty()) {
            m_ipByMac = table;
            m_ipByMacTs = QDateTime::currentMSecsSinceEpoch();
            done();
            return;
        }
        runProcess(QStringLiteral("arp"), { QStringLiteral("-an") }, 2000, [this, done](const ProcessOutput &arp) {
            m_ipByMac = arp.started ? parseArpTable(QString::fromUtf8(arp.stdOut)) : QHash<QString, QString>();
            m_ipByMacTs = QDateTime::currentMSecsSinceEpoch();
            done();
        });
    });
}

bool SystemNetworkProbes::sendWakeOnLan(const QString &mac, QString *error)
{
    const QByteArray packet = buildMagicPacket(mac, error);
    if (packet.isEmpty())
        return false;

    QUdpSocket socket;
    const qint64 written = socket.writeDatagram(packet, QHostAddress::Broadcast, kWakeOnLanPort);
    if (written != packet.size()) {
        if (error)
            *error = socket.errorString();
        return false;
    }
    if (error)
        error->clear();
    return true;
}

QString SystemNetworkProbes::localAddressFor(const QString &targetIp)
{
    if (!targetIp.isEmpty()) {
        QUdpSocket socket;
        socket.connectToHost(QHostAddress(targetIp), 1900);
        if (socket.waitForConnected(500)) {
            const QHostAddress local = socket.localAddress();
            if (!local.isNull() && local.protocol() == QAbstractSocket::IPv4Protocol)
                return local.toString();
        }
    }

    const QList<QHostAddress> addresses = QNetworkInterface::allAddresses();
    for (const QHostAddress &address : addresses) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback())
            return address.toString();
    }
    return {};
}

void SystemNetworkProbes::runProcess(const QString &program,
                                     const QStringList &args,
                                     int timeoutMs,
                                     std::function<void(const ProcessOutput &)> done)
{
    auto *process = new QProcess(&m_scope);
    auto *timer = new QTimer(process);
    timer->setSingleShot(true);
    auto finished = std::make_shared<bool>(false);

    auto finish = [process, finished, done](const ProcessOutput &out) {
        if (*finished)
            return;
        *finished = true;
        process->deleteLater();
        done(out);
    };

    QObject::connect(process, &QProcess::errorOccurred, process, [finish](QProcess::ProcessError err) {
        // Crashes and kills are reported through finished().
        if (err != QProcess::FailedToStart)
            return;
        finish(ProcessOutput{});
    });
    QObject::connect(process, &QProcess::finished, process,
                     [process, finish](int exitCode, QProcess::ExitStatus status) {
        ProcessOutput out;
        out.started = true;
        out.exitCode = status == QProcess::NormalExit ? exitCode : -1;
        out.stdOut = process->readAllStandardOutput();
        finish(out);
    });
    QObject::connect(timer, &QTimer::timeout, process, [process]() {
        process->kill();
    });

    timer->start(timeoutMs);
    process->start(program, args);
}

} // namespace phicore::samsungtv::ipc

#include "tv_ssdp.h"

#include <memory>

#include <QHostAddress>
#include <QNetworkDatagram>
#include <QTimer>
#include <QUdpSocket>

#include "tv_log.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr quint16 kSsdpPort = 1900;

QString senderIp(const QHostAddress &address)
{
    bool ok = false;
    const quint32 v4 = address.toIPv4Address(&ok);
    return ok ? QHostAddress(v4).toString() : address.toString();
}

} // namespace

QByteArray buildMSearch(const QString &searchTarget)
{
    QByteArray out;
    out += "M-SEARCH * HTTP/1.1\r\n";
    out += "HOST: 239.255.255.250:1900\r\n";
    out += "MAN: \"ssdp:discover\"\r\n";
    out += "MX: 2\r\n";
    out += "ST: " + searchTarget.toUtf8() + "\r\n";
    out += "\r\n";
    return out;
}

QHash<QString, QString> parseSsdpHeaders(const QByteArray &datagram)
{
    QHash<QString, QString> headers;
    const QList<QByteArray> lines = datagram.split('\n');
    if (lines.isEmpty())
        return headers;

    const QByteArray status = lines.first().trimmed().toUpper();
    if (!status.startsWith("HTTP/") && !status.startsWith("NOTIFY"))
        return headers;

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int colon = line.indexOf(':');
        if (colon <= 0)
            continue;
        const QString key = QString::fromLatin1(line.left(colon)).trimmed().toLower();
        const QString value = QString::fromUtf8(line.mid(colon + 1)).trimmed();
        headers.insert(key, value);
    }
    return headers;
}

bool isSamsungResponse(const QHash<QString, QString> &headers)
{
    const QString haystack = headers.value(QStringLiteral("server")) + QLatin1Char(' ')
        + headers.value(QStringLiteral("st")) + QLatin1Char(' ')
        + headers.value(QStringLiteral("usn"));
    return haystack.contains(QLatin1String("samsung"), Qt::CaseInsensitive);
}

SsdpDiscovery::~SsdpDiscovery()
{
    const QObjectList pending = m_scope.children();
    for (QObject *child : pending)
        QObject::disconnect(child, nullptr, nullptr, nullptr);
}

QString SsdpDiscovery::name() const
{
    return QStringLiteral("ssdp");
}

void SsdpDiscovery::discover(int timeoutMs, std::function<void(const CandidateList &)> done)
{
    auto results = std::make_shared<CandidateList>();
    search(QString::fromLatin1(kSsdpAll), timeoutMs,
           [results](const QString &ip, const QHash<QString, QString> &headers) {
        if (!isSamsungResponse(headers))
            return false;

        DiscoveredCandidate candidate;
        candidate.ip = ip;
        candidate.usn = headers.value(QStringLiteral("usn"));
        candidate.location = headers.value(QStringLiteral("location"));
        candidate.st = headers.value(QStringLiteral("st"));
        candidate.server = headers.value(QStringLiteral("server"));
        candidate.sources.insert(QString::fromLatin1(kSourceSsdp));
        qCDebug(tvLog).noquote() << "SSDP response: ip=" << ip << "st=" << candidate.st << "usn=" << candidate.usn;
        results->append(candidate);
        return false;
    },
           [results, done]() { done(*results); });
}

void SsdpDiscovery::locate(const QString &ip,
                           const QString &searchTarget,
                           int timeoutMs,
                           std::function<void(const QString &)> done)
{
    auto location = std::make_shared<QString>();
    search(searchTarget.isEmpty() ? QString::fromLatin1(kSsdpAll) : searchTarget, timeoutMs,
           [ip, location](const QString &from, const QHash<QString, QString> &headers) {
        if (from != ip)
            return false;
        const QString value = headers.value(QStringLiteral("location"));
        if (value.isEmpty())
            return false;
        *location = value;
        return true;
    },
           [location, done]() { done(*location); });
}

void SsdpDiscovery::search(const QString &searchTarget,
                           int timeoutMs,
                           std::function<bool(const QString &, const QHash<QString, QString> &)> onResponse,
                           std::function<void()> onDone)
{
    auto *socket = new QUdpSocket(&m_scope);
    auto *timer = new QTimer(socket);
    timer->setSingleShot(true);
    auto finished = std::make_shared<bool>(false);

    auto finish = [socket, finished, onDone]() {
        if (*finished)
            return;
        *finished = true;
        socket->close();
        socket->deleteLater();
        onDone();
    };

    if (!socket->bind(QHostAddress(QHostAddress::AnyIPv4), 0)) {
        qCDebug(tvLog) << "SSDP bind failed:" << socket->errorString();
        finish();
        return;
    }

    QObject::connect(socket, &QUdpSocket::readyRead, socket, [socket, finished, onResponse, finish]() {
        while (socket->hasPendingDatagrams()) {
            const QNetworkDatagram datagram = socket->receiveDatagram();
            if (*finished)
                return;
            const QHash<QString, QString> headers = parseSsdpHeaders(datagram.data());
            if (headers.isEmpty())
                continue;
            if (onResponse(senderIp(datagram.senderAddress()), headers)) {
                finish();
                return;
            }
        }
    });
    QObject::connect(timer, &QTimer::timeout, socket, finish);

    const QByteArray message = buildMSearch(searchTarget);
    if (socket->writeDatagram(message, QHostAddress(QStringLiteral("239.255.255.250")), kSsdpPort) != message.size())
        qCDebug(tvLog) << "SSDP search send failed:" << socket->errorString();

    timer->start(timeoutMs);
}

} // namespace phicore::samsungtv::ipc

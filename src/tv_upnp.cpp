#include "tv_upnp.h"

#include <algorithm>

#include <QHostAddress>
#include <QPointer>
#include <QRegularExpression>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <QXmlStreamReader>

#include "tv_http.h"
#include "tv_identity.h"
#include "tv_log.h"
#include "tv_netprobe.h"
#include "tv_ssdp.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kSoapTimeoutMs = 1500;
constexpr int kGenaTimeoutMs = 3000;
constexpr int kLocateTimeoutMs = 1200;
constexpr int kDescriptionTimeoutMs = 1500;
constexpr std::int64_t kLocateThrottleMs = 300000;
constexpr std::int64_t kReuseMarginMs = 20000;
constexpr int kNotifyIdleMs = 5000;

QString resolveUrl(const QUrl &base, const QString &pathOrUrl)
{
    const QString trimmed = pathOrUrl.trimmed();
    if (trimmed.isEmpty())
        return {};
    const QUrl resolved = base.resolved(QUrl(trimmed));
    return resolved.isValid() ? resolved.toString() : QString();
}

void sendUnsubscribe(HttpClient *http, const QString &eventUrl, const QString &sid)
{
    HttpHeaders headers;
    headers.append({ QByteArrayLiteral("SID"), sid.toUtf8() });
    http->send(QByteArrayLiteral("UNSUBSCRIBE"), QUrl(eventUrl), headers, {}, kGenaTimeoutMs,
               [sid](const HttpResult &result) {
        if (!result.ok)
            qCDebug(tvLog).noquote() << "UPnP unsubscribe failed for sid" << sid << ":" << result.error;
    });
}

} // namespace

std::optional<UpnpDescription> parseUpnpDescription(const QByteArray &xml, const QUrl &baseUrl)
{
    QXmlStreamReader reader(xml);
    UpnpDescription out;
    bool sawDevice = false;
    bool inService = false;
    QString serviceType;
    QString controlUrl;
    QString eventUrl;

    auto setOnce = [](QString *target, const QString &value) {
        if (target->isEmpty())
            *target = value.trimmed();
    };

    while (!reader.atEnd()) {
        reader.readNext();
        if (reader.isStartElement()) {
            const QStringView name = reader.name();
            if (name == QLatin1String("device")) {
                sawDevice = true;
            } else if (name == QLatin1String("service")) {
                inService = true;
                serviceType.clear();
                controlUrl.clear();
                eventUrl.clear();
            } else if (inService && name == QLatin1String("serviceType")) {
                serviceType = reader.readElementText();
            } else if (inService && name == QLatin1String("controlURL")) {
                controlUrl = reader.readElementText();
            } else if (inService && name == QLatin1String("eventSubURL")) {
                eventUrl = reader.readElementText();
            } else if (name == QLatin1String("friendlyName")) {
                setOnce(&out.friendlyName, reader.readElementText());
            } else if (name == QLatin1String("manufacturer")) {
                setOnce(&out.manufacturer, reader.readElementText());
            } else if (name == QLatin1String("modelName")) {
                setOnce(&out.modelName, reader.readElementText());
            } else if (name == QLatin1String("UDN")) {
                setOnce(&out.udn, normalizeId(reader.readElementText()));
            }
        } else if (reader.isEndElement() && reader.name() == QLatin1String("service")) {
            inService = false;
            if (out.renderingControlUrl.isEmpty()
                && serviceType.contains(QLatin1String("RenderingControl"), Qt::CaseInsensitive)) {
                out.renderingControlUrl = resolveUrl(baseUrl, controlUrl);
                out.renderingControlEventUrl = resolveUrl(baseUrl, eventUrl);
            }
        }
    }

    if (reader.hasError() || !sawDevice)
        return std::nullopt;
    return out;
}

QString deriveRenderingControlEventUrl(const QString &controlUrl)
{
    QUrl url(controlUrl);
    if (!url.isValid())
        return {};
    QString path = url.path();
    if (!path.contains(QLatin1String("/upnp/control/")))
        return {};
    path.replace(QLatin1String("/upnp/control/"), QLatin1String("/upnp/event/"));
    url.setPath(path);
    return url.toString();
}

QString decodeXmlEntities(const QString &text)
{
    QString out = text;
    out.replace(QLatin1String("&lt;"), QLatin1String("<"));
    out.replace(QLatin1String("&gt;"), QLatin1String(">"));
    out.replace(QLatin1String("&quot;"), QLatin1String("\""));
    out.replace(QLatin1String("&apos;"), QLatin1String("'"));
    out.replace(QLatin1String("&amp;"), QLatin1String("&"));
    return out;
}

AudioValues parseLastChange(const QByteArray &body)
{
    static const QRegularExpression lastChangeRe(QStringLiteral("<LastChange>([\\s\\S]*?)</LastChange>"),
                                                 QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression volumeRe(
        QStringLiteral("<Volume[^>]*channel=[\"']Master[\"'][^>]*val=[\"'](\\d+)[\"']"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression muteRe(
        QStringLiteral("<Mute[^>]*channel=[\"']Master[\"'][^>]*val=[\"'](\\d+)[\"']"),
        QRegularExpression::CaseInsensitiveOption);

    AudioValues out;
    const QRegularExpressionMatch lastChange = lastChangeRe.match(QString::fromUtf8(body));
    if (!lastChange.hasMatch() || lastChange.captured(1).isEmpty())
        return out;

    const QString decoded = decodeXmlEntities(lastChange.captured(1));
    const QRegularExpressionMatch volume = volumeRe.match(decoded);
    if (volume.hasMatch()) {
        bool ok = false;
        const int value = volume.captured(1).toInt(&ok);
        if (ok)
            out.volume = std::clamp(value, 0, 100);
    }
    const QRegularExpressionMatch mute = muteRe.match(decoded);
    if (mute.hasMatch()) {
        bool ok = false;
        const int value = mute.captured(1).toInt(&ok);
        if (ok)
            out.muted = value != 0;
    }
    return out;
}

int parseTimeoutSeconds(const QString &header, int fallback)
{
    static const QRegularExpression re(QStringLiteral("Second-(\\d+)"), QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch m = re.match(header);
    if (!m.hasMatch())
        return fallback;
    bool ok = false;
    const int value = m.captured(1).toInt(&ok);
    return ok ? value : fallback;
}

int renewDelayMs(int timeoutSeconds)
{
    return std::max(30000, (timeoutSeconds * 8 / 10) * 1000);
}

QByteArray buildRenderingControlSoap(const QString &action)
{
    const QByteArray name = action.toUtf8();
    QByteArray out;
    out += "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    out += "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
           "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n";
    out += "  <s:Body>\n";
    out += "    <u:" + name + " xmlns:u=\"urn:schemas-upnp-org:service:RenderingControl:1\">\n";
    out += "      <InstanceID>0</InstanceID>\n";
    out += "      <Channel>Master</Channel>\n";
    out += "    </u:" + name + ">\n";
    out += "  </s:Body>\n";
    out += "</s:Envelope>";
    return out;
}

std::optional<int> parseSoapInteger(const QByteArray &body, const QString &tagName)
{
    const QRegularExpression re(QStringLiteral("<%1>([^<]+)</%1>").arg(QRegularExpression::escape(tagName)),
                                QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch m = re.match(QString::fromUtf8(body));
    if (!m.hasMatch())
        return std::nullopt;
    bool ok = false;
    const int value = m.captured(1).trimmed().toInt(&ok);
    if (!ok)
        return std::nullopt;
    return value;
}

RenderingControlClient::RenderingControlClient(HttpClient *http)
    : m_http(http)
{
}

void RenderingControlClient::readAudio(const QString &controlUrl, std::function<void(const AudioValues &)> done)
{
    struct Pending {
        int remaining = 2;
        AudioValues values;
    };
    auto pending = std::make_shared<Pending>();

    auto complete = [pending, done]() {
        if (--pending->remaining == 0)
            done(pending->values);
    };

    invoke(controlUrl, QStringLiteral("GetVolume"), QStringLiteral("CurrentVolume"),
           [pending, complete](std::optional<int> value) {
        if (value.has_value())
            pending->values.volume = std::clamp(*value, 0, 100);
        complete();
    });
    invoke(controlUrl, QStringLiteral("GetMute"), QStringLiteral("CurrentMute"),
           [pending, complete](std::optional<int> value) {
        if (value.has_value())
            pending->values.muted = *value != 0;
        complete();
    });
}

void RenderingControlClient::invoke(const QString &controlUrl,
                                    const QString &action,
                                    const QString &tagName,
                                    std::function<void(std::optional<int>)> done)
{
    HttpHeaders headers;
    headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("text/xml; charset=\"utf-8\"") });
    headers.append({ QByteArrayLiteral("SOAPACTION"),
                     QByteArrayLiteral("\"urn:schemas-upnp-org:service:RenderingControl:1#") + action.toUtf8() + '"' });

    m_http->send(QByteArrayLiteral("POST"), QUrl(controlUrl), headers, buildRenderingControlSoap(action),
                 kSoapTimeoutMs, [tagName, done](const HttpResult &result) {
        if (!result.ok) {
            done(std::nullopt);
            return;
        }
        done(parseSoapInteger(result.payload, tagName));
    });
}

RenderingControlLocator::RenderingControlLocator(LocateFn locate,
                                                 NetworkProbes *probes,
                                                 std::function<std::int64_t()> clock)
    : m_locate(std::move(locate))
    , m_probes(probes)
    , m_clock(std::move(clock))
{
}

void RenderingControlLocator::resolve(const QString &deviceId,
                                      const QString &ip,
                                      Urls known,
                                      const std::optional<Urls> &discovered,
                                      std::function<void(const Urls &)> done)
{
    if (!known.controlUrl.isEmpty() && known.eventUrl.isEmpty())
        known.eventUrl = deriveRenderingControlEventUrl(known.controlUrl);
    if (!known.controlUrl.isEmpty() && !known.eventUrl.isEmpty()) {
        done(known);
        return;
    }

    if (discovered.has_value()) {
        if (known.controlUrl.isEmpty())
            known.controlUrl = discovered->controlUrl;
        if (known.eventUrl.isEmpty())
            known.eventUrl = discovered->eventUrl;
        if (!known.controlUrl.isEmpty() && !known.eventUrl.isEmpty()) {
            done(known);
            return;
        }
    }

    const std::int64_t now = m_clock();
    const auto last = m_lastLookup.constFind(deviceId);
    if (ip.isEmpty() || !m_locate || (last != m_lastLookup.constEnd() && now - last.value() < kLocateThrottleMs)) {
        done(known);
        return;
    }
    m_lastLookup.insert(deviceId, now);

    QPointer<QObject> guard(&m_scope);
    locateStep(ip, 0, [this, guard, known, done](const QString &location) {
        if (!guard)
            return;
        if (location.isEmpty()) {
            done(known);
            return;
        }
        m_probes->fetchText(location, kDescriptionTimeoutMs, [known, location, done](const TextFetch &fetch) {
            Urls out = known;
            if (fetch.ok) {
                const auto desc = parseUpnpDescription(fetch.body, QUrl(location));
                if (desc.has_value()) {
                    if (!desc->renderingControlUrl.isEmpty())
                        out.controlUrl = desc->renderingControlUrl;
                    if (!desc->renderingControlEventUrl.isEmpty())
                        out.eventUrl = desc->renderingControlEventUrl;
                }
            }
            if (!out.controlUrl.isEmpty() && out.eventUrl.isEmpty())
                out.eventUrl = deriveRenderingControlEventUrl(out.controlUrl);
            done(out);
        });
    });
}

void RenderingControlLocator::forget(const QString &deviceId)
{
    m_lastLookup.remove(deviceId);
}

void RenderingControlLocator::locateStep(const QString &ip, int index, std::function<void(const QString &)> done)
{
    static const char *const targets[] = { kRenderingControlSt, kMediaRendererSt, kSsdpAll };
    constexpr int count = sizeof(targets) / sizeof(targets[0]);
    if (index >= count) {
        done(QString());
        return;
    }
    QPointer<QObject> guard(&m_scope);
    m_locate(ip, QString::fromLatin1(targets[index]), kLocateTimeoutMs,
             [this, guard, ip, index, done](const QString &location) {
        if (!guard)
            return;
        if (!location.isEmpty()) {
            done(location);
            return;
        }
        locateStep(ip, index + 1, done);
    });
}

std::optional<HttpRequestHead> parseHttpRequestHead(const QByteArray &buffer)
{
    const int end = buffer.indexOf("\r\n\r\n");
    if (end < 0)
        return std::nullopt;

    HttpRequestHead head;
    head.headerLength = end + 4;
    const QList<QByteArray> lines = buffer.left(end).split('\n');
    if (lines.isEmpty())
        return std::nullopt;
    head.method = lines.first().trimmed().split(' ').value(0).toUpper();
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int colon = line.indexOf(':');
        if (colon <= 0)
            continue;
        head.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
    }
    head.contentLength = std::max(0, head.headers.value("content-length").toInt());
    return head;
}

NotifyServer::NotifyServer(Handler handler)
    : m_handler(std::move(handler))
{
}

NotifyServer::~NotifyServer()
{
    close();
}

bool NotifyServer::listen(QString *error)
{
    if (m_server && m_server->isListening())
        return true;

    m_server = std::make_unique<QTcpServer>();
    if (!m_server->listen(QHostAddress::AnyIPv4, 0)) {
        if (error)
            *error = m_server->errorString();
        m_server.reset();
        return false;
    }
    QObject::connect(m_server.get(), &QTcpServer::newConnection, m_server.get(), [this]() { acceptPending(); });
    qCDebug(tvLog) << "UPnP notify server listening on port" << m_server->serverPort();
    return true;
}

void NotifyServer::close()
{
    if (!m_server)
        return;
    const QList<QTcpSocket *> sockets = m_server->findChildren<QTcpSocket *>();
    for (QTcpSocket *socket : sockets)
        QObject::disconnect(socket, nullptr, nullptr, nullptr);
    m_server->close();
    m_server.reset();
}

bool NotifyServer::isListening() const
{
    return m_server && m_server->isListening();
}

quint16 NotifyServer::port() const
{
    return m_server ? m_server->serverPort() : 0;
}

void NotifyServer::acceptPending()
{
    while (QTcpSocket *socket = m_server->nextPendingConnection()) {
        auto buffer = std::make_shared<QByteArray>();
        QPointer<QTcpSocket> guard(socket);

        QTimer::singleShot(kNotifyIdleMs, socket, [guard]() {
            if (guard)
                guard->abort();
        });
        QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket, buffer]() {
            buffer->append(socket->readAll());
            const auto head = parseHttpRequestHead(*buffer);
            if (!head.has_value())
                return;
            if (buffer->size() < head->headerLength + head->contentLength)
                return;

            const QByteArray body = buffer->mid(head->headerLength, head->contentLength);
            socket->write("HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
            socket->disconnectFromHost();

            if (head->method == "NOTIFY") {
                const QString sid = QString::fromLatin1(head->headers.value("sid")).trimmed();
                if (!sid.isEmpty() && m_handler)
                    m_handler(sid, body);
            }
        });
    }
}

UpnpSubscriptionManager::UpnpSubscriptionManager(HttpClient *http,
                                                 NetworkProbes *probes,
                                                 std::function<std::int64_t()> clock,
                                                 NotifyCallback onNotify)
    : m_http(http)
    , m_probes(probes)
    , m_clock(std::move(clock))
    , m_onNotify(std::move(onNotify))
{
}

UpnpSubscriptionManager::~UpnpSubscriptionManager() = default;

void UpnpSubscriptionManager::ensure(const QString &deviceId, const QString &eventUrl, const QString &targetIp)
{
    if (deviceId.isEmpty() || eventUrl.isEmpty() || m_pending.contains(deviceId))
        return;

    if (!m_server)
        m_server = std::make_unique<NotifyServer>([this](const QString &sid, const QByteArray &body) {
            handleNotify(sid, body);
        });
    QString error;
    if (!m_server->listen(&error)) {
        qCDebug(tvLog) << "UPnP notify server unavailable:" << error;
        return;
    }

    const auto it = m_byDevice.constFind(deviceId);
    if (it != m_byDevice.constEnd()) {
        if (!it->sid.isEmpty() && it->eventUrl == eventUrl && m_clock() < it->expiresAt - kReuseMarginMs)
            return;
        drop(deviceId);
    }

    const QString localIp = m_probes->localAddressFor(targetIp);
    if (localIp.isEmpty())
        return;
    const QString callbackUrl = QStringLiteral("http://%1:%2/upnp-notify").arg(localIp).arg(m_server->port());
    subscribe(deviceId, eventUrl, callbackUrl);
}

void UpnpSubscriptionManager::subscribe(const QString &deviceId, const QString &eventUrl, const QString &callbackUrl)
{
    HttpHeaders headers;
    headers.append({ QByteArrayLiteral("CALLBACK"), QByteArrayLiteral("<") + callbackUrl.toUtf8() + '>' });
    headers.append({ QByteArrayLiteral("NT"), QByteArrayLiteral("upnp:event") });
    headers.append({ QByteArrayLiteral("TIMEOUT"), QByteArrayLiteral("Second-300") });

    const quint64 request = ++m_nextRequest;
    m_pending.insert(deviceId, request);
    HttpClient *http = m_http;
    QPointer<QObject> guard(&m_scope);
    m_http->send(QByteArrayLiteral("SUBSCRIBE"), QUrl(eventUrl), headers, {}, kGenaTimeoutMs,
                 [this, guard, http, request, deviceId, eventUrl](const HttpResult &result) {
        const QString sid = QString::fromLatin1(result.headers.value("sid")).trimmed();
        if (!guard || m_pending.value(deviceId) != request) {
            // Dropped while in flight; release whatever the TV granted.
            if (result.ok && !sid.isEmpty())
                sendUnsubscribe(http, eventUrl, sid);
            return;
        }
        m_pending.remove(deviceId);
        if (!result.ok || sid.isEmpty()) {
            qCDebug(tvLog).noquote() << "UPnP subscribe failed for" << deviceId << ":"
                                     << (result.error.isEmpty() ? QStringLiteral("no SID") : result.error);
            return;
        }

        const int timeoutSec = parseTimeoutSeconds(QString::fromLatin1(result.headers.value("timeout")), 300);
        Subscription sub;
        sub.sid = sid;
        sub.eventUrl = eventUrl;
        sub.expiresAt = m_clock() + std::int64_t(timeoutSec) * 1000;
        m_byDevice.insert(deviceId, sub);
        m_deviceBySid.insert(sid, deviceId);
        scheduleRenew(deviceId, timeoutSec);
        qCDebug(tvLog).noquote() << "UPnP subscribed for" << deviceId << "sid=" << sid << "timeout=" << timeoutSec << "s";
    });
}

void UpnpSubscriptionManager::scheduleRenew(const QString &deviceId, int timeoutSec)
{
    auto it = m_byDevice.find(deviceId);
    if (it == m_byDevice.end())
        return;
    if (!it->renewTimer) {
        it->renewTimer = new QTimer(&m_scope);
        it->renewTimer->setSingleShot(true);
        QObject::connect(it->renewTimer, &QTimer::timeout, it->renewTimer, [this, deviceId]() { renew(deviceId); });
    }
    it->renewTimer->start(renewDelayMs(timeoutSec));
}

void UpnpSubscriptionManager::renew(const QString &deviceId)
{
    const auto it = m_byDevice.constFind(deviceId);
    if (it == m_byDevice.constEnd() || it->sid.isEmpty())
        return;

    HttpHeaders headers;
    headers.append({ QByteArrayLiteral("SID"), it->sid.toUtf8() });
    headers.append({ QByteArrayLiteral("TIMEOUT"), QByteArrayLiteral("Second-300") });
    const QString sid = it->sid;

    QPointer<QObject> guard(&m_scope);
    m_http->send(QByteArrayLiteral("SUBSCRIBE"), QUrl(it->eventUrl), headers, {}, kGenaTimeoutMs,
                 [this, guard, deviceId, sid](const HttpResult &result) {
        if (!guard)
            return;
        auto current = m_byDevice.find(deviceId);
        if (current == m_byDevice.end() || current->sid != sid)
            return;
        if (!result.ok) {
            qCDebug(tvLog).noquote() << "UPnP renew failed for" << deviceId << ":" << result.error;
            drop(deviceId);
            return;
        }
        const int timeoutSec = parseTimeoutSeconds(QString::fromLatin1(result.headers.value("timeout")), 300);
        current->expiresAt = m_clock() + std::int64_t(timeoutSec) * 1000;
        scheduleRenew(deviceId, timeoutSec);
        qCDebug(tvLog).noquote() << "UPnP renewed for" << deviceId << "sid=" << sid << "timeout=" << timeoutSec << "s";
    });
}

void UpnpSubscriptionManager::drop(const QString &deviceId)
{
    m_pending.remove(deviceId);
    auto it = m_byDevice.find(deviceId);
    if (it == m_byDevice.end())
        return;
    const Subscription sub = it.value();
    m_byDevice.erase(it);

    if (sub.renewTimer) {
        sub.renewTimer->stop();
        sub.renewTimer->deleteLater();
    }
    if (!sub.sid.isEmpty()) {
        m_deviceBySid.remove(sub.sid);
        if (!sub.eventUrl.isEmpty())
            sendUnsubscribe(m_http, sub.eventUrl, sub.sid);
    }
}

void UpnpSubscriptionManager::dropAll()
{
    const QStringList ids = m_byDevice.keys();
    for (const QString &id : ids)
        drop(id);
    m_deviceBySid.clear();
    m_pending.clear();
}

void UpnpSubscriptionManager::shutdown()
{
    dropAll();
    if (m_server)
        m_server->close();
}

bool UpnpSubscriptionManager::hasSubscription(const QString &deviceId) const
{
    return m_byDevice.contains(deviceId);
}

QString UpnpSubscriptionManager::sidFor(const QString &deviceId) const
{
    return m_byDevice.value(deviceId).sid;
}

int UpnpSubscriptionManager::renewIntervalMs(const QString &deviceId) const
{
    const auto it = m_byDevice.constFind(deviceId);
    if (it == m_byDevice.constEnd() || !it->renewTimer || !it->renewTimer->isActive())
        return -1;
    return it->renewTimer->interval();
}

quint16 UpnpSubscriptionManager::notifyPort() const
{
    return m_server ? m_server->port() : 0;
}

void UpnpSubscriptionManager::handleNotify(const QString &sid, const QByteArray &body)
{
    const QString deviceId = m_deviceBySid.value(sid);
    if (deviceId.isEmpty())
        return;
    if (m_onNotify)
        m_onNotify(deviceId, parseLastChange(body));
}

} // namespace phicore::samsungtv::ipc

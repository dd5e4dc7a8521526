#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>
#include <QUrl>

class QTcpServer;
class QTimer;

namespace phicore::samsungtv::ipc {

class HttpClient;
class NetworkProbes;

struct UpnpDescription {
    QString friendlyName;
    QString manufacturer;
    QString modelName;
    QString udn;
    QString renderingControlUrl;
    QString renderingControlEventUrl;
};

struct AudioValues {
    std::optional<int> volume;
    std::optional<bool> muted;
};

// Parses a UPnP device description; URLs are resolved against baseUrl.
std::optional<UpnpDescription> parseUpnpDescription(const QByteArray &xml, const QUrl &baseUrl);
// ".../upnp/control/..." -> ".../upnp/event/...", or empty.
QString deriveRenderingControlEventUrl(const QString &controlUrl);

QString decodeXmlEntities(const QString &text);
// Master channel Volume/Mute from a NOTIFY body carrying <LastChange>.
AudioValues parseLastChange(const QByteArray &body);

// "Second-N" -> N.
int parseTimeoutSeconds(const QString &header, int fallback = 300);
int renewDelayMs(int timeoutSeconds);

QByteArray buildRenderingControlSoap(const QString &action);
std::optional<int> parseSoapInteger(const QByteArray &body, const QString &tagName);

// GetVolume/GetMute against a RenderingControl control URL.
class RenderingControlClient
{
public:
    explicit RenderingControlClient(HttpClient *http);

    void readAudio(const QString &controlUrl, std::function<void(const AudioValues &)> done);

private:
    void invoke(const QString &controlUrl,
                const QString &action,
                const QString &tagName,
                std::function<void(std::optional<int>)> done);

    HttpClient *m_http = nullptr;
};

// Resolves RenderingControl URLs from the device, the discovery cache, or a
// targeted SSDP search with a description fetch (throttled per device).
class RenderingControlLocator
{
public:
    struct Urls {
        QString controlUrl;
        QString eventUrl;
    };

    using LocateFn = std::function<void(const QString &ip,
                                        const QString &searchTarget,
                                        int timeoutMs,
                                        std::function<void(const QString &)> done)>;

    RenderingControlLocator(LocateFn locate, NetworkProbes *probes, std::function<std::int64_t()> clock);

    void resolve(const QString &deviceId,
                 const QString &ip,
                 Urls known,
                 const std::optional<Urls> &discovered,
                 std::function<void(const Urls &)> done);

    void forget(const QString &deviceId);

private:
    void locateStep(const QString &ip,
                    int index,
                    std::function<void(const QString &)> done);

    LocateFn m_locate;
    NetworkProbes *m_probes = nullptr;
    std::function<std::int64_t()> m_clock;
    QHash<QString, std::int64_t> m_lastLookup;
    QObject m_scope;
};

// Shared listener for GENA NOTIFY callbacks.
class NotifyServer
{
public:
    using Handler = std::function<void(const QString &sid, const QByteArray &body)>;

    explicit NotifyServer(Handler handler);
    ~NotifyServer();

    bool listen(QString *error = nullptr);
    void close();
    bool isListening() const;
    quint16 port() const;

private:
    void acceptPending();

    Handler m_handler;
    std::unique_ptr<QTcpServer> m_server;
};

struct HttpRequestHead {
    QByteArray method;
    QHash<QByteArray, QByteArray> headers;
    int headerLength = 0;
    int contentLength = 0;
};

// Parses request line and headers once "\r\n\r\n" has arrived.
std::optional<HttpRequestHead> parseHttpRequestHead(const QByteArray &buffer);

class UpnpSubscriptionManager
{
public:
    using NotifyCallback = std::function<void(const QString &deviceId, const AudioValues &values)>;

    UpnpSubscriptionManager(HttpClient *http,
                            NetworkProbes *probes,
                            std::function<std::int64_t()> clock,
                            NotifyCallback onNotify);
    ~UpnpSubscriptionManager();

    // Keeps one subscription per device; an existing one for the same URL
    // with more than 20 s left is reused.
    void ensure(const QString &deviceId, const QString &eventUrl, const QString &targetIp);
    // Re-subscribes with the current SID; a failed renewal drops the device.
    void renew(const QString &deviceId);
    // Also abandons a SUBSCRIBE still in flight for the device.
    void drop(const QString &deviceId);
    void dropAll();
    void shutdown();

    bool hasSubscription(const QString &deviceId) const;
    bool isSubscribing(const QString &deviceId) const { return m_pending.contains(deviceId); }
    QString sidFor(const QString &deviceId) const;
    // Milliseconds until the next renewal, or -1.
    int renewIntervalMs(const QString &deviceId) const;
    quint16 notifyPort() const;

    void handleNotify(const QString &sid, const QByteArray &body);

private:
    struct Subscription {
        QString sid;
        QString eventUrl;
        std::int64_t expiresAt = 0;
        QTimer *renewTimer = nullptr;
    };

    void subscribe(const QString &deviceId, const QString &eventUrl, const QString &callbackUrl);
    void scheduleRenew(const QString &deviceId, int timeoutSec);

    HttpClient *m_http = nullptr;
    NetworkProbes *m_probes = nullptr;
    std::function<std::int64_t()> m_clock;
    NotifyCallback m_onNotify;
    std::unique_ptr<NotifyServer> m_server;
    QHash<QString, Subscription> m_byDevice;
    QHash<QString, QString> m_deviceBySid;
    // In-flight SUBSCRIBE per device, keyed to the request that owns it.
    QHash<QString, quint64> m_pending;
    quint64 m_nextRequest = 0;
    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc

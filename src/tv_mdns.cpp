#include "tv_mdns.h"

#include <memory>
#include <vector>

#include <QHash>
#include <QTimer>

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/simple-watch.h>
#include <avahi-common/strlst.h>

#include "tv_log.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kPumpIntervalMs = 50;

QString txtValue(AvahiStringList *txt, const char *key)
{
    AvahiStringList *entry = avahi_string_list_find(txt, key);
    if (!entry)
        return {};
    char *name = nullptr;
    char *value = nullptr;
    if (avahi_string_list_get_pair(entry, &name, &value, nullptr) != 0)
        return {};
    const QString out = value ? QString::fromUtf8(value) : QString();
    avahi_free(name);
    avahi_free(value);
    return out;
}

} // namespace

struct MdnsDiscovery::BrowseContext {
    struct Browser {
        BrowseContext *context = nullptr;
        MdnsServiceType type;
    };

    AvahiSimplePoll *poll = nullptr;
    AvahiClient *client = nullptr;
    std::vector<std::unique_ptr<Browser>> browsers;
    QList<MdnsServiceType> services;
    QList<QString> order;
    QHash<QString, DiscoveredCandidate> byIp;

    ~BrowseContext()
    {
        // Frees browsers and resolvers owned by the client as well.
        if (client)
            avahi_client_free(client);
        if (poll)
            avahi_simple_poll_free(poll);
    }

    void add(const QString &ip, const QString &name)
    {
        if (!byIp.contains(ip))
            order.append(ip);
        DiscoveredCandidate candidate;
        candidate.ip = ip;
        candidate.name = name;
        candidate.sources.insert(QString::fromLatin1(kSourceMdns));
        byIp.insert(ip, candidate);
    }

    CandidateList results() const
    {
        CandidateList out;
        for (const QString &ip : order)
            out.append(byIp.value(ip));
        return out;
    }
};

namespace {

using BrowseContext = MdnsDiscovery::BrowseContext;

void resolveCallback(AvahiServiceResolver *resolver,
                     AvahiIfIndex,
                     AvahiProtocol,
                     AvahiResolverEvent event,
                     const char *name,
                     const char *,
                     const char *,
                     const char *,
                     const AvahiAddress *address,
                     uint16_t,
                     AvahiStringList *txt,
                     AvahiLookupResultFlags,
                     void *userdata)
{
    auto *browser = static_cast<BrowseContext::Browser *>(userdata);
    if (event == AVAHI_RESOLVER_FOUND && address && address->proto == AVAHI_PROTO_INET) {
        const QString serviceName = QString::fromUtf8(name ? name : "");
        QString manufacturer = txtValue(txt, "manufacturer");
        if (manufacturer.isEmpty())
            manufacturer = txtValue(txt, "mf");

        if (isSamsungService(serviceName, manufacturer, browser->type.configured)) {
            char text[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(text, sizeof(text), address);
            const QString ip = QString::fromLatin1(text);
            qCDebug(tvLog).noquote() << "mDNS service:" << browser->type.browseType << "name=" << serviceName
                                     << "ip=" << ip << "manufacturer=" << manufacturer;
            browser->context->add(ip, serviceName);
        }
    }
    avahi_service_resolver_free(resolver);
}

void browseCallback(AvahiServiceBrowser *,
                    AvahiIfIndex interface,
                    AvahiProtocol protocol,
                    AvahiBrowserEvent event,
                    const char *name,
                    const char *type,
                    const char *domain,
                    AvahiLookupResultFlags,
                    void *userdata)
{
    auto *browser = static_cast<BrowseContext::Browser *>(userdata);
    switch (event) {
    case AVAHI_BROWSER_NEW:
        if (!avahi_service_resolver_new(browser->context->client,
                                        interface,
                                        protocol,
                                        name,
                                        type,
                                        domain,
                                        AVAHI_PROTO_INET,
                                        static_cast<AvahiLookupFlags>(0),
                                        resolveCallback,
                                        browser)) {
            qCDebug(tvLog) << "mDNS resolver failed:" << avahi_strerror(avahi_client_errno(browser->context->client));
        }
        break;
    case AVAHI_BROWSER_FAILURE:
        qCDebug(tvLog) << "mDNS browser failure:" << avahi_strerror(avahi_client_errno(browser->context->client));
        break;
    case AVAHI_BROWSER_REMOVE:
    case AVAHI_BROWSER_ALL_FOR_NOW:
    case AVAHI_BROWSER_CACHE_EXHAUSTED:
        break;
    }
}

void clientCallback(AvahiClient *client, AvahiClientState state, void *userdata)
{
    auto *context = static_cast<BrowseContext *>(userdata);
    if (state == AVAHI_CLIENT_FAILURE) {
        qCDebug(tvLog) << "Avahi client failure:" << avahi_strerror(avahi_client_errno(client));
        return;
    }
    if (state != AVAHI_CLIENT_S_RUNNING || !context->browsers.empty())
        return;

    for (const MdnsServiceType &service : std::as_const(context->services)) {
        auto browser = std::make_unique<BrowseContext::Browser>();
        browser->context = context;
        browser->type = service;
        const QByteArray type = service.browseType.toUtf8();
        if (!avahi_service_browser_new(client,
                                       AVAHI_IF_UNSPEC,
                                       AVAHI_PROTO_INET,
                                       type.constData(),
                                       nullptr,
                                       static_cast<AvahiLookupFlags>(0),
                                       browseCallback,
                                       browser.get())) {
            qCDebug(tvLog) << "mDNS browser for" << service.browseType
                           << "failed:" << avahi_strerror(avahi_client_errno(client));
            continue;
        }
        context->browsers.push_back(std::move(browser));
    }
}

} // namespace

QList<MdnsServiceType> parseMdnsServices(const QString &config)
{
    QList<MdnsServiceType> out;
    const QStringList parts = config.split(QLatin1Char(','));
    for (const QString &part : parts) {
        QString configured = part.trimmed();
        if (configured.startsWith(QLatin1Char('_')))
            configured.remove(0, 1);
        if (configured.isEmpty())
            continue;
        const QString type = configured.section(QLatin1Char('.'), 0, 0);
        if (type.isEmpty())
            continue;
        out.append({ QStringLiteral("_%1._tcp").arg(type), configured });
    }
    return out;
}

bool isSamsungService(const QString &serviceName, const QString &manufacturer, const QString &configuredType)
{
    const QLatin1String needle("samsung");
    return serviceName.contains(needle, Qt::CaseInsensitive)
        || manufacturer.contains(needle, Qt::CaseInsensitive)
        || configuredType.contains(needle, Qt::CaseInsensitive);
}

MdnsDiscovery::MdnsDiscovery(const QString &services)
    : m_services(parseMdnsServices(services))
{
}

MdnsDiscovery::~MdnsDiscovery()
{
    const QObjectList pending = m_scope.children();
    for (QObject *child : pending)
        QObject::disconnect(child, nullptr, nullptr, nullptr);
}

QString MdnsDiscovery::name() const
{
    return QStringLiteral("mdns");
}

void MdnsDiscovery::discover(int timeoutMs, std::function<void(const CandidateList &)> done)
{
    if (m_services.isEmpty()) {
        done({});
        return;
    }

    auto context = std::make_shared<BrowseContext>();
    context->services = m_services;
    context->poll = avahi_simple_poll_new();
    if (!context->poll) {
        qCDebug(tvLog) << "Avahi poll allocation failed";
        done({});
        return;
    }

    int error = 0;
    context->client = avahi_client_new(avahi_simple_poll_get(context->poll),
                                       static_cast<AvahiClientFlags>(0),
                                       clientCallback,
                                       context.get(),
                                       &error);
    if (!context->client) {
        qCDebug(tvLog) << "Avahi client unavailable:" << avahi_strerror(error);
        done({});
        return;
    }

    auto *pump = new QTimer(&m_scope);
    pump->setInterval(kPumpIntervalMs);
    QObject::connect(pump, &QTimer::timeout, pump, [context]() {
        avahi_simple_poll_iterate(context->poll, 0);
    });

    QTimer::singleShot(timeoutMs, pump, [pump, context, done]() {
        pump->stop();
        const CandidateList results = context->results();
        pump->deleteLater();
        done(results);
    });

    pump->start();
}

} // namespace phicore::samsungtv::ipc

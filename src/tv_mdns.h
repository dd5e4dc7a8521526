#pragma once

#include <functional>

#include <QObject>
#include <QString>
#include <QStringList>

#include "tv_discovery.h"

namespace phicore::samsungtv::ipc {

struct MdnsServiceType {
    // Avahi browse type, e.g. "_samsungmsf._tcp".
    QString browseType;
    // Configured text with the leading '_' stripped, used by the vendor filter.
    QString configured;
};

// Parses the comma-separated service list; "_samsungmsf._tcp",
// "samsungmsf" and "_samsungmsf" all browse "_samsungmsf._tcp".
QList<MdnsServiceType> parseMdnsServices(const QString &config);

bool isSamsungService(const QString &serviceName, const QString &manufacturer, const QString &configuredType);

// mDNS browse through the Avahi daemon. Without a daemon every scan returns
// an empty batch.
class MdnsDiscovery final : public DiscoveryTransport
{
public:
    explicit MdnsDiscovery(const QString &services);
    ~MdnsDiscovery() override;

    QString name() const override;
    void discover(int timeoutMs, std::function<void(const CandidateList &)> done) override;

    struct BrowseContext;

private:
    QList<MdnsServiceType> m_services;
    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc

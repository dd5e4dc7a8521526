#pragma once

#include <functional>

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>

#include "tv_discovery.h"

namespace phicore::samsungtv::ipc {

inline constexpr const char kSsdpAll[] = "ssdp:all";
inline constexpr const char kRenderingControlSt[] = "urn:schemas-upnp-org:service:RenderingControl:1";
inline constexpr const char kMediaRendererSt[] = "urn:schemas-upnp-org:device:MediaRenderer:1";

QByteArray buildMSearch(const QString &searchTarget);
// Header names are lower-cased. Returns an empty hash for non-HTTP datagrams.
QHash<QString, QString> parseSsdpHeaders(const QByteArray &datagram);
bool isSamsungResponse(const QHash<QString, QString> &headers);

class SsdpDiscovery final : public DiscoveryTransport
{
public:
    ~SsdpDiscovery() override;

    QString name() const override;
    void discover(int timeoutMs, std::function<void(const CandidateList &)> done) override;

    // First LOCATION answered by the given IP for the search target, or empty.
    void locate(const QString &ip,
                const QString &searchTarget,
                int timeoutMs,
                std::function<void(const QString &)> done);

private:
    // onResponse returns true to stop listening early.
    void search(const QString &searchTarget,
                       int timeoutMs,
                       std::function<bool(const QString &, const QHash<QString, QString> &)> onResponse,
                       std::function<void()> onDone);

    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc

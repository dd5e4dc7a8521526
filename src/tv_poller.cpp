#include "tv_poller.h"

#include <QPointer>

#include "tv_adapter.h"
#include "tv_classifier.h"
#include "tv_discovery.h"
#include "tv_identity.h"
#include "tv_log.h"
#include "tv_netprobe.h"
#include "tv_telemetry.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kPingTimeoutMs = 1200;
constexpr int kShortPortTimeoutMs = 1000;
constexpr int kLegacyPortTimeoutMs = 1500;

} // namespace

StatusPoller::StatusPoller(NetworkProbes *probes,
                           ProtocolAdapter *tizen,
                           ProtocolAdapter *hj,
                           RenderingControlLocator *locator,
                           RenderingControlClient *rendering,
                           DiscoveryAggregator *discovery)
    : m_probes(probes)
    , m_tizen(tizen)
    , m_hj(hj)
    , m_locator(locator)
    , m_rendering(rendering)
    , m_discovery(discovery)
{
}

void StatusPoller::check(const Device &device, Callback done)
{
    auto run = std::make_shared<Run>();
    run->device = device;
    run->done = std::move(done);

    if (!device.ip.isEmpty()) {
        checkWithIp(run);
        return;
    }
    if (device.mac.isEmpty()) {
        run->done(run->report);
        return;
    }
    run->ipRetried = true;
    QPointer<QObject> guard(&m_scope);
    m_probes->ipForMac(device.mac, [this, guard, run](const QString &ip) {
        if (!guard)
            return;
        if (ip.isEmpty()) {
            run->done(run->report);
            return;
        }
        qCDebug(tvLog) << "Resolved IP" << ip << "from MAC for" << run->device.name;
        run->device.ip = ip;
        run->report.refreshedIp = ip;
        checkWithIp(run);
    });
}

void StatusPoller::checkWithIp(const std::shared_ptr<Run> &run)
{
    switch (run->device.api) {
    case ApiKind::Tizen:
        checkTizen(run);
        return;
    case ApiKind::Hj:
        checkHj(run);
        return;
    case ApiKind::Legacy:
        checkLegacy(run);
        return;
    case ApiKind::Unknown:
        checkGeneric(run);
        return;
    }
}

void StatusPoller::checkTizen(const std::shared_ptr<Run> &run)
{
    if (!m_tizen) {
        checkGeneric(run);
        return;
    }
    QPointer<QObject> guard(&m_scope);
    m_tizen->queryInfo(run->device, [this, guard, run](const InfoResult &result) {
        if (!guard)
            return;
        if (!result.ok) {
            checkGeneric(run);
            return;
        }
        DeviceStatus &status = run->report.status;
        applyAudioFromInfo(&status, result.info);
        status.reportedMac = extractTizenInfo(result.info).mac;
        online(run, interpretPowerState(extractPowerState(result.info)).value_or(true));
    });
}

void StatusPoller::checkHj(const std::shared_ptr<Run> &run)
{
    const QString ip = run->device.ip;
    QPointer<QObject> guard(&m_scope);
    auto fallback = [this, guard, run, ip]() {
        m_probes->ping(ip, kPingTimeoutMs, [this, guard, run, ip](PingResult ping) {
            if (!guard)
                return;
            if (ping == PingResult::Reachable) {
                online(run, false);
                return;
            }
            m_probes->checkPort(ip, 8000, kShortPortTimeoutMs, [this, guard, run](bool open) {
                if (!guard)
                    return;
                if (open)
                    online(run, false);
                else
                    checkGeneric(run);
            });
        });
    };
    if (!m_hj) {
        fallback();
        return;
    }
    m_hj->queryInfo(run->device, [this, guard, run, fallback](const InfoResult &result) {
        if (!guard)
            return;
        if (!result.ok) {
            fallback();
            return;
        }
        applyAudioFromInfo(&run->report.status, result.info);
        online(run, interpretPowerState(extractPowerState(result.info)).value_or(true));
    });
}

void StatusPoller::checkLegacy(const std::shared_ptr<Run> &run)
{
    QPointer<QObject> guard(&m_scope);
    m_probes->checkPort(run->device.ip, 55000, kLegacyPortTimeoutMs, [this, guard, run](bool open) {
        if (!guard)
            return;
        if (open)
            online(run, true);
        else
            checkGeneric(run);
    });
}

void StatusPoller::checkGeneric(const std::shared_ptr<Run> &run)
{
    QPointer<QObject> guard(&m_scope);
    m_probes->checkPort(run->device.ip, 8001, kShortPortTimeoutMs, [this, guard, run](bool open) {
        if (!guard)
            return;
        if (open)
            online(run, true);
        else
            offline(run);
    });
}

void StatusPoller::offline(const std::shared_ptr<Run> &run)
{
    run->report.status = DeviceStatus();
    if (run->ipRetried || run->device.mac.isEmpty()) {
        run->done(run->report);
        return;
    }
    run->ipRetried = true;
    QPointer<QObject> guard(&m_scope);
    m_probes->ipForMac(run->device.mac, [this, guard, run](const QString &ip) {
        if (!guard)
            return;
        if (ip.isEmpty() || ip == run->device.ip) {
            run->done(run->report);
            return;
        }
        qCDebug(tvLog) << "IP of" << run->device.name << "changed from" << run->device.ip << "to" << ip;
        run->device.ip = ip;
        run->report.refreshedIp = ip;
        checkWithIp(run);
    });
}

void StatusPoller::online(const std::shared_ptr<Run> &run, bool power)
{
    run->report.status.online = true;
    run->report.status.power = power;
    enrichAudio(run);
}

void StatusPoller::enrichAudio(const std::shared_ptr<Run> &run)
{
    const DeviceStatus &status = run->report.status;
    if (!status.online || (status.volume.has_value() && status.muted.has_value())) {
        run->done(run->report);
        return;
    }

    const Device &device = run->device;
    RenderingControlLocator::Urls known { device.renderingControlUrl, device.renderingControlEventUrl };
    std::optional<RenderingControlLocator::Urls> discovered;
    if (m_discovery) {
        const auto candidate = m_discovery->discoveredForIp(device.ip);
        if (candidate.has_value()) {
            discovered = RenderingControlLocator::Urls { candidate->renderingControlUrl,
                                                         candidate->renderingControlEventUrl };
        }
    }

    QPointer<QObject> guard(&m_scope);
    m_locator->resolve(device.id, device.ip, known, discovered,
                       [this, guard, run](const RenderingControlLocator::Urls &urls) {
        if (!guard)
            return;
        const Device &dev = run->device;
        if (urls.controlUrl != dev.renderingControlUrl || urls.eventUrl != dev.renderingControlEventUrl)
            run->report.learnedUrls = urls;
        if (urls.controlUrl.isEmpty()) {
            run->done(run->report);
            return;
        }
        m_rendering->readAudio(urls.controlUrl, [guard, run](const AudioValues &values) {
            if (!guard)
                return;
            DeviceStatus &status = run->report.status;
            if (!status.volume.has_value() && values.volume.has_value()) {
                status.volume = values.volume;
                status.volumeSource = AudioSource::Upnp;
            }
            if (!status.muted.has_value() && values.muted.has_value()) {
                status.muted = values.muted;
                status.mutedSource = AudioSource::Upnp;
            }
            run->done(run->report);
        });
    });
}

} // namespace phicore::samsungtv::ipc

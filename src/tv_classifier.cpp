#include "tv_classifier.h"

#include <QPointer>
#include <QRegularExpression>
#include <QUrl>

#include "tv_identity.h"
#include "tv_log.h"
#include "tv_netprobe.h"
#include "tv_upnp.h"

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kTizenProbeTimeoutMs = 2000;
constexpr int kHjInfoTimeoutMs = 4000;
constexpr int kDescriptionTimeoutMs = 2000;
constexpr int kHjPortTimeoutMs = 1200;
constexpr int kHjPort = 8000;

QJsonObject deviceSection(const QJsonObject &info)
{
    const QJsonValue device = info.value(QStringLiteral("device"));
    return device.isObject() ? device.toObject() : info;
}

QString firstString(const QJsonObject &obj, std::initializer_list<const char *> keys)
{
    for (const char *key : keys) {
        const QString value = obj.value(QLatin1String(key)).toString().trimmed();
        if (!value.isEmpty())
            return value;
    }
    return {};
}

void fillIfEmpty(QString *target, const QString &value)
{
    if (target->isEmpty())
        *target = value;
}

} // namespace

QString tizenInfoUrl(const QString &ip, const QString &protocol, int port)
{
    const bool secure = protocol == QLatin1String("wss");
    return QStringLiteral("%1://%2:%3/api/v2/")
        .arg(secure ? QStringLiteral("https") : QStringLiteral("http"), ip)
        .arg(port);
}

QString hjInfoUrl(const QString &ip)
{
    return QStringLiteral("http://%1:8001/ms/1.0/").arg(ip);
}

std::optional<bool> parseTokenAuthSupport(const QJsonObject &info)
{
    const QJsonObject device = deviceSection(info);
    static const char *const keys[] = { "TokenAuthSupport", "tokenAuthSupport", "tokenAuthSupported" };
    for (const QJsonObject &obj : { device, info }) {
        for (const char *key : keys) {
            const QJsonValue value = obj.value(QLatin1String(key));
            if (value.isBool())
                return value.toBool();
            if (value.isString())
                return value.toString().compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
        }
    }
    return std::nullopt;
}

TizenInfo extractTizenInfo(const QJsonObject &info)
{
    const QJsonObject device = deviceSection(info);
    TizenInfo out;
    out.name = firstString(device, { "name" });
    if (out.name.isEmpty())
        out.name = firstString(info, { "name" });
    out.model = firstString(device, { "modelName", "model" });
    out.uuid = firstString(device, { "id", "udn", "uuid" });
    if (out.uuid.isEmpty())
        out.uuid = firstString(info, { "id" });
    out.mac = normalizeMac(firstString(device, { "wifiMac", "mac" }));
    out.tokenAuthSupport = parseTokenAuthSupport(info);
    return out;
}

HjInfo extractHjInfo(const QJsonObject &info)
{
    HjInfo out;
    out.name = firstString(info, { "DeviceName" });
    out.model = firstString(info, { "ModelName", "Model" });
    out.uuid = firstString(info, { "UDN", "DUID", "DeviceID" });
    out.id = normalizeId(firstString(info, { "DeviceID", "DUID", "UDN" }));
    return out;
}

bool isLikelyHjSeries(const QString &model, const QString &uuid)
{
    static const QRegularExpression yearCode(QStringLiteral("\\b1[45]_"));
    static const QRegularExpression generation(QStringLiteral("\\b[A-Z]{2}\\d{2}[HJ][A-Z]?\\d*"));
    static const QRegularExpression europeanJ(QStringLiteral("\\b(?:UE|GQ|QE)\\d{2}J"));

    const QString modelName = model.toUpper();
    const QString code = uuid.toUpper();
    if (yearCode.match(modelName + QLatin1Char(' ') + code).hasMatch())
        return true;
    if (generation.match(modelName).hasMatch())
        return true;
    if (europeanJ.match(modelName).hasMatch())
        return true;
    return modelName.contains(QLatin1String("JU")) || modelName.contains(QLatin1String("JS"));
}

void applyTizenInfo(DiscoveredCandidate *candidate, const TizenInfo &info)
{
    fillIfEmpty(&candidate->name, info.name);
    if (!info.model.isEmpty())
        candidate->model = info.model;
    if (!info.uuid.isEmpty()) {
        candidate->uuid = info.uuid;
        candidate->id = normalizeId(info.uuid);
    }
    if (!info.mac.isEmpty())
        candidate->mac = info.mac;
    if (info.tokenAuthSupport.has_value())
        candidate->tokenAuthSupport = info.tokenAuthSupport;
}

void applyTizenInfo(Device *device, const TizenInfo &info)
{
    // Identity is owned by the registry; only descriptive fields move here.
    if (!info.model.isEmpty())
        device->model = info.model;
    fillIfEmpty(&device->uuid, info.uuid);
    fillIfEmpty(&device->mac, info.mac);
    if (info.tokenAuthSupport.has_value())
        device->tokenAuthSupport = info.tokenAuthSupport;
}

void applyHjInfo(DiscoveredCandidate *candidate, const HjInfo &info)
{
    fillIfEmpty(&candidate->name, info.name);
    fillIfEmpty(&candidate->model, info.model);
    fillIfEmpty(&candidate->uuid, info.uuid);
    fillIfEmpty(&candidate->id, info.id);
}

DeviceClassifier::DeviceClassifier(NetworkProbes *probes)
    : m_probes(probes)
{
}

void DeviceClassifier::classify(const DiscoveredCandidate &seed, Callback done)
{
    auto run = std::make_shared<Run>();
    run->seed = seed;
    run->done = std::move(done);

    DiscoveredCandidate &result = run->result;
    result.ip = seed.ip;
    result.sources = seed.sources;
    result.name = seed.name;
    result.usn = seed.usn;
    result.location = seed.location;
    result.st = seed.st;
    result.server = seed.server;
    result.manufacturer = seed.manufacturer;
    result.renderingControlUrl = seed.renderingControlUrl;
    result.renderingControlEventUrl = seed.renderingControlEventUrl;

    qCDebug(tvLog) << "Probing device" << seed.ip;
    advance(run);
}

void DeviceClassifier::advance(const std::shared_ptr<Run> &run)
{
    DiscoveredCandidate &result = run->result;
    const QString ip = result.ip;
    QPointer<QObject> guard(&m_scope);

    switch (run->step) {
    case Step::TizenSecure:
        m_probes->fetchJson(tizenInfoUrl(ip, QStringLiteral("wss"), 8002), kTizenProbeTimeoutMs,
                            [this, guard, run](const JsonFetch &fetch) {
            if (!guard)
                return;
            if (fetch.ok) {
                run->result.api = ApiKind::Tizen;
                run->result.protocol = QStringLiteral("wss");
                run->result.port = 8002;
                applyTizenInfo(&run->result, extractTizenInfo(fetch.body));
                qCDebug(tvLog) << "Probe result" << run->result.ip << ": api=tizen protocol=wss port=8002";
                run->step = Step::HjInfo;
            } else {
                run->step = Step::TizenInsecure;
            }
            advance(run);
        });
        return;

    case Step::TizenInsecure:
        m_probes->fetchJson(tizenInfoUrl(ip, QStringLiteral("ws"), 8001), kTizenProbeTimeoutMs,
                            [this, guard, run](const JsonFetch &fetch) {
            if (!guard)
                return;
            if (fetch.ok) {
                run->result.api = ApiKind::Tizen;
                run->result.protocol = QStringLiteral("ws");
                run->result.port = 8001;
                applyTizenInfo(&run->result, extractTizenInfo(fetch.body));
                qCDebug(tvLog) << "Probe result" << run->result.ip << ": api=tizen protocol=ws port=8001";
            }
            run->step = Step::HjInfo;
            advance(run);
        });
        return;

    case Step::HjInfo:
        m_probes->fetchJson(hjInfoUrl(ip), kHjInfoTimeoutMs, [this, guard, run](const JsonFetch &fetch) {
            if (!guard)
                return;
            if (fetch.ok) {
                run->result.hjAvailable = true;
                applyHjInfo(&run->result, extractHjInfo(fetch.body));
            }
            run->step = Step::Description;
            advance(run);
        });
        return;

    case Step::Description:
        run->step = Step::Mac;
        if (run->seed.location.isEmpty()) {
            advance(run);
            return;
        }
        m_probes->fetchText(run->seed.location, kDescriptionTimeoutMs, [this, guard, run](const TextFetch &fetch) {
            if (!guard)
                return;
            if (fetch.ok) {
                const auto desc = parseUpnpDescription(fetch.body, QUrl(run->seed.location));
                if (desc.has_value()) {
                    DiscoveredCandidate &r = run->result;
                    fillIfEmpty(&r.model, desc->modelName);
                    fillIfEmpty(&r.name, desc->friendlyName);
                    fillIfEmpty(&r.uuid, desc->udn);
                    fillIfEmpty(&r.manufacturer, desc->manufacturer);
                    fillIfEmpty(&r.renderingControlUrl, desc->renderingControlUrl);
                    fillIfEmpty(&r.renderingControlEventUrl, desc->renderingControlEventUrl);
                    qCDebug(tvLog).noquote() << "UPnP description for" << r.ip << ": model=" << r.model
                                             << "name=" << r.name;
                }
            }
            advance(run);
        });
        return;

    case Step::Mac: {
        if (result.id.isEmpty()) {
            QString seedId = result.uuid;
            if (seedId.isEmpty())
                seedId = run->seed.usn;
            if (seedId.isEmpty())
                seedId = run->seed.st;
            if (seedId.isEmpty())
                seedId = ip;
            result.id = normalizeId(seedId);
        }
        if (result.name.isEmpty())
            result.name = QStringLiteral("tv-%1").arg(result.id.left(6));

        run->step = Step::Decide;
        m_probes->macForIp(ip, [this, guard, run](const QString &mac) {
            if (!guard)
                return;
            if (!mac.isEmpty()) {
                run->result.mac = normalizeMac(mac);
                if (run->result.id.isEmpty() || looksLikeIp(run->result.id))
                    run->result.id = run->result.mac;
            }
            advance(run);
        });
        return;
    }

    case Step::Decide:
        decide(run);
        return;

    case Step::HjPort:
        m_probes->checkPort(ip, kHjPort, kHjPortTimeoutMs, [this, guard, run](bool open) {
            if (!guard)
                return;
            if (open)
                run->result.hjAvailable = true;
            else
                qCWarning(tvLog) << "Model suggests H/J-series but HJ port not reachable for"
                                 << run->result.ip << "; forcing HJ";
            run->result.api = ApiKind::Hj;
            run->result.protocol = QStringLiteral("ws");
            run->result.port = kHjPort;
            run->step = Step::Done;
            advance(run);
        });
        return;

    case Step::Done:
        finish(run);
        return;
    }
}

void DeviceClassifier::decide(const std::shared_ptr<Run> &run)
{
    DiscoveredCandidate &result = run->result;
    run->hjSeries = isLikelyHjSeries(result.model, result.uuid);
    qCDebug(tvLog).noquote() << "HJ check" << result.ip << ": model=" << result.model << "uuid=" << result.uuid
                             << "hjSeries=" << run->hjSeries
                             << "hjAvailable=" << result.hjAvailable.value_or(false);

    const bool hjAvailable = result.hjAvailable.value_or(false);
    if (run->hjSeries && !hjAvailable) {
        run->step = Step::HjPort;
        advance(run);
        return;
    }
    if (run->hjSeries || (result.api == ApiKind::Unknown && hjAvailable)) {
        result.api = ApiKind::Hj;
        result.protocol = QStringLiteral("ws");
        result.port = kHjPort;
        qCDebug(tvLog) << "Probe result" << result.ip << ": api=hj protocol=ws port=8000";
    }
    run->step = Step::Done;
    advance(run);
}

void DeviceClassifier::finish(const std::shared_ptr<Run> &run)
{
    const DiscoveredCandidate &result = run->result;
    if (result.id.isEmpty()) {
        qCDebug(tvLog) << "Probe failed for" << result.ip;
        run->done(std::nullopt);
        return;
    }
    qCDebug(tvLog).noquote() << "Probe result" << result.ip << ": id=" << result.id << "mac=" << result.mac
                             << "model=" << result.model << "api=" << apiKindToString(result.api);
    run->done(result);
}

} // namespace phicore::samsungtv::ipc

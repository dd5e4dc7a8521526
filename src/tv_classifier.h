#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <QJsonObject>
#include <QObject>
#include <QString>

#include "tv_types.h"

namespace phicore::samsungtv::ipc {

class NetworkProbes;

struct TizenInfo {
    QString name;
    QString model;
    QString uuid;
    QString mac;
    std::optional<bool> tokenAuthSupport;
};

struct HjInfo {
    QString name;
    QString model;
    QString uuid;
    QString id;
};

QString tizenInfoUrl(const QString &ip, const QString &protocol, int port);
QString hjInfoUrl(const QString &ip);

std::optional<bool> parseTokenAuthSupport(const QJsonObject &info);
TizenInfo extractTizenInfo(const QJsonObject &info);
HjInfo extractHjInfo(const QJsonObject &info);

// Model/UUID heuristic for 2014/2015 sets that need the HJ protocol even
// when a Tizen endpoint answers.
bool isLikelyHjSeries(const QString &model, const QString &uuid);

void applyTizenInfo(DiscoveredCandidate *candidate, const TizenInfo &info);
void applyTizenInfo(Device *device, const TizenInfo &info);
void applyHjInfo(DiscoveredCandidate *candidate, const HjInfo &info);

// Probes one IP and decides api/protocol/port plus identity hints.
class DeviceClassifier
{
public:
    using Callback = std::function<void(const std::optional<DiscoveredCandidate> &)>;

    explicit DeviceClassifier(NetworkProbes *probes);

    void classify(const DiscoveredCandidate &seed, Callback done);

private:
    enum class Step {
        TizenSecure,
        TizenInsecure,
        HjInfo,
        Description,
        Mac,
        Decide,
        HjPort,
        Done
    };

    struct Run {
        Step step = Step::TizenSecure;
        DiscoveredCandidate seed;
        DiscoveredCandidate result;
        bool hjSeries = false;
        Callback done;
    };

    void advance(const std::shared_ptr<Run> &run);
    void decide(const std::shared_ptr<Run> &run);
    void finish(const std::shared_ptr<Run> &run);

    NetworkProbes *m_probes = nullptr;
    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc

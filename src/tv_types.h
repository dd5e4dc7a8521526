#pragma once

#include <cstdint>
#include <optional>

#include <QJsonObject>
#include <QSet>
#include <QString>

namespace phicore::samsungtv::ipc {

enum class ApiKind {
    Unknown,
    Tizen,
    Hj,
    Legacy
};

QString apiKindToString(ApiKind api);
ApiKind apiKindFromString(const QString &value);

// Fields shared by configured devices and discovery results.
struct DeviceAttributes {
    QString id;
    QString ip;
    QString mac;
    QString model;
    QString uuid;
    ApiKind api = ApiKind::Unknown;
    QString protocol;
    int port = 0;
    std::optional<bool> tokenAuthSupport;
    std::optional<bool> hjAvailable;
    QString renderingControlUrl;
    QString renderingControlEventUrl;
};

struct Device : DeviceAttributes {
    QString name;
    QString displayName;
};

struct DiscoveredCandidate : DeviceAttributes {
    QString name;
    QString manufacturer;
    QString usn;
    QString location;
    QString st;
    QString server;
    QSet<QString> sources;

    QJsonObject toJson() const;
    static DiscoveredCandidate fromJson(const QJsonObject &obj);
};

enum class AudioSource {
    None,
    Api,
    Upnp
};

struct DeviceStatus {
    bool online = false;
    bool power = false;
    std::optional<int> volume;
    std::optional<bool> muted;
    AudioSource volumeSource = AudioSource::None;
    AudioSource mutedSource = AudioSource::None;
    // MAC reported by the set itself while polling.
    QString reportedMac;
};

// Per-session audio bookkeeping used by the telemetry reconciliation.
struct AudioTelemetry {
    std::optional<int> lastKnownVolume;
    std::optional<bool> lastKnownMuted;
    std::optional<int> expectedVolume;
    std::int64_t expectedVolumeUntil = 0;
    std::optional<bool> expectedMuted;
    std::int64_t expectedMutedUntil = 0;
    std::optional<bool> volumeTelemetryReliable;
    std::optional<bool> mutedTelemetryReliable;
    std::int64_t mutedShadowUntil = 0;
};

inline constexpr const char kSourceSsdp[] = "ssdp";
inline constexpr const char kSourceMdns[] = "mdns";
inline constexpr const char kSourcePair[] = "pair";

} // namespace phicore::samsungtv::ipc

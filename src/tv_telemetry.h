#pragma once

#include <cstdint>
#include <optional>

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include "tv_types.h"
#include "tv_upnp.h"

namespace phicore::samsungtv::ipc {

inline constexpr std::int64_t kExpectedValueWindowMs = 12000;
inline constexpr std::int64_t kMutedShadowWindowMs = 120000;

// Trimmed, lower-cased PowerState from info.device, then info.
QString extractPowerState(const QJsonObject &info);
// on/active/wake/awake -> true, standby/off/inactive/sleep -> false.
std::optional<bool> interpretPowerState(const QString &state);

std::optional<int> extractVolume(const QJsonObject &info);
std::optional<bool> normalizeMutedValue(const QJsonValue &value);
std::optional<bool> extractMuted(const QJsonObject &info);

// Copies volume/mute found in an info document into status (source api).
void applyAudioFromInfo(DeviceStatus *status, const QJsonObject &info);

// Reconciles reported audio against the device's telemetry history.
// UPnP zero volume and mute=false are held at the last known value until
// the channel has once reported a non-zero volume or mute=true. A local
// mute command shadows a contradicting UPnP unmute for two minutes.
AudioValues resolveAudioStates(AudioTelemetry *telemetry, const DeviceStatus &status, std::int64_t nowMs);

// Optimistic bookkeeping after a local volume/mute key press.
void noteLocalVolume(AudioTelemetry *telemetry, int volume, std::int64_t nowMs);
void noteLocalMute(AudioTelemetry *telemetry, bool muted, std::int64_t nowMs);

} // namespace phicore::samsungtv::ipc

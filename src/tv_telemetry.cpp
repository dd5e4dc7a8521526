#include "tv_telemetry.h"

#include <algorithm>

#include <QRegularExpression>

namespace phicore::samsungtv::ipc {

namespace {

QJsonValue lookup(const QJsonObject &info, std::initializer_list<const char *> keys)
{
    const QJsonValue deviceValue = info.value(QStringLiteral("device"));
    const QJsonObject device = deviceValue.isObject() ? deviceValue.toObject() : QJsonObject();
    for (const QJsonObject &obj : { device, info }) {
        for (const char *key : keys) {
            const QJsonValue value = obj.value(QLatin1String(key));
            if (!value.isUndefined() && !value.isNull())
                return value;
        }
    }
    return QJsonValue(QJsonValue::Undefined);
}

std::optional<int> parseLeadingInt(const QJsonValue &value)
{
    if (value.isDouble())
        return static_cast<int>(value.toDouble());
    if (value.isString()) {
        static const QRegularExpression leading(QStringLiteral("^\\s*([+-]?\\d+)"));
        const QRegularExpressionMatch match = leading.match(value.toString());
        if (match.hasMatch())
            return match.captured(1).toInt();
    }
    return std::nullopt;
}

} // namespace

QString extractPowerState(const QJsonObject &info)
{
    const QJsonValue deviceValue = info.value(QStringLiteral("device"));
    const QJsonObject device = deviceValue.isObject() ? deviceValue.toObject() : QJsonObject();
    static const char *const keys[] = { "PowerState", "powerState", "powerstate" };
    for (const QJsonObject &obj : { device, info }) {
        for (const char *key : keys) {
            const QString value = obj.value(QLatin1String(key)).toString().trimmed();
            if (!value.isEmpty())
                return value.toLower();
        }
    }
    return {};
}

std::optional<bool> interpretPowerState(const QString &state)
{
    const QString s = state.trimmed().toLower();
    if (s == QLatin1String("on") || s == QLatin1String("active")
        || s == QLatin1String("wake") || s == QLatin1String("awake"))
        return true;
    if (s == QLatin1String("standby") || s == QLatin1String("off")
        || s == QLatin1String("inactive") || s == QLatin1String("sleep"))
        return false;
    return std::nullopt;
}

std::optional<int> extractVolume(const QJsonObject &info)
{
    const auto parsed = parseLeadingInt(lookup(info, { "volume", "Volume", "currentVolume", "CurrentVolume" }));
    if (!parsed.has_value())
        return std::nullopt;
    return std::clamp(*parsed, 0, 100);
}

std::optional<bool> normalizeMutedValue(const QJsonValue &value)
{
    if (value.isBool())
        return value.toBool();
    if (value.isDouble())
        return value.toDouble() != 0.0;
    if (!value.isString())
        return std::nullopt;
    const QString s = value.toString().trimmed().toLower();
    if (s == QLatin1String("1") || s == QLatin1String("true") || s == QLatin1String("on")
        || s == QLatin1String("yes") || s == QLatin1String("muted"))
        return true;
    if (s == QLatin1String("0") || s == QLatin1String("false") || s == QLatin1String("off")
        || s == QLatin1String("no") || s == QLatin1String("unmuted"))
        return false;
    return std::nullopt;
}

std::optional<bool> extractMuted(const QJsonObject &info)
{
    return normalizeMutedValue(lookup(info, { "mute", "Mute", "muted", "Muted", "currentMute", "CurrentMute" }));
}

void applyAudioFromInfo(DeviceStatus *status, const QJsonObject &info)
{
    const auto volume = extractVolume(info);
    if (volume.has_value()) {
        status->volume = volume;
        status->volumeSource = AudioSource::Api;
    }
    const auto muted = extractMuted(info);
    if (muted.has_value()) {
        status->muted = muted;
        status->mutedSource = AudioSource::Api;
    }
}

AudioValues resolveAudioStates(AudioTelemetry *telemetry, const DeviceStatus &status, std::int64_t nowMs)
{
    AudioTelemetry &t = *telemetry;
    if (t.expectedVolume.has_value() && nowMs >= t.expectedVolumeUntil) {
        t.expectedVolume.reset();
        t.expectedVolumeUntil = 0;
    }
    if (t.expectedMuted.has_value() && nowMs >= t.expectedMutedUntil) {
        t.expectedMuted.reset();
        t.expectedMutedUntil = 0;
    }

    AudioValues out;

    std::optional<int> volume = status.volume;
    const bool volumeFromUpnp = status.volumeSource == AudioSource::Upnp;
    if (volumeFromUpnp && volume.has_value()) {
        if (t.expectedVolume.has_value())
            t.volumeTelemetryReliable = (*volume == *t.expectedVolume);
        if (*volume > 0)
            t.volumeTelemetryReliable = true;
    }
    if (volumeFromUpnp && t.volumeTelemetryReliable == std::optional<bool>(false)) {
        volume = t.lastKnownVolume;
    } else if (volumeFromUpnp && t.volumeTelemetryReliable != std::optional<bool>(true)
               && volume == std::optional<int>(0)) {
        volume = t.lastKnownVolume;
    }
    if (volume.has_value())
        t.lastKnownVolume = volume;
    out.volume = volume;

    std::optional<bool> muted = status.muted;
    const bool mutedFromUpnp = status.mutedSource == AudioSource::Upnp;
    if (mutedFromUpnp && muted.has_value()) {
        if (t.expectedMuted.has_value())
            t.mutedTelemetryReliable = (*muted == *t.expectedMuted);
        if (*muted)
            t.mutedTelemetryReliable = true;
    }
    if (mutedFromUpnp && t.mutedTelemetryReliable == std::optional<bool>(false)) {
        muted = t.lastKnownMuted;
    } else if (mutedFromUpnp && t.mutedTelemetryReliable != std::optional<bool>(true)
               && muted == std::optional<bool>(false)) {
        muted = t.lastKnownMuted;
    }
    if (mutedFromUpnp && muted == std::optional<bool>(false)
        && t.lastKnownMuted == std::optional<bool>(true) && nowMs < t.mutedShadowUntil) {
        muted = true;
    }
    if (muted.has_value())
        t.lastKnownMuted = muted;
    out.muted = muted;

    return out;
}

void noteLocalVolume(AudioTelemetry *telemetry, int volume, std::int64_t nowMs)
{
    telemetry->lastKnownVolume = volume;
    telemetry->expectedVolume = volume;
    telemetry->expectedVolumeUntil = nowMs + kExpectedValueWindowMs;
}

void noteLocalMute(AudioTelemetry *telemetry, bool muted, std::int64_t nowMs)
{
    telemetry->lastKnownMuted = muted;
    telemetry->expectedMuted = muted;
    telemetry->expectedMutedUntil = nowMs + kExpectedValueWindowMs;
    telemetry->mutedShadowUntil = nowMs + kMutedShadowWindowMs;
}

} // namespace phicore::samsungtv::ipc

#include "tv_config.h"

#include <algorithm>

namespace phicore::samsungtv::ipc {

int readIntSetting(const QJsonObject &meta, const QString &key, int fallback)
{
    const QJsonValue value = meta.value(key);
    if (value.isDouble()) {
        const int parsed = value.toInt();
        return parsed > 0 ? parsed : fallback;
    }
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        return ok && parsed > 0 ? parsed : fallback;
    }
    return fallback;
}

bool readBoolSetting(const QJsonObject &meta, const QString &key, bool fallback)
{
    const QJsonValue value = meta.value(key);
    if (value.isBool())
        return value.toBool();
    if (value.isDouble())
        return value.toDouble() != 0.0;
    if (value.isString()) {
        const QString text = value.toString().trimmed().toLower();
        if (text == QLatin1String("true") || text == QLatin1String("1"))
            return true;
        if (text == QLatin1String("false") || text == QLatin1String("0"))
            return false;
    }
    return fallback;
}

int clampDiscoveryTimeoutSec(int seconds)
{
    return std::max(2, seconds);
}

EngineConfig EngineConfig::fromMeta(const QJsonObject &meta)
{
    EngineConfig cfg;
    cfg.pollIntervalSec = std::max(10, readIntSetting(meta, QStringLiteral("pollInterval"), cfg.pollIntervalSec));
    cfg.autoScan = readBoolSetting(meta, QStringLiteral("autoScan"), cfg.autoScan);
    cfg.autoScanIntervalSec =
        std::max(30, readIntSetting(meta, QStringLiteral("autoScanInterval"), cfg.autoScanIntervalSec));
    cfg.discoveryTimeoutSec =
        clampDiscoveryTimeoutSec(readIntSetting(meta, QStringLiteral("discoveryTimeout"), cfg.discoveryTimeoutSec));
    cfg.enableSsdp = readBoolSetting(meta, QStringLiteral("enableSsdp"), cfg.enableSsdp);
    cfg.enableMdns = readBoolSetting(meta, QStringLiteral("enableMdns"), cfg.enableMdns);
    cfg.enableWol = readBoolSetting(meta, QStringLiteral("enableWol"), cfg.enableWol);

    const QString services = meta.value(QStringLiteral("mdnsServices")).toString().trimmed();
    if (!services.isEmpty())
        cfg.mdnsServices = services;
    cfg.hjKeyFile = meta.value(QStringLiteral("hjKeyFile")).toString().trimmed();
    const QString clientName = meta.value(QStringLiteral("clientName")).toString().trimmed();
    if (!clientName.isEmpty())
        cfg.clientName = clientName;

    cfg.devices = meta.value(QStringLiteral("devices")).toArray();
    cfg.tokens = meta.value(QStringLiteral("tokens")).toString();

    const QJsonObject trees = meta.value(QStringLiteral("deviceTrees")).toObject();
    for (auto it = trees.begin(); it != trees.end(); ++it) {
        const QString deviceId = it.value().toString().trimmed();
        if (!it.key().isEmpty() && !deviceId.isEmpty())
            cfg.deviceTrees.insert(it.key(), deviceId);
    }
    return cfg;
}

} // namespace phicore::samsungtv::ipc

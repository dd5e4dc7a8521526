#pragma once

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

namespace phicore::samsungtv::ipc {

struct EngineConfig {
    int pollIntervalSec = 30;
    bool autoScan = false;
    int autoScanIntervalSec = 300;
    int discoveryTimeoutSec = 5;
    bool enableSsdp = true;
    bool enableMdns = true;
    QString mdnsServices = QStringLiteral("_samsungmsf._tcp");
    bool enableWol = true;
    QString hjKeyFile;
    QString clientName = QStringLiteral("phi-core");
    QJsonArray devices;
    QString tokens;
    // Published tree slug -> device id.
    QHash<QString, QString> deviceTrees;

    // Missing or invalid values fall back to defaults; numbers are clamped.
    static EngineConfig fromMeta(const QJsonObject &meta);
};

// Accepts an int or a numeric string; anything else yields fallback.
int readIntSetting(const QJsonObject &meta, const QString &key, int fallback);
bool readBoolSetting(const QJsonObject &meta, const QString &key, bool fallback);

int clampDiscoveryTimeoutSec(int seconds);

} // namespace phicore::samsungtv::ipc

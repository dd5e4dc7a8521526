#pragma once

#include <QHash>
#include <QJsonArray>
#include <QString>
#include <QStringList>
#include <QVariant>

#include "tv_types.h"

namespace phicore::samsungtv::ipc {

inline const QStringList &infoChannelIds()
{
    static const QStringList ids = {
        QStringLiteral("info.id"),     QStringLiteral("info.ip"),     QStringLiteral("info.mac"),
        QStringLiteral("info.model"),  QStringLiteral("info.uuid"),   QStringLiteral("info.api"),
        QStringLiteral("info.lastSeen"), QStringLiteral("info.paired"), QStringLiteral("info.online"),
        QStringLiteral("info.tokenAuthSupport"),
    };
    return ids;
}

inline const QStringList &stateChannelIds()
{
    static const QStringList ids = {
        QStringLiteral("state.power"), QStringLiteral("state.volume"), QStringLiteral("state.muted"),
        QStringLiteral("state.app"),   QStringLiteral("state.source"),
    };
    return ids;
}

inline const QStringList &controlChannelIds()
{
    static const QStringList ids = {
        QStringLiteral("control.power"),     QStringLiteral("control.wol"),
        QStringLiteral("control.key"),       QStringLiteral("control.volumeUp"),
        QStringLiteral("control.volumeDown"), QStringLiteral("control.mute"),
        QStringLiteral("control.channelUp"), QStringLiteral("control.channelDown"),
        QStringLiteral("control.launchApp"), QStringLiteral("control.source"),
    };
    return ids;
}

// The host store the engine publishes into. Device trees are addressed by
// the device's name slug.
class HostBridge
{
public:
    virtual ~HostBridge() = default;

    virtual void persistDevices(const QJsonArray &devices) = 0;
    virtual void persistSecrets(const QString &blob) = 0;
    virtual void persistDeviceTrees(const QHash<QString, QString> &trees) = 0;

    virtual void ensureDeviceTree(const Device &device) = 0;
    virtual void removeDeviceTree(const QString &name) = 0;
    // Publishes device under its new name with every cached value, then
    // removes oldName.
    virtual void migrateDeviceTree(const QString &oldName, const Device &device) = 0;

    // An invalid QVariant publishes null.
    virtual void setState(const QString &deviceName, const QString &channelId, const QVariant &value) = 0;
    virtual void reportError(const QString &message) = 0;
};

} // namespace phicore::samsungtv::ipc

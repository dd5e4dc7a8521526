#pragma once

#include <optional>

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QSet>
#include <QString>

#include "tv_types.h"

namespace phicore::samsungtv::ipc {

// Identity of a raw configured entry: id/uuid/usn, then MAC, then IP.
QString configuredDeviceId(const QJsonObject &raw);

// Parses one raw entry; the returned name is unique against takenNames.
std::optional<Device> parseConfiguredDevice(const QJsonObject &raw, const QSet<QString> &takenNames);

struct IdChange {
    QString oldId;
    QString newId;
};

struct ReconcileResult {
    bool matched = false;
    bool changed = false;
    QStringList changedIds;
    QList<IdChange> idChanges;
};

// Published device trees (slug -> device id) against the configured devices.
struct TreePlan {
    QList<QPair<QString, QString>> renames;
    QStringList removals;
    QHash<QString, QString> trees;
};

TreePlan planTreeReconciliation(const QHash<QString, QString> &trees, const QList<Device> &devices);

// Configured devices, kept alongside the raw entries they came from so that
// unknown keys and user overrides survive every write-back.
class DeviceRegistry
{
public:
    void load(const QJsonArray &rawDevices);
    QJsonArray rawDevices() const;

    QList<Device> devices() const;
    const Device *device(const QString &id) const;
    const Device *deviceByName(const QString &name) const;
    bool contains(const QString &id) const { return device(id) != nullptr; }
    QSet<QString> names() const;

    // Merges observed attributes into every matching entry. matchId forces a
    // match on a known device in addition to the id/MAC/IP rules.
    ReconcileResult reconcile(const DeviceAttributes &observed, const QString &matchId = {});

    bool addDevice(const DiscoveredCandidate &candidate,
                   const QString &name,
                   Device *added = nullptr,
                   QString *error = nullptr);

    // Returns the new slug, or an empty string for an unknown id.
    QString rename(const QString &id, const QString &displayName);

private:
    struct Entry {
        QJsonObject raw;
        std::optional<Device> device;
    };

    bool matches(const Entry &entry, const DeviceAttributes &observed, const QString &matchId) const;
    bool applyTo(Entry *entry, const DeviceAttributes &observed, ReconcileResult *result);
    Entry *entryFor(const QString &id);

    QList<Entry> m_entries;
};

} // namespace phicore::samsungtv::ipc

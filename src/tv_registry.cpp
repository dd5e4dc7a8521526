#include "tv_registry.h"

#include "tv_identity.h"
#include "tv_log.h"

namespace phicore::samsungtv::ipc {

namespace {

QString rawString(const QJsonObject &raw, const char *key)
{
    const QJsonValue value = raw.value(QLatin1String(key));
    if (value.isString())
        return value.toString().trimmed();
    if (value.isDouble())
        return QString::number(value.toDouble());
    return {};
}

std::optional<bool> rawBool(const QJsonObject &raw, const char *key)
{
    const QJsonValue value = raw.value(QLatin1String(key));
    if (value.isBool())
        return value.toBool();
    return std::nullopt;
}

int rawInt(const QJsonObject &raw, const char *key)
{
    const QJsonValue value = raw.value(QLatin1String(key));
    if (value.isDouble())
        return value.toInt();
    return value.toString().trimmed().toInt();
}

bool hasDurableId(const QString &id)
{
    return !id.isEmpty() && !looksLikeIp(id);
}

bool setString(QJsonObject *raw, const char *key, QString *field, const QString &value)
{
    if (value.isEmpty() || *field == value)
        return false;
    *field = value;
    raw->insert(QLatin1String(key), value);
    return true;
}

bool setFlag(QJsonObject *raw, const char *key, std::optional<bool> *field, const std::optional<bool> &value)
{
    if (!value.has_value() || *field == value)
        return false;
    *field = value;
    raw->insert(QLatin1String(key), *value);
    return true;
}

} // namespace

QString configuredDeviceId(const QJsonObject &raw)
{
    const QString mac = normalizeMac(rawString(raw, "mac"));
    QString id = rawString(raw, "id");
    if (id.isEmpty())
        id = rawString(raw, "uuid");
    if (id.isEmpty())
        id = rawString(raw, "usn");
    id = normalizeId(id);
    if ((id.isEmpty() || looksLikeIp(id)) && !mac.isEmpty())
        id = mac;
    if (id.isEmpty())
        id = normalizeId(rawString(raw, "ip"));
    return normalizeDeviceId(id);
}

std::optional<Device> parseConfiguredDevice(const QJsonObject &raw, const QSet<QString> &takenNames)
{
    const QString id = configuredDeviceId(raw);
    if (id.isEmpty())
        return std::nullopt;

    QString displayName = rawString(raw, "name");
    if (displayName.isEmpty())
        displayName = rawString(raw, "friendlyName");
    if (displayName.isEmpty())
        displayName = rawString(raw, "model");
    if (displayName.isEmpty())
        displayName = QStringLiteral("tv");

    const QString fallback = fallbackName(id);
    QString slug = sanitizeName(displayName);
    if (slug.isEmpty())
        slug = fallback;

    Device device;
    device.id = id;
    device.name = ensureUniqueName(slug, takenNames, fallback);
    device.displayName = displayName;
    device.ip = rawString(raw, "ip");
    device.mac = normalizeMac(rawString(raw, "mac"));
    device.model = rawString(raw, "model");
    device.uuid = rawString(raw, "uuid");
    device.api = apiKindFromString(rawString(raw, "api"));
    device.protocol = rawString(raw, "protocol");
    device.port = rawInt(raw, "port");
    device.renderingControlUrl = rawString(raw, "renderingControlUrl");
    device.renderingControlEventUrl = rawString(raw, "renderingControlEventUrl");
    device.tokenAuthSupport = rawBool(raw, "tokenAuthSupport");
    device.hjAvailable = rawBool(raw, "hjAvailable");
    return device;
}

TreePlan planTreeReconciliation(const QHash<QString, QString> &trees, const QList<Device> &devices)
{
    QHash<QString, const Device *> byId;
    QHash<QString, const Device *> byName;
    for (const Device &device : devices) {
        byId.insert(device.id, &device);
        byName.insert(device.name, &device);
    }

    TreePlan plan;
    QSet<QString> claimed;
    for (auto it = trees.cbegin(); it != trees.cend(); ++it) {
        const QString treeName = it.key();
        const QString treeId = normalizeDeviceId(it.value());

        const Device *match = nullptr;
        if (!treeId.isEmpty())
            match = byId.value(treeId, nullptr);
        if (!match)
            match = byName.value(treeName, nullptr);

        if (!match || claimed.contains(match->id)) {
            plan.removals.append(treeName);
            continue;
        }
        claimed.insert(match->id);
        if (treeName != match->name)
            plan.renames.append(qMakePair(treeName, match->name));
        plan.trees.insert(match->name, match->id);
    }
    for (const Device &device : devices) {
        if (!claimed.contains(device.id))
            plan.trees.insert(device.name, device.id);
    }
    return plan;
}

void DeviceRegistry::load(const QJsonArray &rawDevices)
{
    m_entries.clear();
    QSet<QString> taken;
    for (const QJsonValue &value : rawDevices) {
        if (!value.isObject())
            continue;
        Entry entry;
        entry.raw = value.toObject();
        entry.device = parseConfiguredDevice(entry.raw, taken);
        if (!entry.device.has_value())
            qCWarning(tvLog) << "Skipping device without stable id in config.";
        else
            taken.insert(entry.device->name);
        m_entries.append(entry);
    }
}

QJsonArray DeviceRegistry::rawDevices() const
{
    QJsonArray out;
    for (const Entry &entry : m_entries)
        out.append(entry.raw);
    return out;
}

QList<Device> DeviceRegistry::devices() const
{
    QList<Device> out;
    for (const Entry &entry : m_entries) {
        if (entry.device.has_value())
            out.append(*entry.device);
    }
    return out;
}

const Device *DeviceRegistry::device(const QString &id) const
{
    for (const Entry &entry : m_entries) {
        if (entry.device.has_value() && entry.device->id == id)
            return &*entry.device;
    }
    return nullptr;
}

const Device *DeviceRegistry::deviceByName(const QString &name) const
{
    for (const Entry &entry : m_entries) {
        if (entry.device.has_value() && entry.device->name == name)
            return &*entry.device;
    }
    return nullptr;
}

QSet<QString> DeviceRegistry::names() const
{
    QSet<QString> out;
    for (const Entry &entry : m_entries) {
        if (entry.device.has_value())
            out.insert(entry.device->name);
    }
    return out;
}

DeviceRegistry::Entry *DeviceRegistry::entryFor(const QString &id)
{
    for (Entry &entry : m_entries) {
        if (entry.device.has_value() && entry.device->id == id)
            return &entry;
    }
    return nullptr;
}

bool DeviceRegistry::matches(const Entry &entry, const DeviceAttributes &observed, const QString &matchId) const
{
    if (!entry.device.has_value())
        return false;
    const Device &device = *entry.device;
    const QString observedId = normalizeDeviceId(observed.id);
    const QString observedMac = normalizeMac(observed.mac);

    if (!matchId.isEmpty() && device.id == matchId)
        return true;
    if (!observedId.isEmpty() && observedId == device.id)
        return true;
    if (!observedMac.isEmpty() && observedMac == device.mac)
        return true;
    // An IP only identifies an entry that has nothing better.
    if (observed.ip.isEmpty() || observed.ip != device.ip)
        return false;
    return !hasDurableId(device.id) && device.mac.isEmpty();
}

bool DeviceRegistry::applyTo(Entry *entry, const DeviceAttributes &observed, ReconcileResult *result)
{
    Device &device = *entry->device;
    QJsonObject &raw = entry->raw;
    bool changed = false;

    changed |= setString(&raw, "ip", &device.ip, observed.ip);
    if (device.mac.isEmpty())
        changed |= setString(&raw, "mac", &device.mac, normalizeMac(observed.mac));
    if (device.model.isEmpty())
        changed |= setString(&raw, "model", &device.model, observed.model);
    if (device.uuid.isEmpty())
        changed |= setString(&raw, "uuid", &device.uuid, observed.uuid);
    if (observed.api != ApiKind::Unknown && observed.api != device.api) {
        device.api = observed.api;
        raw.insert(QStringLiteral("api"), apiKindToString(observed.api));
        changed = true;
    }
    changed |= setString(&raw, "protocol", &device.protocol, observed.protocol);
    if (observed.port > 0 && observed.port != device.port) {
        device.port = observed.port;
        raw.insert(QStringLiteral("port"), observed.port);
        changed = true;
    }
    changed |= setString(&raw, "renderingControlUrl", &device.renderingControlUrl, observed.renderingControlUrl);
    changed |= setString(&raw, "renderingControlEventUrl", &device.renderingControlEventUrl,
                         observed.renderingControlEventUrl);
    changed |= setFlag(&raw, "tokenAuthSupport", &device.tokenAuthSupport, observed.tokenAuthSupport);
    changed |= setFlag(&raw, "hjAvailable", &device.hjAvailable, observed.hjAvailable);

    if (looksLikeIp(device.id)) {
        QString upgraded;
        const QString observedId = normalizeDeviceId(observed.id);
        if (hasDurableId(observedId))
            upgraded = observedId;
        else if (!device.mac.isEmpty())
            upgraded = device.mac;
        if (!upgraded.isEmpty() && upgraded != device.id && !contains(upgraded)) {
            qCInfo(tvLog) << "Upgrading device id" << device.id << "to" << upgraded;
            result->idChanges.append(IdChange { device.id, upgraded });
            device.id = upgraded;
            raw.insert(QStringLiteral("id"), upgraded);
            changed = true;
        }
    }

    if (changed)
        result->changedIds.append(device.id);
    return changed;
}

ReconcileResult DeviceRegistry::reconcile(const DeviceAttributes &observed, const QString &matchId)
{
    ReconcileResult result;
    for (Entry &entry : m_entries) {
        if (!matches(entry, observed, matchId))
            continue;
        result.matched = true;
        if (applyTo(&entry, observed, &result))
            result.changed = true;
    }
    return result;
}

bool DeviceRegistry::addDevice(const DiscoveredCandidate &candidate,
                               const QString &name,
                               Device *added,
                               QString *error)
{
    const QString id = normalizeDeviceId(candidate.id);
    const QString mac = normalizeMac(candidate.mac);
    if (id.isEmpty() && mac.isEmpty() && candidate.ip.isEmpty()) {
        if (error)
            *error = QStringLiteral("Device has no stable id");
        return false;
    }
    for (const Entry &entry : m_entries) {
        if (!entry.device.has_value())
            continue;
        if ((!id.isEmpty() && entry.device->id == id) || (!mac.isEmpty() && entry.device->mac == mac)) {
            if (error)
                *error = QStringLiteral("Device already configured as %1").arg(entry.device->name);
            return false;
        }
    }

    QString displayName = name.trimmed();
    const QSet<QString> taken = names();
    if (!displayName.isEmpty() && taken.contains(sanitizeName(displayName))) {
        if (error)
            *error = QStringLiteral("Name already in use: %1").arg(sanitizeName(displayName));
        return false;
    }
    if (displayName.isEmpty())
        displayName = candidate.name.isEmpty() ? candidate.model : candidate.name;

    QJsonObject raw;
    auto put = [&raw](const char *key, const QString &value) {
        if (!value.isEmpty())
            raw.insert(QLatin1String(key), value);
    };
    put("id", id);
    put("name", displayName);
    put("ip", candidate.ip);
    put("mac", mac);
    put("model", candidate.model);
    put("uuid", candidate.uuid);
    put("usn", candidate.usn);
    raw.insert(QStringLiteral("api"), apiKindToString(candidate.api));
    put("protocol", candidate.protocol);
    if (candidate.port > 0)
        raw.insert(QStringLiteral("port"), candidate.port);
    put("renderingControlUrl", candidate.renderingControlUrl);
    put("renderingControlEventUrl", candidate.renderingControlEventUrl);
    if (candidate.tokenAuthSupport.has_value())
        raw.insert(QStringLiteral("tokenAuthSupport"), *candidate.tokenAuthSupport);
    if (candidate.hjAvailable.has_value())
        raw.insert(QStringLiteral("hjAvailable"), *candidate.hjAvailable);
    const QJsonObject json = candidate.toJson();
    if (json.contains(QStringLiteral("source")))
        raw.insert(QStringLiteral("source"), json.value(QStringLiteral("source")));

    Entry entry;
    entry.raw = raw;
    entry.device = parseConfiguredDevice(raw, taken);
    if (!entry.device.has_value()) {
        if (error)
            *error = QStringLiteral("Device has no stable id");
        return false;
    }
    m_entries.append(entry);
    qCInfo(tvLog) << "Added device" << entry.device->name << "(" << entry.device->id << ")";
    if (added)
        *added = *entry.device;
    return true;
}

QString DeviceRegistry::rename(const QString &id, const QString &displayName)
{
    Entry *entry = entryFor(id);
    if (!entry)
        return {};

    Device &device = *entry->device;
    QSet<QString> taken = names();
    taken.remove(device.name);

    const QString fallback = fallbackName(device.id);
    QString slug = sanitizeName(displayName);
    if (slug.isEmpty())
        slug = fallback;

    device.displayName = displayName.trimmed().isEmpty() ? device.displayName : displayName.trimmed();
    device.name = ensureUniqueName(slug, taken, fallback);
    entry->raw.insert(QStringLiteral("name"), device.displayName);
    return device.name;
}

} // namespace phicore::samsungtv::ipc

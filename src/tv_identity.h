#pragma once

#include <QSet>
#include <QString>

namespace phicore::samsungtv::ipc {

// Strips "uuid:" / "urn:uuid:" prefixes.
QString normalizeId(const QString &id);
QString normalizeMac(const QString &mac);
// normalizeId, plus lower-casing for MAC-shaped ids.
QString normalizeDeviceId(const QString &id);

bool looksLikeIp(const QString &value);
bool looksLikeMac(const QString &value);

QString sanitizeName(const QString &name);
QString ensureUniqueName(const QString &desired, const QSet<QString> &taken, const QString &fallbackBase = {});
QString fallbackName(const QString &id);

} // namespace phicore::samsungtv::ipc

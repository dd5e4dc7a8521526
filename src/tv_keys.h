#pragma once

#include <QString>
#include <QVariant>

namespace phicore::samsungtv::ipc {

// Maps friendly names ("volup", "ok", "7") to KEY_* codes. KEY_* input is
// upper-cased and passed through; anything else is upper-cased as a literal.
QString normalizeKeyInput(const QString &input);

// "hdmi1" -> "KEY_HDMI1"; an existing KEY_ prefix is kept.
QString sourceKey(const QString &source);

bool isPowerKey(const QString &key);
bool isTruthyValue(const QVariant &value);

} // namespace phicore::samsungtv::ipc

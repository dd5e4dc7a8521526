#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(tvLog)

namespace phicore::samsungtv::ipc {

// Replaces the value of a token= query item so URLs can be logged.
QString maskToken(const QString &url);

} // namespace phicore::samsungtv::ipc

#include "tv_adapter.h"

namespace phicore::samsungtv::ipc {

QString commandStatusToString(CommandStatus status)
{
    switch (status) {
    case CommandStatus::Ok:
        return QStringLiteral("ok");
    case CommandStatus::TransportError:
        return QStringLiteral("transport error");
    case CommandStatus::Unsupported:
        return QStringLiteral("unsupported");
    case CommandStatus::Denied:
        return QStringLiteral("denied");
    case CommandStatus::TimedOut:
        return QStringLiteral("timed out");
    case CommandStatus::NotPaired:
        return QStringLiteral("not paired");
    case CommandStatus::InvalidArgument:
        return QStringLiteral("invalid argument");
    case CommandStatus::Failed:
        break;
    }
    return QStringLiteral("failed");
}

} // namespace phicore::samsungtv::ipc

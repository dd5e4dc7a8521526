#pragma once

#include <functional>
#include <optional>

#include <QJsonObject>
#include <QString>

#include "tv_secrets.h"
#include "tv_types.h"

namespace phicore::samsungtv::ipc {

enum class CommandStatus {
    Ok,
    TransportError,
    Unsupported,
    Denied,
    TimedOut,
    NotPaired,
    InvalidArgument,
    Failed
};

QString commandStatusToString(CommandStatus status);

struct CommandResult {
    CommandStatus status = CommandStatus::Failed;
    QString error;

    bool ok() const { return status == CommandStatus::Ok; }

    static CommandResult success() { return { CommandStatus::Ok, QString() }; }
    static CommandResult failure(CommandStatus status, const QString &error) { return { status, error }; }
};

struct PairingResult {
    bool ok = false;
    // HJ phase one finished; the TV shows a PIN.
    bool needsPin = false;
    QString token;
    std::optional<HjIdentity> identity;
    QString error;
    QString hint;
};

struct InfoResult {
    bool ok = false;
    QJsonObject info;
    QString error;
};

// One protocol family. Implementations never block and call back exactly once.
class ProtocolAdapter
{
public:
    using CommandCallback = std::function<void(const CommandResult &)>;
    using PairingCallback = std::function<void(const PairingResult &)>;
    using InfoCallback = std::function<void(const InfoResult &)>;

    virtual ~ProtocolAdapter() = default;

    virtual ApiKind api() const = 0;
    virtual void sendKey(const Device &device, const QString &key, CommandCallback done) = 0;
    // pin is empty for the first HJ phase and for protocols without a PIN.
    virtual void pair(const Device &device, const QString &pin, PairingCallback done) = 0;
    virtual void queryInfo(const Device &device, InfoCallback done) = 0;

    virtual void launchApp(const Device &device, const QString &appId, CommandCallback done)
    {
        Q_UNUSED(appId);
        done(CommandResult::failure(CommandStatus::Unsupported,
                                    QStringLiteral("launchApp only supported for Tizen devices (%1)")
                                        .arg(device.name)));
    }
};

} // namespace phicore::samsungtv::ipc

#pragma once

#include <optional>

#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QString>

#include "tv_types.h"

namespace phicore::samsungtv::ipc {

// Stored for Tizen sets that accepted pairing without issuing a token.
inline constexpr const char kNoTokenSentinel[] = "__no_token__";

struct HjIdentity {
    qint64 sessionId = 0;
    QByteArray aesKey;

    QJsonObject toJson() const;
    static std::optional<HjIdentity> fromJson(const QJsonObject &obj);
};

// Tizen tokens and HJ identities keyed by device id. The serialized blob is
// {"tizen": {id: token}, "hj": {id: identity}}.
class SecretStore
{
public:
    bool load(const QString &blob, QString *error = nullptr);
    QString serialize() const;

    // Raw stored value, possibly the no-token sentinel.
    QString tizenToken(const QString &deviceId) const;
    // Value to put in the channel URL; empty for the sentinel.
    QString tizenAuthToken(const QString &deviceId) const;
    void setTizenToken(const QString &deviceId, const QString &token);

    std::optional<HjIdentity> hjIdentity(const QString &deviceId) const;
    void setHjIdentity(const QString &deviceId, const HjIdentity &identity);

    bool isPaired(const Device &device) const;
    void renameDevice(const QString &oldId, const QString &newId);

private:
    QHash<QString, QString> m_tizen;
    QHash<QString, QJsonObject> m_hj;
};

} // namespace phicore::samsungtv::ipc

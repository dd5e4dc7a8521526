#include "tv_secrets.h"

#include <QJsonDocument>
#include <QJsonParseError>

namespace phicore::samsungtv::ipc {

QJsonObject HjIdentity::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("sessionId"), static_cast<double>(sessionId));
    obj.insert(QStringLiteral("aesKey"), QString::fromLatin1(aesKey.toHex()));
    return obj;
}

std::optional<HjIdentity> HjIdentity::fromJson(const QJsonObject &obj)
{
    const QJsonValue session = obj.value(QStringLiteral("sessionId"));
    const QString key = obj.value(QStringLiteral("aesKey")).toString();
    if (key.isEmpty())
        return std::nullopt;

    HjIdentity identity;
    if (session.isDouble())
        identity.sessionId = static_cast<qint64>(session.toDouble());
    else
        identity.sessionId = session.toString().toLongLong();
    identity.aesKey = QByteArray::fromHex(key.toLatin1());
    if (identity.aesKey.size() != 16)
        return std::nullopt;
    return identity;
}

bool SecretStore::load(const QString &blob, QString *error)
{
    m_tizen.clear();
    m_hj.clear();
    if (blob.trimmed().isEmpty())
        return true;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(blob.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = QStringLiteral("Could not parse stored tokens");
        return false;
    }

    const QJsonObject root = doc.object();
    const QJsonObject tizen = root.value(QStringLiteral("tizen")).toObject();
    for (auto it = tizen.begin(); it != tizen.end(); ++it) {
        const QString token = it.value().toString();
        if (!token.isEmpty())
            m_tizen.insert(it.key(), token);
    }
    const QJsonObject hj = root.value(QStringLiteral("hj")).toObject();
    for (auto it = hj.begin(); it != hj.end(); ++it) {
        if (it.value().isObject())
            m_hj.insert(it.key(), it.value().toObject());
    }
    return true;
}

QString SecretStore::serialize() const
{
    QJsonObject tizen;
    for (auto it = m_tizen.cbegin(); it != m_tizen.cend(); ++it)
        tizen.insert(it.key(), it.value());
    QJsonObject hj;
    for (auto it = m_hj.cbegin(); it != m_hj.cend(); ++it)
        hj.insert(it.key(), it.value());

    QJsonObject root;
    root.insert(QStringLiteral("tizen"), tizen);
    root.insert(QStringLiteral("hj"), hj);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact));
}

QString SecretStore::tizenToken(const QString &deviceId) const
{
    return m_tizen.value(deviceId);
}

QString SecretStore::tizenAuthToken(const QString &deviceId) const
{
    const QString token = m_tizen.value(deviceId);
    return token == QLatin1String(kNoTokenSentinel) ? QString() : token;
}

void SecretStore::setTizenToken(const QString &deviceId, const QString &token)
{
    m_tizen.insert(deviceId, token.isEmpty() ? QString::fromLatin1(kNoTokenSentinel) : token);
}

std::optional<HjIdentity> SecretStore::hjIdentity(const QString &deviceId) const
{
    const auto it = m_hj.constFind(deviceId);
    if (it == m_hj.constEnd())
        return std::nullopt;
    return HjIdentity::fromJson(it.value());
}

void SecretStore::setHjIdentity(const QString &deviceId, const HjIdentity &identity)
{
    m_hj.insert(deviceId, identity.toJson());
}

bool SecretStore::isPaired(const Device &device) const
{
    switch (device.api) {
    case ApiKind::Tizen: {
        const QString token = tizenToken(device.id);
        if (token.isEmpty())
            return false;
        return !(token == QLatin1String(kNoTokenSentinel) && device.tokenAuthSupport == std::optional<bool>(true));
    }
    case ApiKind::Hj:
        return hjIdentity(device.id).has_value();
    case ApiKind::Legacy:
    case ApiKind::Unknown:
        break;
    }
    return false;
}

void SecretStore::renameDevice(const QString &oldId, const QString &newId)
{
    if (oldId == newId)
        return;
    if (m_tizen.contains(oldId))
        m_tizen.insert(newId, m_tizen.take(oldId));
    if (m_hj.contains(oldId))
        m_hj.insert(newId, m_hj.take(oldId));
}

} // namespace phicore::samsungtv::ipc

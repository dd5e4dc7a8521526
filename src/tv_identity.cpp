#include "tv_identity.h"

#include <QRegularExpression>

namespace phicore::samsungtv::ipc {

QString normalizeId(const QString &id)
{
    static const QRegularExpression uuidPrefix(QStringLiteral("^uuid:"),
                                               QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression urnPrefix(QStringLiteral("^urn:uuid:"),
                                              QRegularExpression::CaseInsensitiveOption);
    QString out = id;
    out.remove(uuidPrefix);
    out.remove(urnPrefix);
    return out.trimmed();
}

QString normalizeMac(const QString &mac)
{
    return mac.trimmed().toLower();
}

QString normalizeDeviceId(const QString &id)
{
    const QString norm = normalizeId(id);
    if (looksLikeMac(norm))
        return normalizeMac(norm);
    return norm;
}

bool looksLikeIp(const QString &value)
{
    static const QRegularExpression re(QStringLiteral("^\\d{1,3}(\\.\\d{1,3}){3}$"));
    return re.match(value.trimmed()).hasMatch();
}

bool looksLikeMac(const QString &value)
{
    static const QRegularExpression re(QStringLiteral("^([0-9a-f]{2}:){5}[0-9a-f]{2}$"),
                                       QRegularExpression::CaseInsensitiveOption);
    return re.match(value.trimmed()).hasMatch();
}

QString sanitizeName(const QString &name)
{
    static const QRegularExpression invalid(QStringLiteral("[^a-z0-9\\-_]+"));
    static const QRegularExpression leading(QStringLiteral("^-+"));
    static const QRegularExpression trailing(QStringLiteral("-+$"));
    static const QRegularExpression repeated(QStringLiteral("--+"));

    QString out = name.trimmed().toLower();
    out.replace(invalid, QStringLiteral("-"));
    out.remove(leading);
    out.remove(trailing);
    out.replace(repeated, QStringLiteral("-"));
    return out;
}

QString ensureUniqueName(const QString &desired, const QSet<QString> &taken, const QString &fallbackBase)
{
    QString name = desired;
    if (name.isEmpty())
        name = fallbackBase.isEmpty() ? QStringLiteral("tv") : fallbackBase;
    if (!taken.contains(name))
        return name;

    int suffix = 2;
    while (taken.contains(QStringLiteral("%1-%2").arg(name).arg(suffix)))
        ++suffix;
    return QStringLiteral("%1-%2").arg(name).arg(suffix);
}

QString fallbackName(const QString &id)
{
    const QString base = sanitizeName(id.left(6));
    return base.isEmpty() ? QStringLiteral("tv") : QStringLiteral("tv-%1").arg(base);
}

} // namespace phicore::samsungtv::ipc

#include "tv_types.h"

#include <algorithm>

#include <QJsonArray>
#include <QStringList>

namespace phicore::samsungtv::ipc {

namespace {

void insertIfSet(QJsonObject *obj, const QString &key, const QString &value)
{
    if (!value.isEmpty())
        obj->insert(key, value);
}

std::optional<bool> readOptionalBool(const QJsonObject &obj, const QString &key)
{
    const QJsonValue value = obj.value(key);
    if (value.isBool())
        return value.toBool();
    if (value.isString()) {
        const QString text = value.toString().trimmed().toLower();
        if (text == QLatin1String("true"))
            return true;
        if (text == QLatin1String("false"))
            return false;
    }
    return std::nullopt;
}

} // namespace

QString apiKindToString(ApiKind api)
{
    switch (api) {
    case ApiKind::Tizen:
        return QStringLiteral("tizen");
    case ApiKind::Hj:
        return QStringLiteral("hj");
    case ApiKind::Legacy:
        return QStringLiteral("legacy");
    case ApiKind::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

ApiKind apiKindFromString(const QString &value)
{
    const QString text = value.trimmed().toLower();
    if (text == QLatin1String("tizen"))
        return ApiKind::Tizen;
    if (text == QLatin1String("hj"))
        return ApiKind::Hj;
    if (text == QLatin1String("legacy"))
        return ApiKind::Legacy;
    return ApiKind::Unknown;
}

QJsonObject DiscoveredCandidate::toJson() const
{
    QJsonObject out;
    insertIfSet(&out, QStringLiteral("id"), id);
    insertIfSet(&out, QStringLiteral("ip"), ip);
    insertIfSet(&out, QStringLiteral("mac"), mac);
    insertIfSet(&out, QStringLiteral("name"), name);
    insertIfSet(&out, QStringLiteral("model"), model);
    insertIfSet(&out, QStringLiteral("uuid"), uuid);
    insertIfSet(&out, QStringLiteral("manufacturer"), manufacturer);
    insertIfSet(&out, QStringLiteral("usn"), usn);
    insertIfSet(&out, QStringLiteral("location"), location);
    insertIfSet(&out, QStringLiteral("st"), st);
    insertIfSet(&out, QStringLiteral("server"), server);
    out.insert(QStringLiteral("api"), apiKindToString(api));
    insertIfSet(&out, QStringLiteral("protocol"), protocol);
    if (port > 0)
        out.insert(QStringLiteral("port"), port);
    if (tokenAuthSupport.has_value())
        out.insert(QStringLiteral("tokenAuthSupport"), *tokenAuthSupport);
    if (hjAvailable.has_value())
        out.insert(QStringLiteral("hjAvailable"), *hjAvailable);
    insertIfSet(&out, QStringLiteral("renderingControlUrl"), renderingControlUrl);
    insertIfSet(&out, QStringLiteral("renderingControlEventUrl"), renderingControlEventUrl);

    QStringList sorted(sources.cbegin(), sources.cend());
    std::sort(sorted.begin(), sorted.end());
    out.insert(QStringLiteral("source"), QJsonArray::fromStringList(sorted));
    return out;
}

DiscoveredCandidate DiscoveredCandidate::fromJson(const QJsonObject &obj)
{
    DiscoveredCandidate out;
    out.id = obj.value(QStringLiteral("id")).toString().trimmed();
    out.ip = obj.value(QStringLiteral("ip")).toString().trimmed();
    out.mac = obj.value(QStringLiteral("mac")).toString().trimmed();
    out.name = obj.value(QStringLiteral("name")).toString().trimmed();
    out.model = obj.value(QStringLiteral("model")).toString().trimmed();
    out.uuid = obj.value(QStringLiteral("uuid")).toString().trimmed();
    out.manufacturer = obj.value(QStringLiteral("manufacturer")).toString();
    out.usn = obj.value(QStringLiteral("usn")).toString();
    out.location = obj.value(QStringLiteral("location")).toString();
    out.st = obj.value(QStringLiteral("st")).toString();
    out.server = obj.value(QStringLiteral("server")).toString();
    out.api = apiKindFromString(obj.value(QStringLiteral("api")).toString());
    out.protocol = obj.value(QStringLiteral("protocol")).toString().trimmed();
    out.port = obj.value(QStringLiteral("port")).toVariant().toInt();
    out.tokenAuthSupport = readOptionalBool(obj, QStringLiteral("tokenAuthSupport"));
    out.hjAvailable = readOptionalBool(obj, QStringLiteral("hjAvailable"));
    out.renderingControlUrl = obj.value(QStringLiteral("renderingControlUrl")).toString();
    out.renderingControlEventUrl = obj.value(QStringLiteral("renderingControlEventUrl")).toString();

    const QJsonValue source = obj.value(QStringLiteral("source"));
    if (source.isArray()) {
        for (const QJsonValue &entry : source.toArray()) {
            const QString tag = entry.toString().trimmed();
            if (!tag.isEmpty())
                out.sources.insert(tag);
        }
    } else if (source.isString() && !source.toString().trimmed().isEmpty()) {
        out.sources.insert(source.toString().trimmed());
    }
    return out;
}

} // namespace phicore::samsungtv::ipc

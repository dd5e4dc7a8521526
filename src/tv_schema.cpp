#include "tv_schema.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::samsungtv::ipc {

namespace {

QJsonObject responsive(int xs, int sm, int md, int lg, int xl, int xxl)
{
    QJsonObject out;
    out.insert(QStringLiteral("xs"), xs);
    out.insert(QStringLiteral("sm"), sm);
    out.insert(QStringLiteral("md"), md);
    out.insert(QStringLiteral("lg"), lg);
    out.insert(QStringLiteral("xl"), xl);
    out.insert(QStringLiteral("xxl"), xxl);
    return out;
}

QJsonObject field(const QString &key,
                  const QString &type,
                  const QString &label,
                  const QString &description,
                  const QJsonValue &defaultValue = QJsonValue(),
                  const QJsonArray &flags = {})
{
    QJsonObject out;
    out.insert(QStringLiteral("key"), key);
    out.insert(QStringLiteral("type"), type);
    out.insert(QStringLiteral("label"), label);
    out.insert(QStringLiteral("description"), description);
    if (!defaultValue.isUndefined() && !defaultValue.isNull())
        out.insert(QStringLiteral("default"), defaultValue);
    if (!flags.isEmpty())
        out.insert(QStringLiteral("flags"), flags);
    return out;
}

QJsonArray discoveryFields()
{
    QJsonArray fields;
    fields.append(field(QStringLiteral("autoScan"),
                        QStringLiteral("Boolean"),
                        QStringLiteral("Automatic scan"),
                        QStringLiteral("Search the network for TVs periodically and update known devices."),
                        QJsonValue(false)));
    fields.append(field(QStringLiteral("autoScanInterval"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Scan interval"),
                        QStringLiteral("Seconds between automatic scans (minimum 30)."),
                        QJsonValue(300)));
    fields.append(field(QStringLiteral("discoveryTimeout"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Discovery timeout"),
                        QStringLiteral("Seconds each scan listens for answers (minimum 2)."),
                        QJsonValue(5)));
    fields.append(field(QStringLiteral("enableSsdp"),
                        QStringLiteral("Boolean"),
                        QStringLiteral("SSDP"),
                        QStringLiteral("Discover TVs with SSDP multicast search."),
                        QJsonValue(true)));
    fields.append(field(QStringLiteral("enableMdns"),
                        QStringLiteral("Boolean"),
                        QStringLiteral("mDNS"),
                        QStringLiteral("Discover TVs through the Avahi daemon."),
                        QJsonValue(true)));
    fields.append(field(QStringLiteral("mdnsServices"),
                        QStringLiteral("String"),
                        QStringLiteral("mDNS services"),
                        QStringLiteral("Comma-separated service types to browse."),
                        QJsonValue(QStringLiteral("_samsungmsf._tcp"))));
    return fields;
}

QJsonArray controlFields()
{
    QJsonArray fields;
    fields.append(field(QStringLiteral("pollInterval"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Poll interval"),
                        QStringLiteral("Seconds between status polls (minimum 10)."),
                        QJsonValue(30)));
    fields.append(field(QStringLiteral("enableWol"),
                        QStringLiteral("Boolean"),
                        QStringLiteral("Wake-on-LAN"),
                        QStringLiteral("Power on TVs with a magic packet when the MAC address is known."),
                        QJsonValue(true)));
    fields.append(field(QStringLiteral("clientName"),
                        QStringLiteral("String"),
                        QStringLiteral("Client name"),
                        QStringLiteral("Name shown on the TV when pairing."),
                        QJsonValue(QStringLiteral("phi-core"))));
    fields.append(field(QStringLiteral("hjKeyFile"),
                        QStringLiteral("String"),
                        QStringLiteral("HJ key file"),
                        QStringLiteral("JSON file with the key material used for PIN pairing of 2014/2015 models."),
                        QJsonValue()));

    QJsonArray secretFlags;
    secretFlags.append(QStringLiteral("Secret"));
    fields.append(field(QStringLiteral("tokens"),
                        QStringLiteral("Password"),
                        QStringLiteral("Pairing secrets"),
                        QStringLiteral("Tokens and identities obtained while pairing."),
                        QJsonValue(),
                        secretFlags));
    return fields;
}

QJsonObject section(const QString &title, const QString &description, const QJsonArray &fields)
{
    QJsonObject layout;
    layout.insert(QStringLiteral("gridUnits"), 24);
    QJsonArray gutter;
    gutter.append(12);
    gutter.append(8);
    layout.insert(QStringLiteral("gutter"), gutter);

    QJsonObject defaults;
    defaults.insert(QStringLiteral("span"), responsive(24, 24, 12, 12, 12, 12));
    defaults.insert(QStringLiteral("labelPosition"), QStringLiteral("Left"));
    defaults.insert(QStringLiteral("labelSpan"), 8);
    defaults.insert(QStringLiteral("controlSpan"), 16);
    defaults.insert(QStringLiteral("actionPosition"), QStringLiteral("Inline"));
    defaults.insert(QStringLiteral("actionSpan"), 6);
    layout.insert(QStringLiteral("defaults"), defaults);

    QJsonObject out;
    out.insert(QStringLiteral("title"), title);
    out.insert(QStringLiteral("description"), description);
    out.insert(QStringLiteral("layout"), layout);
    out.insert(QStringLiteral("fields"), fields);
    return out;
}

} // namespace

phicore::adapter::v1::Utf8String displayName()
{
    return "Samsung TV";
}

phicore::adapter::v1::Utf8String description()
{
    return "Discovers and controls Samsung televisions (Tizen, HJ and legacy remotes)";
}

phicore::adapter::v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"Television\">"
        "<rect x=\"2\" y=\"4\" width=\"20\" height=\"13\" rx=\"2\" fill=\"none\" stroke=\"#1428A0\" stroke-width=\"1.8\"/>"
        "<path d=\"M8 20h8\" stroke=\"#1428A0\" stroke-width=\"1.8\" stroke-linecap=\"round\"/>"
        "<path d=\"M12 17v3\" stroke=\"#1428A0\" stroke-width=\"1.8\"/>"
        "</svg>";
}

phicore::adapter::v1::AdapterCapabilities capabilities()
{
    namespace v1 = phicore::adapter::v1;

    v1::AdapterCapabilities caps;
    caps.flags = v1::AdapterFlag::SupportsRename
        | v1::AdapterFlag::RequiresPolling;

    v1::AdapterActionDescriptor discover;
    discover.id = "discover";
    discover.label = "Search for TVs";
    discover.description = "Scan the local network with SSDP and mDNS.";
    discover.metaJson = R"({"placement":"card","kind":"command","requiresAck":true,"params":{"timeout":"Integer"}})";
    caps.instanceActions.push_back(discover);

    v1::AdapterActionDescriptor discovered;
    discovered.id = "getDiscovered";
    discovered.label = "Last scan result";
    discovered.description = "TVs found by the most recent scan.";
    discovered.metaJson = R"({"placement":"card","kind":"command"})";
    caps.instanceActions.push_back(discovered);

    v1::AdapterActionDescriptor pair;
    pair.id = "pair";
    pair.label = "Pair TV";
    pair.description = "Request remote-control access. HJ models answer with a PIN prompt first.";
    pair.metaJson = R"({"placement":"card","kind":"command","requiresAck":true,"params":{"id":"String","pin":"String"}})";
    caps.instanceActions.push_back(pair);

    v1::AdapterActionDescriptor add;
    add.id = "addDevice";
    add.label = "Add TV";
    add.description = "Add a discovered TV to the configured devices.";
    add.metaJson = R"({"placement":"card","kind":"command","requiresAck":true,"params":{"ip":"String","name":"String"}})";
    caps.instanceActions.push_back(add);

    caps.defaultsJson = R"({"pollInterval":30,"autoScan":false,"autoScanInterval":300,"discoveryTimeout":5,)"
                        R"("enableSsdp":true,"enableMdns":true,"mdnsServices":"_samsungmsf._tcp",)"
                        R"("enableWol":true,"clientName":"phi-core"})";
    return caps;
}

phicore::adapter::v1::JsonText configSchemaJson()
{
    QJsonArray fields = controlFields();
    for (const QJsonValue &value : discoveryFields())
        fields.append(value);

    QJsonObject schema;
    schema.insert(QStringLiteral("factory"),
                  section(QStringLiteral("Samsung TV"),
                          QStringLiteral("Control Samsung televisions on the local network."),
                          fields));
    schema.insert(QStringLiteral("instance"),
                  section(QStringLiteral("Samsung TV"),
                          QStringLiteral("Control Samsung televisions on the local network."),
                          fields));

    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::samsungtv::ipc

#include "tv_keys.h"

#include <QHash>
#include <QRegularExpression>

namespace phicore::samsungtv::ipc {

namespace {

const QHash<QString, QString> &friendlyKeys()
{
    static const QHash<QString, QString> map = {
        { QStringLiteral("up"), QStringLiteral("KEY_UP") },
        { QStringLiteral("arrowup"), QStringLiteral("KEY_UP") },
        { QStringLiteral("down"), QStringLiteral("KEY_DOWN") },
        { QStringLiteral("arrowdown"), QStringLiteral("KEY_DOWN") },
        { QStringLiteral("left"), QStringLiteral("KEY_LEFT") },
        { QStringLiteral("arrowleft"), QStringLiteral("KEY_LEFT") },
        { QStringLiteral("right"), QStringLiteral("KEY_RIGHT") },
        { QStringLiteral("arrowright"), QStringLiteral("KEY_RIGHT") },
        { QStringLiteral("enter"), QStringLiteral("KEY_ENTER") },
        { QStringLiteral("ok"), QStringLiteral("KEY_ENTER") },
        { QStringLiteral("back"), QStringLiteral("KEY_RETURN") },
        { QStringLiteral("return"), QStringLiteral("KEY_RETURN") },
        { QStringLiteral("home"), QStringLiteral("KEY_HOME") },
        { QStringLiteral("source"), QStringLiteral("KEY_SOURCE") },
        { QStringLiteral("menu"), QStringLiteral("KEY_MENU") },
        { QStringLiteral("info"), QStringLiteral("KEY_INFO") },
        { QStringLiteral("guide"), QStringLiteral("KEY_GUIDE") },
        { QStringLiteral("exit"), QStringLiteral("KEY_EXIT") },
        { QStringLiteral("volup"), QStringLiteral("KEY_VOLUP") },
        { QStringLiteral("volumeup"), QStringLiteral("KEY_VOLUP") },
        { QStringLiteral("voldown"), QStringLiteral("KEY_VOLDOWN") },
        { QStringLiteral("volumedown"), QStringLiteral("KEY_VOLDOWN") },
        { QStringLiteral("mute"), QStringLiteral("KEY_MUTE") },
        { QStringLiteral("chup"), QStringLiteral("KEY_CHUP") },
        { QStringLiteral("channelup"), QStringLiteral("KEY_CHUP") },
        { QStringLiteral("chdown"), QStringLiteral("KEY_CHDOWN") },
        { QStringLiteral("channeldown"), QStringLiteral("KEY_CHDOWN") },
        { QStringLiteral("play"), QStringLiteral("KEY_PLAY") },
        { QStringLiteral("pause"), QStringLiteral("KEY_PAUSE") },
        { QStringLiteral("stop"), QStringLiteral("KEY_STOP") },
        { QStringLiteral("rewind"), QStringLiteral("KEY_REWIND") },
        { QStringLiteral("ff"), QStringLiteral("KEY_FF") },
        { QStringLiteral("fastforward"), QStringLiteral("KEY_FF") },
        { QStringLiteral("record"), QStringLiteral("KEY_REC") },
        { QStringLiteral("red"), QStringLiteral("KEY_RED") },
        { QStringLiteral("green"), QStringLiteral("KEY_GREEN") },
        { QStringLiteral("yellow"), QStringLiteral("KEY_YELLOW") },
        { QStringLiteral("blue"), QStringLiteral("KEY_BLUE") },
        { QStringLiteral("0"), QStringLiteral("KEY_0") },
        { QStringLiteral("1"), QStringLiteral("KEY_1") },
        { QStringLiteral("2"), QStringLiteral("KEY_2") },
        { QStringLiteral("3"), QStringLiteral("KEY_3") },
        { QStringLiteral("4"), QStringLiteral("KEY_4") },
        { QStringLiteral("5"), QStringLiteral("KEY_5") },
        { QStringLiteral("6"), QStringLiteral("KEY_6") },
        { QStringLiteral("7"), QStringLiteral("KEY_7") },
        { QStringLiteral("8"), QStringLiteral("KEY_8") },
        { QStringLiteral("9"), QStringLiteral("KEY_9") },
    };
    return map;
}

} // namespace

QString normalizeKeyInput(const QString &input)
{
    const QString raw = input.trimmed();
    if (raw.isEmpty())
        return {};

    const QString upper = raw.toUpper();
    if (upper.startsWith(QLatin1String("KEY_")))
        return upper;

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    QString compact = raw.toLower();
    compact.remove(whitespace);
    return friendlyKeys().value(compact, upper);
}

QString sourceKey(const QString &source)
{
    const QString upper = source.trimmed().toUpper();
    if (upper.isEmpty())
        return {};
    if (upper.startsWith(QLatin1String("KEY_")))
        return upper;
    return QStringLiteral("KEY_") + upper;
}

bool isPowerKey(const QString &key)
{
    return key == QLatin1String("KEY_POWER")
        || key == QLatin1String("KEY_POWEROFF")
        || key == QLatin1String("KEY_POWERON");
}

bool isTruthyValue(const QVariant &value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        return value.toBool();
    case QMetaType::Int:
    case QMetaType::LongLong:
    case QMetaType::UInt:
    case QMetaType::ULongLong:
        return value.toLongLong() == 1;
    case QMetaType::Double:
        return value.toDouble() == 1.0;
    case QMetaType::QString:
        return value.toString() == QLatin1String("true");
    default:
        break;
    }
    return false;
}

} // namespace phicore::samsungtv::ipc

#include "tv_log.h"

#include <QRegularExpression>

Q_LOGGING_CATEGORY(tvLog, "phi-core.adapters.samsungtv")

namespace phicore::samsungtv::ipc {

QString maskToken(const QString &url)
{
    static const QRegularExpression re(QStringLiteral("([?&]token=)[^&]*"));
    QString out = url;
    out.replace(re, QStringLiteral("\\1***"));
    return out;
}

} // namespace phicore::samsungtv::ipc

#include "identifiers.h"
#include <QDateTime>
#include <QUuid>

namespace wire_ids {

QString generateChatId()
{
    return QStringLiteral("chatcmpl-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

qint64 currentTimestamp()
{
    return QDateTime::currentSecsSinceEpoch();
}

}

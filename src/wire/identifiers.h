#pragma once
#include <QString>
#include <QtGlobal>

namespace wire_ids {

// "chatcmpl-" + random (v4) UUID. Safe to call from any thread.
QString generateChatId();

qint64 currentTimestamp();

}

#pragma once
#include "gateway/cors_policy.h"
#include <QTcpSocket>
#include <QByteArray>

class SseWriter {
public:
    // HTTP/1.1 streams are chunked. HTTP/1.0 has no chunked coding, so the
    // stream ends when the connection closes.
    enum class Transfer { Chunked, CloseDelimited };

    static void writeStreamHeader(QTcpSocket* socket, Transfer transfer, bool keepAlive,
                                  const HeaderList& extraHeaders = {});
    static void sendEvent(QTcpSocket* socket, const QByteArray& json, Transfer transfer);
    static void sendDone(QTcpSocket* socket, Transfer transfer);
    // Zero-length chunk; nothing to write for a close-delimited stream.
    static void sendTerminator(QTcpSocket* socket, Transfer transfer);

    static QByteArray frame(const QByteArray& json);

private:
    static QByteArray wrapChunked(const QByteArray& data);
    static QByteArray encode(const QByteArray& data, Transfer transfer);
};

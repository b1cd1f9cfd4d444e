#include "sse_writer.h"
#include "core/log_manager.h"

namespace {

bool writable(QTcpSocket* socket, const char* what)
{
    if (socket && socket->state() == QAbstractSocket::ConnectedState)
        return true;
    LOG_DEBUG(QStringLiteral("SseWriter: cannot send %1, socket not connected")
                  .arg(QLatin1String(what)));
    return false;
}

}

void SseWriter::writeStreamHeader(QTcpSocket* socket, Transfer transfer, bool keepAlive,
                                  const HeaderList& extraHeaders)
{
    if (!writable(socket, "stream header"))
        return;

    QByteArray header =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n";
    header += keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    if (transfer == Transfer::Chunked)
        header += "Transfer-Encoding: chunked\r\n";
    for (const auto& [name, value] : extraHeaders)
        header += name + ": " + value + "\r\n";
    header += "\r\n";

    socket->write(header);
    socket->flush();
}

QByteArray SseWriter::wrapChunked(const QByteArray& data)
{
    // HTTP/1.1 chunked transfer encoding:
    //   <hex-length>\r\n
    //   <data>\r\n
    QByteArray chunk;
    chunk.append(QByteArray::number(data.size(), 16));
    chunk.append("\r\n");
    chunk.append(data);
    chunk.append("\r\n");
    return chunk;
}

QByteArray SseWriter::encode(const QByteArray& data, Transfer transfer)
{
    return transfer == Transfer::Chunked ? wrapChunked(data) : data;
}

QByteArray SseWriter::frame(const QByteArray& json)
{
    return QByteArray("data: ") + json + "\n\n";
}

void SseWriter::sendEvent(QTcpSocket* socket, const QByteArray& json, Transfer transfer)
{
    if (!writable(socket, "event"))
        return;
    socket->write(encode(frame(json), transfer));
    socket->flush();
}

void SseWriter::sendDone(QTcpSocket* socket, Transfer transfer)
{
    if (!writable(socket, "done"))
        return;
    socket->write(encode(frame("[DONE]"), transfer));
    socket->flush();
}

void SseWriter::sendTerminator(QTcpSocket* socket, Transfer transfer)
{
    if (transfer != Transfer::Chunked || !writable(socket, "terminator"))
        return;

    // The zero-length chunk signals end of chunked transfer
    socket->write("0\r\n\r\n");
    socket->flush();
}

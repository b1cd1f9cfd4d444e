#include "gateway_server.h"
#include "sse_writer.h"
#include "core/log_manager.h"
#include "gateway/ports.h"
#include "gateway/rate_limiter.h"
#include "providers/provider.h"
#include "streaming/stream_emulator.h"
#include "wire/codec.h"

#include <QHostAddress>
#include <QJsonObject>
#include <QPointer>

namespace {

constexpr qsizetype kMaxHeaderBytes = 64 * 1024;

QByteArray errorBody(const GatewayError& error)
{
    return wire_codec::toCompactJson(error.toJson());
}

}

// ========================================================================
// Construction / destruction
// ========================================================================

GatewayServer::GatewayServer(const GatewayConfig& config,
                             IBackendExecutor& executor,
                             const Provider& provider,
                             RateLimiter& rateLimiter,
                             QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_executor(executor)
    , m_provider(provider)
    , m_rateLimiter(rateLimiter)
    , m_cors(config.proxy.allowedOrigins)
{
    m_router.registerDefaults();
}

GatewayServer::~GatewayServer()
{
    stop();
}

// ========================================================================
// start / stop
// ========================================================================

bool GatewayServer::start()
{
    if (m_server)
        stop();

    QHostAddress address;
    if (m_config.proxy.host == QStringLiteral("localhost"))
        address = QHostAddress::LocalHost;
    else if (!address.setAddress(m_config.proxy.host)) {
        LOG_ERROR(QStringLiteral("GatewayServer: '%1' is not an IP address").arg(m_config.proxy.host));
        return false;
    }

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::pendingConnectionAvailable,
            this, &GatewayServer::onNewConnection);

    const quint16 port = static_cast<quint16>(m_config.proxy.port);
    if (!m_server->listen(address, port)) {
        LOG_ERROR(QStringLiteral("GatewayServer: failed to listen on %1:%2 - %3")
                      .arg(m_config.proxy.host)
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("GatewayServer: listening on %1:%2 (provider %3)")
                 .arg(m_config.proxy.host)
                 .arg(m_server->serverPort())
                 .arg(m_provider.id()));
    emit statusChanged(true);
    return true;
}

void GatewayServer::stop()
{
    if (!m_server)
        return;

    // Closing a socket deletes it, its request contexts and their pending
    // backend calls and stream timers.
    const QList<QTcpSocket*> sockets = m_pendingData.keys();
    for (QTcpSocket* socket : sockets)
        socket->abort();
    m_pendingData.clear();
    m_busy.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("GatewayServer: stopped"));
    emit statusChanged(false);
}

bool GatewayServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 GatewayServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Connection handling
// ========================================================================

void GatewayServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket)
            continue;

        m_pendingData.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &GatewayServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &GatewayServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("GatewayServer: connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void GatewayServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket)
        return;

    m_pendingData[socket] += socket->readAll();
    processBuffer(socket);
}

void GatewayServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket)
        return;

    m_pendingData.remove(socket);
    if (m_busy.remove(socket))
        LOG_INFO(QStringLiteral("GatewayServer: client disconnected mid-request, cancelling"));
    else
        LOG_DEBUG(QStringLiteral("GatewayServer: client disconnected"));

    socket->deleteLater();
}

void GatewayServer::processBuffer(QTcpSocket* socket)
{
    // One exchange at a time per connection; pipelined requests wait.
    while (!m_busy.contains(socket) && socket->state() == QAbstractSocket::ConnectedState) {
        QByteArray& buffer = m_pendingData[socket];

        const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            if (buffer.size() > kMaxHeaderBytes) {
                buffer.clear();
                sendError(socket, GatewayError::payloadTooLarge(QStringLiteral("header block too large")),
                          {}, false);
            }
            return;
        }

        std::optional<HttpRequest> parsed = parseHttpRequest(buffer.left(headerEnd));
        if (!parsed) {
            buffer.clear();
            sendError(socket, GatewayError::invalidInput(QStringLiteral("Malformed HTTP request")),
                      {}, false);
            return;
        }
        HttpRequest request = std::move(*parsed);

        if (request.headers.value(QStringLiteral("transfer-encoding"))
                .contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
            buffer.clear();
            sendError(socket, GatewayError::notSupported(QStringLiteral("chunked request body")),
                      {}, false);
            return;
        }

        qint64 contentLength = 0;
        if (request.headers.contains(QStringLiteral("content-length"))) {
            bool ok = false;
            contentLength = request.headers.value(QStringLiteral("content-length")).toLongLong(&ok);
            if (!ok || contentLength < 0) {
                buffer.clear();
                sendError(socket, GatewayError::invalidInput(QStringLiteral("Invalid Content-Length header")),
                          {}, false);
                return;
            }
        }

        if (contentLength > m_config.proxy.maxBodyBytes) {
            LOG_WARNING(QStringLiteral("GatewayServer: %1 %2 body of %3 bytes exceeds limit %4")
                            .arg(request.method, request.path)
                            .arg(contentLength)
                            .arg(m_config.proxy.maxBodyBytes));
            buffer.clear();
            sendError(socket, GatewayError::payloadTooLarge(QStringLiteral("body too large")), {}, false);
            return;
        }

        const qint64 bodyStart = headerEnd + 4;
        if (buffer.size() < bodyStart + contentLength)
            return;

        request.body = buffer.mid(bodyStart, contentLength);
        buffer.remove(0, bodyStart + contentLength);

        m_busy.insert(socket);
        handleRequest(socket, request);
    }
}

std::optional<GatewayServer::HttpRequest> GatewayServer::parseHttpRequest(const QByteArray& head)
{
    const QStringList lines = QString::fromUtf8(head).split(QStringLiteral("\r\n"));
    if (lines.isEmpty())
        return std::nullopt;

    // Request line: "METHOD PATH HTTP/1.1"
    const QStringList parts = lines.first().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() != 3 || !parts[2].startsWith(QStringLiteral("HTTP/1.")))
        return std::nullopt;

    HttpRequest req;
    req.method = parts[0].trimmed().toUpper();
    req.httpVersion = parts[2];

    // Routing ignores the query string.
    req.path = parts[1].section(QLatin1Char('?'), 0, 0);
    if (req.path.isEmpty() || !req.path.startsWith(QLatin1Char('/')))
        return std::nullopt;

    for (int i = 1; i < lines.size(); ++i) {
        const int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon <= 0)
            continue;
        const QString key = lines[i].left(colon).trimmed().toLower();
        const QString value = lines[i].mid(colon + 1).trimmed();
        req.headers[key] = value;
    }

    const QString connection = req.headers.value(QStringLiteral("connection")).toLower();
    if (req.httpVersion == QStringLiteral("HTTP/1.0"))
        req.keepAlive = connection.contains(QStringLiteral("keep-alive"));
    else
        req.keepAlive = !connection.contains(QStringLiteral("close"));

    return req;
}

// ========================================================================
// handleRequest: admission control, CORS, routing
// ========================================================================

void GatewayServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO(QStringLiteral("GatewayServer: %1 %2").arg(request.method, request.path));

    if (!m_rateLimiter.tryAcquire()) {
        LOG_WARNING(QStringLiteral("GatewayServer: rate limit exceeded for %1 %2")
                        .arg(request.method, request.path));
        sendError(socket, GatewayError::rateLimited(QStringLiteral("token bucket empty")),
                  {}, request.keepAlive);
        return;
    }

    const QString origin = request.headers.value(QStringLiteral("origin"));
    HeaderList corsHeaders;
    switch (m_cors.evaluate(origin)) {
    case CorsPolicy::Verdict::NotCrossOrigin:
        break;
    case CorsPolicy::Verdict::Allowed:
        corsHeaders = CorsPolicy::responseHeaders(origin, false);
        break;
    case CorsPolicy::Verdict::Rejected:
        LOG_WARNING(QStringLiteral("GatewayServer: origin '%1' not allowed").arg(origin));
        sendError(socket, GatewayError::forbidden(origin), {}, request.keepAlive);
        return;
    }

    auto route = m_router.match(request.method, request.path);
    if (!route) {
        HeaderList headers = corsHeaders;
        if (route.error().kind == ErrorKind::MethodNotAllowed) {
            QStringList methods = m_router.allowedMethods(request.path);
            methods.append(QStringLiteral("OPTIONS"));
            headers.append({"Allow", methods.join(QStringLiteral(", ")).toUtf8()});
        }
        LOG_INFO(QStringLiteral("GatewayServer: no route for %1").arg(route.error().message));
        sendError(socket, route.error(), headers, request.keepAlive);
        return;
    }

    switch (route->target) {
    case RouteTarget::ChatCompletions:
        handleChatCompletions(socket, request, corsHeaders);
        break;
    case RouteTarget::Models:
        handleModels(socket, request, corsHeaders);
        break;
    case RouteTarget::Health:
        handleHealth(socket, request, corsHeaders);
        break;
    case RouteTarget::Preflight:
        handlePreflight(socket, request);
        break;
    }
}

// ========================================================================
// Route handlers
// ========================================================================

void GatewayServer::handleChatCompletions(QTcpSocket* socket, const HttpRequest& request,
                                          const HeaderList& corsHeaders)
{
    auto decoded = wire_codec::decodeChatRequest(request.body);
    if (!decoded) {
        LOG_INFO(QStringLiteral("GatewayServer: rejected chat request: %1").arg(decoded.error().message));
        sendError(socket, decoded.error(), corsHeaders, request.keepAlive);
        return;
    }
    const ChatRequest chat = std::move(*decoded);
    const bool keepAlive = request.keepAlive;
    const SseWriter::Transfer transfer = request.httpVersion == QStringLiteral("HTTP/1.0")
        ? SseWriter::Transfer::CloseDelimited : SseWriter::Transfer::Chunked;
    // A close-delimited stream ends the connection with it.
    const bool streamKeepAlive = keepAlive && transfer == SseWriter::Transfer::Chunked;

    LOG_INFO(QStringLiteral("GatewayServer: chat completion model=%1 messages=%2 stream=%3")
                 .arg(chat.model)
                 .arg(chat.messages.size())
                 .arg(chat.isStreaming() ? QStringLiteral("true") : QStringLiteral("false")));

    // Owned by the socket: a disconnect destroys it, which cancels the
    // backend call and any stream still pacing.
    auto* context = new QObject(socket);

    if (!chat.isStreaming()) {
        m_provider.handleRequest(m_executor, m_config, chat, context,
                                 [this, socket, context, corsHeaders, keepAlive](Result<ChatResponse> response) {
            context->deleteLater();
            if (!response) {
                sendError(socket, response.error(), corsHeaders, keepAlive);
                return;
            }
            sendHttpResponse(socket, 200,
                             wire_codec::toCompactJson(wire_codec::encodeChatResponse(*response)),
                             corsHeaders, keepAlive);
        });
        return;
    }

    m_provider.fetchBackendPayload(m_executor, m_config, chat, context,
                                   [this, socket, context, corsHeaders, keepAlive, transfer, streamKeepAlive,
                                    model = chat.model](Result<BackendPayload> payload) {
        if (!payload) {
            context->deleteLater();
            sendError(socket, payload.error(), corsHeaders, keepAlive);
            return;
        }

        auto text = m_provider.extractStreamingText(*payload);
        if (!text) {
            LOG_ERROR(QStringLiteral("[%1] %2").arg(m_provider.id(), text.error().message));
            context->deleteLater();
            sendError(socket, text.error(), corsHeaders, keepAlive);
            return;
        }

        auto* emulator = new StreamEmulator(*text, model, m_config.proxy.streamDelayMs, context);
        connect(emulator, &StreamEmulator::chunkReady, socket, [socket, transfer](const QByteArray& json) {
            SseWriter::sendEvent(socket, json, transfer);
        });
        connect(emulator, &StreamEmulator::finished, this, [this, socket, context, transfer, streamKeepAlive]() {
            SseWriter::sendDone(socket, transfer);
            SseWriter::sendTerminator(socket, transfer);
            LOG_DEBUG(QStringLiteral("GatewayServer: stream complete"));
            context->deleteLater();
            finishExchange(socket, streamKeepAlive);
        });

        SseWriter::writeStreamHeader(socket, transfer, streamKeepAlive, corsHeaders);
        emulator->start();
    });
}

void GatewayServer::handleModels(QTcpSocket* socket, const HttpRequest& request,
                                 const HeaderList& corsHeaders)
{
    const QJsonObject listing = wire_codec::encodeModelList(m_config.models);
    sendHttpResponse(socket, 200, wire_codec::toCompactJson(listing), corsHeaders, request.keepAlive);
}

void GatewayServer::handleHealth(QTcpSocket* socket, const HttpRequest& request,
                                 const HeaderList& corsHeaders)
{
    QJsonObject status;
    status.insert(QStringLiteral("status"), QStringLiteral("ok"));
    sendHttpResponse(socket, 200, wire_codec::toCompactJson(status), corsHeaders, request.keepAlive);
}

void GatewayServer::handlePreflight(QTcpSocket* socket, const HttpRequest& request)
{
    const QString origin = request.headers.value(QStringLiteral("origin"));
    HeaderList headers;
    if (m_cors.evaluate(origin) == CorsPolicy::Verdict::Allowed)
        headers = CorsPolicy::responseHeaders(origin, true);
    sendHttpResponse(socket, 204, QByteArray(), headers, request.keepAlive);
}

// ========================================================================
// Responses
// ========================================================================

void GatewayServer::sendError(QTcpSocket* socket, const GatewayError& error,
                              const HeaderList& extraHeaders, bool keepAlive)
{
    if (error.httpStatus() >= 500)
        LOG_ERROR(QStringLiteral("GatewayServer: responding %1 %2: %3")
                      .arg(error.httpStatus()).arg(error.typeTag(), error.message));
    sendHttpResponse(socket, error.httpStatus(), errorBody(error), extraHeaders, keepAlive);
}

void GatewayServer::sendHttpResponse(QTcpSocket* socket, int status,
                                     const QByteArray& body,
                                     const HeaderList& extraHeaders,
                                     bool keepAlive,
                                     const QString& contentType)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        finishExchange(socket, false);
        return;
    }

    static const QMap<int, QString> statusTexts = {
        {200, QStringLiteral("OK")},
        {204, QStringLiteral("No Content")},
        {400, QStringLiteral("Bad Request")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {405, QStringLiteral("Method Not Allowed")},
        {413, QStringLiteral("Payload Too Large")},
        {429, QStringLiteral("Too Many Requests")},
        {500, QStringLiteral("Internal Server Error")},
        {501, QStringLiteral("Not Implemented")},
        {502, QStringLiteral("Bad Gateway")},
        {504, QStringLiteral("Gateway Timeout")}
    };

    const QString statusText = statusTexts.value(status, QStringLiteral("Unknown"));

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 %2\r\n").arg(status).arg(statusText).toUtf8());
    if (status != 204) {
        response.append(QStringLiteral("Content-Type: %1\r\n").arg(contentType).toUtf8());
        response.append(QStringLiteral("Content-Length: %1\r\n").arg(body.size()).toUtf8());
    }
    for (const auto& [name, value] : extraHeaders)
        response.append(name + ": " + value + "\r\n");
    response.append(keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
    response.append("\r\n");
    response.append(body);

    socket->write(response);
    socket->flush();
    finishExchange(socket, keepAlive);
}

void GatewayServer::finishExchange(QTcpSocket* socket, bool keepAlive)
{
    if (!socket)
        return;
    m_busy.remove(socket);

    if (!keepAlive) {
        m_pendingData.remove(socket);
        socket->disconnectFromHost();
        return;
    }

    // Queued so a pipelined request never runs inside the previous one's
    // completion handler.
    QPointer<QTcpSocket> guard(socket);
    QMetaObject::invokeMethod(this, [this, guard]() {
        if (guard && m_pendingData.contains(guard) && !m_pendingData.value(guard).isEmpty())
            processBuffer(guard);
    }, Qt::QueuedConnection);
}

#pragma once
#include "request_router.h"
#include "config/config_types.h"
#include "gateway/cors_policy.h"
#include "gateway/failure.h"
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QMap>
#include <QSet>

class IBackendExecutor;
class Provider;
class RateLimiter;

class GatewayServer : public QObject {
    Q_OBJECT
public:
    // All collaborators are owned by the caller and must outlive the server.
    GatewayServer(const GatewayConfig& config,
                  IBackendExecutor& executor,
                  const Provider& provider,
                  RateLimiter& rateLimiter,
                  QObject* parent = nullptr);
    ~GatewayServer() override;

    bool start();
    void stop();
    bool isRunning() const;
    // Bound port; differs from the configured one when that was 0.
    quint16 serverPort() const;

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    struct HttpRequest {
        QString method, path, httpVersion;
        QMap<QString, QString> headers;
        QByteArray body;
        bool keepAlive = true;
    };

    void processBuffer(QTcpSocket* socket);
    static std::optional<HttpRequest> parseHttpRequest(const QByteArray& head);

    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void handleChatCompletions(QTcpSocket* socket, const HttpRequest& request,
                               const HeaderList& corsHeaders);
    void handleModels(QTcpSocket* socket, const HttpRequest& request,
                      const HeaderList& corsHeaders);
    void handleHealth(QTcpSocket* socket, const HttpRequest& request,
                      const HeaderList& corsHeaders);
    void handlePreflight(QTcpSocket* socket, const HttpRequest& request);

    void sendHttpResponse(QTcpSocket* socket, int status,
                          const QByteArray& body,
                          const HeaderList& extraHeaders = {},
                          bool keepAlive = true,
                          const QString& contentType = QStringLiteral("application/json"));
    void sendError(QTcpSocket* socket, const GatewayError& error,
                   const HeaderList& extraHeaders = {}, bool keepAlive = true);
    void finishExchange(QTcpSocket* socket, bool keepAlive);

    const GatewayConfig& m_config;
    IBackendExecutor& m_executor;
    const Provider& m_provider;
    RateLimiter& m_rateLimiter;
    CorsPolicy m_cors;
    RequestRouter m_router;

    QTcpServer* m_server = nullptr;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
    QSet<QTcpSocket*> m_busy;   // sockets with an exchange in flight
};

#include <QTest>
#include <QMap>
#include <QTcpServer>
#include <QTcpSocket>
#include <QElapsedTimer>
#include <QSslConfiguration>
#include "gateway/qt_executor.h"
#include <optional>

// Minimal HTTP/1.1 peer: answers each complete request with a canned
// response, or never answers when `silent` is set.
class CannedHttpServer : public QObject {
    Q_OBJECT
public:
    QByteArray response;
    bool silent = false;
    QByteArray lastRequest;

    explicit CannedHttpServer(QObject* parent = nullptr) : QObject(parent) {
        connect(&m_server, &QTcpServer::newConnection, this, [this]() {
            while (QTcpSocket* socket = m_server.nextPendingConnection()) {
                connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
                connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            }
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    QUrl url(const QString& path = QStringLiteral("/v1/infer")) const {
        return QUrl(QStringLiteral("http://127.0.0.1:%1%2").arg(m_server.serverPort()).arg(path));
    }

private:
    void onReadyRead(QTcpSocket* socket) {
        QByteArray& buffer = m_buffers[socket];
        buffer.append(socket->readAll());

        const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0)
            return;
        qsizetype contentLength = 0;
        for (const QByteArray& line : buffer.left(headerEnd).split('\n')) {
            if (line.trimmed().toLower().startsWith("content-length:"))
                contentLength = line.mid(line.indexOf(':') + 1).trimmed().toLongLong();
        }
        if (buffer.size() < headerEnd + 4 + contentLength)
            return;

        lastRequest = buffer;
        m_buffers.remove(socket);
        if (silent)
            return;
        socket->write(response);
        socket->flush();
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QMap<QTcpSocket*, QByteArray> m_buffers;
};

class TestQtExecutor : public QObject {
    Q_OBJECT

private:
    static BackendRequest requestTo(const QUrl& url) {
        BackendRequest request;
        request.url = url;
        request.headers.insert(QStringLiteral("X-Request-Source"), QStringLiteral("clad-test"));
        request.body = QByteArrayLiteral("{\"question\":\"hi\"}");
        return request;
    }

private slots:
    void testSuccessfulReply() {
        CannedHttpServer server;
        QVERIFY(server.listen());
        server.response = QByteArrayLiteral(
            "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
            "Content-Length: 11\r\nConnection: close\r\n\r\n{\"ok\":true}");

        QtBackendExecutor executor(QSslConfiguration::defaultConfiguration(), 5000);
        std::optional<Result<BackendReply>> outcome;
        executor.post(requestTo(server.url()), this,
                      [&outcome](Result<BackendReply> reply) { outcome = std::move(reply); });

        QTRY_VERIFY_WITH_TIMEOUT(outcome.has_value(), 5000);
        QVERIFY(outcome->has_value());
        QCOMPARE((*outcome)->statusCode, 200);
        QVERIFY((*outcome)->isSuccess());
        QCOMPARE((*outcome)->body, QByteArrayLiteral("{\"ok\":true}"));

        QVERIFY(server.lastRequest.startsWith("POST /v1/infer "));
        QVERIFY(server.lastRequest.contains("X-Request-Source: clad-test"));
        QVERIFY(server.lastRequest.toLower().contains("content-type: application/json"));
        QVERIFY(server.lastRequest.endsWith("{\"question\":\"hi\"}"));
    }

    void testNon2xxIsAReply() {
        CannedHttpServer server;
        QVERIFY(server.listen());
        server.response = QByteArrayLiteral(
            "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 9\r\n"
            "Connection: close\r\n\r\noverload!");

        QtBackendExecutor executor(QSslConfiguration::defaultConfiguration(), 5000);
        std::optional<Result<BackendReply>> outcome;
        executor.post(requestTo(server.url()), this,
                      [&outcome](Result<BackendReply> reply) { outcome = std::move(reply); });

        QTRY_VERIFY_WITH_TIMEOUT(outcome.has_value(), 5000);
        QVERIFY(outcome->has_value());
        QCOMPARE((*outcome)->statusCode, 503);
        QVERIFY(!(*outcome)->isSuccess());
        QCOMPARE((*outcome)->body, QByteArrayLiteral("overload!"));
    }

    void testTimeout() {
        CannedHttpServer server;
        QVERIFY(server.listen());
        server.silent = true;

        QtBackendExecutor executor(QSslConfiguration::defaultConfiguration(), 200);
        std::optional<Result<BackendReply>> outcome;
        QElapsedTimer elapsed;
        elapsed.start();
        executor.post(requestTo(server.url()), this,
                      [&outcome](Result<BackendReply> reply) { outcome = std::move(reply); });

        QTRY_VERIFY_WITH_TIMEOUT(outcome.has_value(), 5000);
        QVERIFY(!outcome->has_value());
        QCOMPARE(outcome->error().kind, ErrorKind::Timeout);
        QCOMPARE(outcome->error().httpStatus(), 504);
        QVERIFY2(outcome->error().message.contains(QStringLiteral("exceeded 200 ms")),
                 qPrintable(outcome->error().message));
        QVERIFY(elapsed.elapsed() >= 150);
        QVERIFY(elapsed.elapsed() < 3000);
    }

    void testConnectionRefused() {
        QTcpServer reserved;
        QVERIFY(reserved.listen(QHostAddress::LocalHost));
        const quint16 port = reserved.serverPort();
        reserved.close();

        QtBackendExecutor executor(QSslConfiguration::defaultConfiguration(), 5000);
        std::optional<Result<BackendReply>> outcome;
        executor.post(requestTo(QUrl(QStringLiteral("http://127.0.0.1:%1/v1/infer").arg(port))), this,
                      [&outcome](Result<BackendReply> reply) { outcome = std::move(reply); });

        QTRY_VERIFY_WITH_TIMEOUT(outcome.has_value(), 5000);
        QVERIFY(!outcome->has_value());
        QCOMPARE(outcome->error().kind, ErrorKind::Backend);
        QCOMPARE(outcome->error().httpStatus(), 502);
    }

    void testDestroyedContextCancels() {
        CannedHttpServer server;
        QVERIFY(server.listen());
        server.silent = true;

        QtBackendExecutor executor(QSslConfiguration::defaultConfiguration(), 300);
        auto* context = new QObject;
        bool called = false;
        executor.post(requestTo(server.url()), context,
                      [&called](Result<BackendReply>) { called = true; });

        QTRY_VERIFY_WITH_TIMEOUT(!server.lastRequest.isEmpty(), 5000);
        delete context;

        // Past the timeout budget: a live call would have reported by now.
        QTest::qWait(600);
        QVERIFY(!called);
    }
};

QTEST_MAIN(TestQtExecutor)
#include "tst_qt_executor.moc"

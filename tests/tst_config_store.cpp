#include <QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "config/config_store.h"
#include "config/config_types.h"

class TestConfigStore : public QObject {
    Q_OBJECT

private:
    static QJsonObject validRoot() {
        return QJsonDocument::fromJson(R"({
            "backend": {
                "endpoint": "https://backend.example/api/v1/infer",
                "provider": "rhel_lightspeed",
                "timeout": 30,
                "auth": {"cert_file": "/etc/pki/consumer/cert.pem",
                         "key_file": "/etc/pki/consumer/key.pem"},
                "proxies": {"https": "http://proxy.example:3128"}
            },
            "proxy": {
                "host": "127.0.0.1", "port": 8080,
                "allowed_origins": ["http://localhost:3000"],
                "rate_limit": {"rate": 5, "burst": 8},
                "max_body_bytes": 4096,
                "stream_delay_ms": 10
            },
            "models": [{"id": "rhel-assistant", "owned_by": "redhat"}],
            "logging": {"level": "debug", "file": ""}
        })").object();
    }

    static QByteArray toJson(const QJsonObject& root) {
        return QJsonDocument(root).toJson();
    }

    static QJsonObject withSection(QJsonObject root, const QString& section,
                                   const QString& key, const QJsonValue& value) {
        QJsonObject inner = root.value(section).toObject();
        inner.insert(key, value);
        root.insert(section, inner);
        return root;
    }

private slots:
    void testParseFullDocument() {
        auto parsed = ConfigStore::parse(toJson(validRoot()));
        QVERIFY(parsed.has_value());

        const GatewayConfig& config = *parsed;
        QCOMPARE(config.backend.endpoint, QStringLiteral("https://backend.example/api/v1/infer"));
        QCOMPARE(config.backend.provider, QStringLiteral("rhel_lightspeed"));
        QCOMPARE(config.backend.timeoutMs, 30000);
        QCOMPARE(config.backend.auth.certFile, QStringLiteral("/etc/pki/consumer/cert.pem"));
        QCOMPARE(config.backend.proxies.value(QStringLiteral("https")), QStringLiteral("http://proxy.example:3128"));
        QVERIFY(!config.backend.proxies.contains(QStringLiteral("http")));
        QCOMPARE(config.proxy.port, 8080);
        QCOMPARE(config.proxy.allowedOrigins, QStringList{QStringLiteral("http://localhost:3000")});
        QCOMPARE(config.proxy.rateLimit.rate, 5.0);
        QCOMPARE(config.proxy.rateLimit.burst, 8);
        QCOMPARE(config.proxy.maxBodyBytes, qint64(4096));
        QCOMPARE(config.proxy.streamDelayMs, 10);
        QCOMPARE(config.models.size(), 1);
        QCOMPARE(config.models[0].id, QStringLiteral("rhel-assistant"));
        QCOMPARE(config.models[0].ownedBy, QStringLiteral("redhat"));
        QCOMPARE(config.logging.level, QStringLiteral("debug"));

        QVERIFY(ConfigStore::validate(config).has_value());
    }

    void testDefaults() {
        QJsonObject root = validRoot();
        root.remove(QStringLiteral("models"));
        root.remove(QStringLiteral("logging"));
        QJsonObject proxy = root.value(QStringLiteral("proxy")).toObject();
        proxy.remove(QStringLiteral("rate_limit"));
        proxy.remove(QStringLiteral("stream_delay_ms"));
        root.insert(QStringLiteral("proxy"), proxy);

        auto parsed = ConfigStore::parse(toJson(root));
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->models.size(), 1);
        QCOMPARE(parsed->models[0].id, QStringLiteral("default-model"));
        QCOMPARE(parsed->models[0].created, qint64(1234567890));
        QCOMPARE(parsed->proxy.rateLimit.rate, 10.0);
        QCOMPARE(parsed->proxy.rateLimit.burst, 20);
        QCOMPARE(parsed->proxy.streamDelayMs, 20);
        QCOMPARE(parsed->logging.level, QStringLiteral("info"));
    }

    void testTimeoutMillisecondsWins() {
        const QJsonObject root = withSection(validRoot(), QStringLiteral("backend"),
                                             QStringLiteral("timeout_ms"), 1500);
        auto parsed = ConfigStore::parse(toJson(root));
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->backend.timeoutMs, 1500);
    }

    void testLargestTimeoutAccepted() {
        const QJsonObject root = withSection(validRoot(), QStringLiteral("backend"),
                                             QStringLiteral("timeout"), 86400);
        auto parsed = ConfigStore::parse(toJson(root));
        QVERIFY(parsed.has_value());
        QCOMPARE(parsed->backend.timeoutMs, 86400000);
        QVERIFY(ConfigStore::validate(*parsed).has_value());
    }

    void testInvalidJson() {
        auto parsed = ConfigStore::parse(QByteArray("{\"backend\": "));
        QVERIFY(!parsed.has_value());
        QCOMPARE(parsed.error().kind, ErrorKind::Config);
    }

    void testValidationFailures_data() {
        QTest::addColumn<QString>("section");
        QTest::addColumn<QString>("key");
        QTest::addColumn<QJsonValue>("value");
        QTest::addColumn<QString>("expected");

        QTest::newRow("endpoint not url") << QStringLiteral("backend") << QStringLiteral("endpoint") << QJsonValue("backend.example")
                                          << QStringLiteral("backend.endpoint");
        QTest::newRow("huge timeout") << QStringLiteral("backend") << QStringLiteral("timeout") << QJsonValue(3e6)
                                      << QStringLiteral("backend.timeout");
        QTest::newRow("huge timeout_ms") << QStringLiteral("backend") << QStringLiteral("timeout_ms") << QJsonValue(1e12)
                                         << QStringLiteral("backend.timeout");
        QTest::newRow("zero timeout") << QStringLiteral("backend") << QStringLiteral("timeout") << QJsonValue(0) << QStringLiteral("backend.timeout");
        QTest::newRow("unsupported proxy scheme") << QStringLiteral("backend") << QStringLiteral("proxies")
                                                  << QJsonValue(QJsonObject{{"ftp", "http://p:1"}})
                                                  << QStringLiteral("backend.proxies");
        QTest::newRow("empty origins") << QStringLiteral("proxy") << QStringLiteral("allowed_origins") << QJsonValue(QJsonArray())
                                       << QStringLiteral("allowed_origins");
        QTest::newRow("zero rate") << QStringLiteral("proxy") << QStringLiteral("rate_limit")
                                   << QJsonValue(QJsonObject{{"rate", 0}, {"burst", 5}}) << QStringLiteral("rate");
        QTest::newRow("negative rate") << QStringLiteral("proxy") << QStringLiteral("rate_limit")
                                       << QJsonValue(QJsonObject{{"rate", -1}, {"burst", 5}}) << QStringLiteral("rate");
        QTest::newRow("zero burst") << QStringLiteral("proxy") << QStringLiteral("rate_limit")
                                    << QJsonValue(QJsonObject{{"rate", 1}, {"burst", 0}}) << QStringLiteral("burst");
        QTest::newRow("port out of range") << QStringLiteral("proxy") << QStringLiteral("port") << QJsonValue(70000) << QStringLiteral("proxy.port");
        QTest::newRow("bad log level") << QStringLiteral("logging") << QStringLiteral("level") << QJsonValue("chatty") << QStringLiteral("logging.level");
    }

    void testValidationFailures() {
        QFETCH(QString, section);
        QFETCH(QString, key);
        QFETCH(QJsonValue, value);
        QFETCH(QString, expected);

        auto parsed = ConfigStore::parse(toJson(withSection(validRoot(), section, key, value)));
        QVERIFY(parsed.has_value());
        auto valid = ConfigStore::validate(*parsed);
        QVERIFY(!valid.has_value());
        QCOMPARE(valid.error().kind, ErrorKind::Config);
        QVERIFY2(valid.error().message.contains(expected), qPrintable(valid.error().message));
    }

    void testMissingIdentityFails() {
        QJsonObject root = validRoot();
        QJsonObject backend = root.value(QStringLiteral("backend")).toObject();
        backend.remove(QStringLiteral("auth"));
        root.insert(QStringLiteral("backend"), backend);

        auto parsed = ConfigStore::parse(toJson(root));
        QVERIFY(parsed.has_value());
        QVERIFY(!ConfigStore::validate(*parsed).has_value());
    }

    void testLoadFromFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("config.json"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(toJson(validRoot()));
        file.close();

        ConfigStore store;
        auto loaded = store.load(path);
        QVERIFY(loaded.has_value());
        QCOMPARE(store.filePath(), path);
        QCOMPARE(store.config().proxy.port, 8080);
    }

    void testLoadMissingFileFails() {
        QTemporaryDir dir;
        ConfigStore store;
        auto loaded = store.load(dir.filePath(QStringLiteral("absent.json")));
        QVERIFY(!loaded.has_value());
        QCOMPARE(loaded.error().kind, ErrorKind::Config);
        QVERIFY(store.filePath().isEmpty());
    }

    void testDefaultConfigPath() {
        const QByteArray saved = qgetenv("XDG_CONFIG_DIRS");

        qputenv("XDG_CONFIG_DIRS", "/opt/etc:/etc/xdg");
        QCOMPARE(ConfigStore::defaultConfigPath(), QStringLiteral("/opt/etc/clad/config.json"));

        qunsetenv("XDG_CONFIG_DIRS");
        QCOMPARE(ConfigStore::defaultConfigPath(), QStringLiteral("/etc/xdg/clad/config.json"));

        if (!saved.isNull())
            qputenv("XDG_CONFIG_DIRS", saved);
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"

#include <QCoreApplication>
#include <QCommandLineParser>

#include "config/config_store.h"
#include "core/bootstrap.h"
#include "core/log_manager.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("clad"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Chat-completion gateway translating requests for an mTLS assistant backend"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                    QStringLiteral("Configuration file (default %1).")
                                        .arg(ConfigStore::defaultConfigPath()),
                                    QStringLiteral("path"),
                                    ConfigStore::defaultConfigPath());
    QCommandLineOption checkOption(QStringLiteral("check"),
                                   QStringLiteral("Validate the configuration and exit."));
    parser.addOption(configOption);
    parser.addOption(checkOption);
    parser.process(app);

    const QString configPath = parser.value(configOption);

    if (parser.isSet(checkOption)) {
        ConfigStore store;
        auto loaded = store.load(configPath);
        if (!loaded) {
            LOG_ERROR(loaded.error().message);
            return 1;
        }
        LOG_INFO(QStringLiteral("%1: configuration is valid").arg(configPath));
        return 0;
    }

    Bootstrap bootstrap;
    auto started = bootstrap.startAll(configPath);
    if (!started)
        return 1;

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &bootstrap, &Bootstrap::stopAll);
    return app.exec();
}

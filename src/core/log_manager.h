#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    // Empty path keeps console-only output.
    bool initialize(const QString& logFilePath, Level minimumLevel = Info);

    void setMinimumLevel(Level level);
    Level minimumLevel() const;
    void setConsoleEnabled(bool enabled);

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "clad", msg); }
    void info(const QString& msg)    { log(Info, "clad", msg); }
    void warning(const QString& msg) { log(Warning, "clad", msg); }
    void error(const QString& msg)   { log(Error, "clad", msg); }

    static QString formatMessage(Level level, const QString& category, const QString& message);
    static bool parseLevel(const QString& name, Level* level);

signals:
    void logEntry(int level, const QString& timestamp,
                  const QString& category, const QString& message);

private:
    ~LogManager() override;
    LogManager() = default;

    mutable QMutex m_mutex;
    QFile m_logFile;
    Level m_minimumLevel = Info;
    bool m_console = true;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)

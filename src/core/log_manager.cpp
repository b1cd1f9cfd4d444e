#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

QString currentTimestamp()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
}

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

bool LogManager::initialize(const QString& logFilePath, Level minimumLevel) {
    QMutexLocker locker(&m_mutex);
    m_minimumLevel = minimumLevel;

    if (m_logFile.isOpen())
        m_logFile.close();
    if (logFilePath.isEmpty())
        return true;

    QDir().mkpath(QFileInfo(logFilePath).absolutePath());
    m_logFile.setFileName(logFilePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logFilePath;
        m_logFile.close();
        return false;
    }
    return true;
}

void LogManager::setMinimumLevel(Level level) {
    QMutexLocker locker(&m_mutex);
    m_minimumLevel = level;
}

LogManager::Level LogManager::minimumLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_minimumLevel;
}

void LogManager::setConsoleEnabled(bool enabled) {
    QMutexLocker locker(&m_mutex);
    m_console = enabled;
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    const QString timestamp = currentTimestamp();
    {
        QMutexLocker locker(&m_mutex);
        if (level < m_minimumLevel)
            return;

        const QString formatted = QString("[%1] [%2] [%3] %4")
            .arg(timestamp, QLatin1String(kLevelNames[level]), category, message);

        if (m_console) {
            const QByteArray line = formatted.toUtf8() + '\n';
            std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
            std::fflush(stderr);
        }

        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }
    }

    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error)
        level = Error;
    return QString("[%1] [%2] [%3] %4")
        .arg(currentTimestamp(), QLatin1String(kLevelNames[level]), category, message);
}

bool LogManager::parseLevel(const QString& name, Level* level) {
    const QString normalized = name.trimmed().toLower();
    Level parsed;
    if (normalized == QStringLiteral("debug") || normalized == QStringLiteral("trace"))
        parsed = Debug;
    else if (normalized == QStringLiteral("info"))
        parsed = Info;
    else if (normalized == QStringLiteral("warn") || normalized == QStringLiteral("warning"))
        parsed = Warning;
    else if (normalized == QStringLiteral("error"))
        parsed = Error;
    else
        return false;

    if (level)
        *level = parsed;
    return true;
}

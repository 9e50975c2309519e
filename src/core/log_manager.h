#pragma once
#include <QFile>
#include <QString>

class LogManager {
public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };

    // Opens <logDir>/ollama_gateway.log for appending; stderr output is unaffected.
    bool initialize(const QString& logDir);
    void shutdown();

    void setMinimumLevel(Level level) { m_minLevel = level; }
    Level minimumLevel() const { return m_minLevel; }
    void setConsoleEnabled(bool enabled) { m_console = enabled; }

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, QStringLiteral("gateway"), msg); }
    void info(const QString& msg)    { log(Info, QStringLiteral("gateway"), msg); }
    void warning(const QString& msg) { log(Warning, QStringLiteral("gateway"), msg); }
    void error(const QString& msg)   { log(Error, QStringLiteral("gateway"), msg); }

    QString logFilePath() const { return m_logFile.fileName(); }

    static QString formatMessage(Level level, const QString& category, const QString& message);

    static constexpr const char* kLogFileName = "ollama_gateway.log";

private:
    LogManager() = default;
    ~LogManager();
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    QFile m_logFile;
    Level m_minLevel = Info;
    bool m_console = true;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)

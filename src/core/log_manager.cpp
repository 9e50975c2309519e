#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <QDebug>

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    shutdown();
}

bool LogManager::initialize(const QString& logDir) {
    shutdown();
    if (!QDir().mkpath(logDir)) {
        qWarning() << "LogManager: failed to create log directory:" << logDir;
        return false;
    }

    const QString logPath = QDir(logDir).filePath(QString::fromLatin1(kLogFileName));
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
        return false;
    }
    return true;
}

void LogManager::shutdown()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }
    if (level < m_minLevel)
        return;

    const QString formatted = formatMessage(level, category, message);

    if (m_console) {
        static QTextStream console(stderr);
        console << formatted << Qt::endl;
    }

    // file output
    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz"));
    static const char* levelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    return QStringLiteral("[%1] [%2] [%3] %4")
        .arg(timestamp, QLatin1String(levelNames[level]), category, message);
}

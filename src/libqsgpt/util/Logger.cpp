/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Logger Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "Logger.h"
#include "HexFormatter.h"

#include <QDir>
#include <QFileInfo>
#include <QStringList>

#include <stdio.h>
#include <utility>

#ifndef Q_OS_WIN
#include <unistd.h>
#endif

namespace qsgpt {

static const char* ansiColour(LogLevel level)
{
    switch (level) {
    case LogLevel::Trace:   return "\033[90m";
    case LogLevel::Debug:   return "\033[36m";
    case LogLevel::Info:    return "\033[32m";
    case LogLevel::Warning: return "\033[33m";
    case LogLevel::Error:   return "\033[31m";
    case LogLevel::Fatal:   return "\033[35m";
    }
    return "\033[0m";
}

// =============================================================================
// Logger Implementation
// =============================================================================

Logger::Logger()
    : m_consoleStream(stderr)
    , m_logLevel(LogLevel::Info)
    , m_consoleOutput(true)
    , m_fileOutput(true)
    , m_colour(false)
    , m_nextHandlerId(1)
{
#ifndef Q_OS_WIN
    // Plain text when stderr is redirected
    m_colour = isatty(fileno(stderr)) != 0;
#endif
}

Logger::~Logger()
{
    shutdown();
}

Logger& Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::init(const QString& logFilePath, bool append)
{
    QMutexLocker locker(&m_mutex);

    if (m_logFile.isOpen()) {
        m_fileStream.setDevice(nullptr);
        m_logFile.close();
    }

    const QDir dir = QFileInfo(logFilePath).absoluteDir();
    if (!dir.exists() && !QDir().mkpath(dir.absolutePath())) {
        m_consoleStream << "Cannot create log directory " << dir.absolutePath() << Qt::endl;
        return false;
    }

    m_logFile.setFileName(logFilePath);
    const QIODevice::OpenMode mode = QIODevice::WriteOnly | QIODevice::Text
        | (append ? QIODevice::Append : QIODevice::Truncate);
    if (!m_logFile.open(mode)) {
        m_consoleStream << "Cannot open log file " << logFilePath << ": "
                        << m_logFile.errorString() << Qt::endl;
        return false;
    }

    m_fileStream.setDevice(&m_logFile);
    writeBanner(QStringLiteral("QSgPt %1 Log Started").arg(versionString()));
    return true;
}

void Logger::shutdown()
{
    QMutexLocker locker(&m_mutex);

    if (m_logFile.isOpen()) {
        writeBanner(QStringLiteral("QSgPt Log Ended"));
        m_fileStream.setDevice(nullptr);
        m_logFile.close();
    }

    m_handlers.clear();
}

void Logger::writeBanner(const QString& title)
{
    const QString rule(40, QLatin1Char('='));
    m_fileStream << '\n' << rule << '\n'
                 << title << '\n'
                 << "Time: " << QDateTime::currentDateTime().toString(Qt::ISODate) << '\n'
                 << rule << '\n';
    m_fileStream.flush();
}

void Logger::setLogLevel(LogLevel level)
{
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
}

LogLevel Logger::logLevel() const
{
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

void Logger::setCategoryLevel(const QString& category, LogLevel level)
{
    QMutexLocker locker(&m_mutex);
    m_categoryLevels.insert(category, level);
}

void Logger::clearCategoryLevels()
{
    QMutexLocker locker(&m_mutex);
    m_categoryLevels.clear();
}

LogLevel Logger::thresholdFor(const QString& category) const
{
    return m_categoryLevels.value(category, m_logLevel);
}

bool Logger::isEnabled(LogLevel level, const QString& category) const
{
    QMutexLocker locker(&m_mutex);
    return level >= thresholdFor(category);
}

void Logger::setConsoleOutput(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enabled;
}

void Logger::setFileOutput(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_fileOutput = enabled;
}

int Logger::addHandler(LogHandler handler)
{
    QMutexLocker locker(&m_mutex);
    const int id = m_nextHandlerId++;
    m_handlers.insert(id, std::move(handler));
    return id;
}

void Logger::removeHandler(int handlerId)
{
    QMutexLocker locker(&m_mutex);
    m_handlers.remove(handlerId);
}

void Logger::log(LogLevel level, const QString& category, const QString& message,
                 const char* file, int line, const char* function)
{
    QMutexLocker locker(&m_mutex);

    if (level < thresholdFor(category)) {
        return;
    }

    LogEntry entry;
    entry.timestamp = QDateTime::currentDateTime();
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? QString::fromUtf8(file) : QString();
    entry.line = line;
    entry.function = function ? QString::fromUtf8(function) : QString();

    if (m_consoleOutput) {
        writeToConsole(entry);
    }
    if (m_fileOutput && m_logFile.isOpen()) {
        m_fileStream << formatEntry(entry) << '\n';
        m_fileStream.flush();
    }
    for (const LogHandler& handler : std::as_const(m_handlers)) {
        handler(entry);
    }
}

void Logger::logHex(LogLevel level, const QString& category, const QString& title,
                    const quint8* data, int length)
{
    if (!isEnabled(level, category)) {
        return;
    }

    log(level, category, QStringLiteral("%1 (%2 bytes)").arg(title).arg(length));
    if (!data || length <= 0) {
        return;
    }

    const QString dump = HexFormatter::dump(data, length, HexFormat::WithAscii, QStringLiteral("  "));
    const QStringList lines = dump.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString& line : lines) {
        log(level, category, line);
    }
}

QString Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Trace:   return QStringLiteral("TRACE");
    case LogLevel::Debug:   return QStringLiteral("DEBUG");
    case LogLevel::Info:    return QStringLiteral("INFO");
    case LogLevel::Warning: return QStringLiteral("WARN");
    case LogLevel::Error:   return QStringLiteral("ERROR");
    case LogLevel::Fatal:   return QStringLiteral("FATAL");
    }
    return QStringLiteral("UNKNOWN");
}

LogLevel Logger::stringToLevel(const QString& str)
{
    static const struct {
        const char* name;
        LogLevel level;
    } names[] = {
        {"TRACE", LogLevel::Trace},
        {"DEBUG", LogLevel::Debug},
        {"INFO", LogLevel::Info},
        {"WARN", LogLevel::Warning},
        {"WARNING", LogLevel::Warning},
        {"ERROR", LogLevel::Error},
        {"FATAL", LogLevel::Fatal},
    };

    const QString key = str.trimmed();
    for (const auto& entry : names) {
        if (key.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

void Logger::writeToConsole(const LogEntry& entry)
{
    // stderr only, stdout carries command output
    if (m_colour) {
        m_consoleStream << ansiColour(entry.level) << formatEntry(entry) << "\033[0m" << Qt::endl;
    } else {
        m_consoleStream << formatEntry(entry) << Qt::endl;
    }
}

QString Logger::formatEntry(const LogEntry& entry) const
{
    QString result = QStringLiteral("%1 [%2] ")
                         .arg(entry.timestamp.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz")),
                              levelToString(entry.level).leftJustified(5));
    if (!entry.category.isEmpty()) {
        result += QStringLiteral("[%1] ").arg(entry.category);
    }
    result += entry.message;

    if (entry.level <= LogLevel::Debug && !entry.file.isEmpty()) {
        const QString fileName = QFileInfo(entry.file).fileName();
        result += QStringLiteral(" (%1:%2)").arg(fileName).arg(entry.line);
    }
    return result;
}

} // namespace qsgpt

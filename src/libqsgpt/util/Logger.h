/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Logger Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_LOGGER_H
#define QSGPT_LOGGER_H

#include "../libqsgpt_global.h"

#include <QByteArray>
#include <QDateTime>
#include <QFile>
#include <QHash>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QTextStream>
#include <functional>

namespace qsgpt {

/**
 * @brief Log level enumeration
 */
enum class LogLevel {
    Trace,      ///< Most verbose, for debugging
    Debug,      ///< Debug information
    Info,       ///< Informational messages
    Warning,    ///< Warning messages
    Error,      ///< Error messages
    Fatal       ///< Fatal errors
};

/**
 * @brief Category names used by the library
 */
namespace LogCategory {
constexpr const char *Buffer = "buffer";
constexpr const char *Sense = "sense";
constexpr const char *PassThrough = "pt";
constexpr const char *Device = "device";
constexpr const char *Transport = "transport";
constexpr const char *Settings = "settings";
} // namespace LogCategory

/**
 * @brief Log entry structure
 */
struct LIBQSGPT_EXPORT LogEntry {
    QDateTime timestamp;
    LogLevel level;
    QString category;
    QString message;
    QString file;
    int line;
    QString function;
};

/**
 * @brief Callback type for log handlers
 */
using LogHandler = std::function<void(const LogEntry&)>;

/**
 * @brief Thread-safe logging utility
 *
 * One process-wide sink for the library and the CLI. Entries go to stderr,
 * an optional log file and any registered handlers. A category can carry
 * its own threshold, so "transport" can be traced while the rest stays at
 * the global level.
 */
class LIBQSGPT_EXPORT Logger
{
public:
    static Logger& instance();

    /**
     * @brief Open @p logFilePath (creating its directory) and write the start banner
     * @return false if the file could not be opened
     */
    bool init(const QString& logFilePath, bool append = true);

    /**
     * @brief Write the end banner, close the file and drop all handlers
     */
    void shutdown();

    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;

    /**
     * @brief Threshold for one category, overriding the global level
     */
    void setCategoryLevel(const QString& category, LogLevel level);
    void clearCategoryLevels();

    /**
     * @brief True if a message at @p level in @p category would be emitted
     */
    bool isEnabled(LogLevel level, const QString& category = QString()) const;

    void setConsoleOutput(bool enabled);
    void setFileOutput(bool enabled);

    /**
     * @brief Register a callback receiving every emitted entry
     * @return Id for removeHandler()
     */
    int addHandler(LogHandler handler);
    void removeHandler(int handlerId);

    void log(LogLevel level, const QString& category, const QString& message,
             const char* file = nullptr, int line = 0, const char* function = nullptr);

    /**
     * @brief Log a titled hex dump of a byte range, one entry per line
     */
    void logHex(LogLevel level, const QString& category, const QString& title,
                const quint8* data, int length);

    static QString levelToString(LogLevel level);

    /**
     * @brief Case-insensitive; "WARN" and "WARNING" both accepted, unknown text gives Info
     */
    static LogLevel stringToLevel(const QString& str);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel thresholdFor(const QString& category) const;
    void writeBanner(const QString& title);
    void writeToConsole(const LogEntry& entry);
    QString formatEntry(const LogEntry& entry) const;

    mutable QMutex m_mutex;
    QFile m_logFile;
    QTextStream m_fileStream;
    QTextStream m_consoleStream;
    LogLevel m_logLevel;
    QHash<QString, LogLevel> m_categoryLevels;
    bool m_consoleOutput;
    bool m_fileOutput;
    bool m_colour;
    QMap<int, LogHandler> m_handlers;
    int m_nextHandlerId;
};

// =============================================================================
// Logging Macros
// =============================================================================

#define QSGPT_LOG(level, category, message) \
    qsgpt::Logger::instance().log(level, QString::fromLatin1(category), message, __FILE__, __LINE__, Q_FUNC_INFO)

#define QSGPT_TRACE(category, message) \
    QSGPT_LOG(qsgpt::LogLevel::Trace, category, message)

#define QSGPT_DEBUG(category, message) \
    QSGPT_LOG(qsgpt::LogLevel::Debug, category, message)

#define QSGPT_INFO(category, message) \
    QSGPT_LOG(qsgpt::LogLevel::Info, category, message)

#define QSGPT_WARNING(category, message) \
    QSGPT_LOG(qsgpt::LogLevel::Warning, category, message)

#define QSGPT_ERROR(category, message) \
    QSGPT_LOG(qsgpt::LogLevel::Error, category, message)

#define QSGPT_FATAL(category, message) \
    QSGPT_LOG(qsgpt::LogLevel::Fatal, category, message)

} // namespace qsgpt

#endif // QSGPT_LOGGER_H

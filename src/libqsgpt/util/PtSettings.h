/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Settings Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_PTSETTINGS_H
#define QSGPT_PTSETTINGS_H

#include "../libqsgpt_global.h"
#include "Logger.h"

#include <QSettings>
#include <QString>

namespace qsgpt {

/**
 * @brief Persistent pass-through and logging options
 *
 * Stored in the [PassThrough] and [Logging] groups of a QSettings file.
 */
class LIBQSGPT_EXPORT PtSettings
{
public:
    static constexpr int DEFAULT_TIMEOUT = 60;
    static constexpr int DEFAULT_SCRATCH_SIZE = 4096;
    static constexpr int DEFAULT_SENSE_LENGTH = 64;
    static constexpr int MIN_SENSE_LENGTH = 18;
    static constexpr int MAX_SENSE_LENGTH = 252;

    PtSettings();

    /**
     * @brief Read both groups, replacing invalid values by defaults
     */
    void load(QSettings& settings);
    void save(QSettings& settings) const;

    /**
     * @brief Push level, console flag and log file into the Logger
     * @return false if the log file could not be opened
     */
    bool applyLogging() const;

    // [PassThrough]
    int defaultTimeout;     ///< Seconds
    bool verbose;
    int alignment;          ///< 0 = transport DMA alignment
    int scratchInitialSize;
    int senseLength;

    // [Logging]
    LogLevel logLevel;
    QString logPath;        ///< Empty = no log file
    bool consoleOutput;
};

} // namespace qsgpt

#endif // QSGPT_PTSETTINGS_H

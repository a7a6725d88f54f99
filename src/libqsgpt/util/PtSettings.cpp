/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Settings Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "PtSettings.h"
#include "../buffer/AlignedBuffer.h"

namespace qsgpt {

PtSettings::PtSettings()
    : defaultTimeout(DEFAULT_TIMEOUT)
    , verbose(false)
    , alignment(0)
    , scratchInitialSize(DEFAULT_SCRATCH_SIZE)
    , senseLength(DEFAULT_SENSE_LENGTH)
    , logLevel(LogLevel::Info)
    , consoleOutput(true)
{
}

static int readInt(QSettings& settings, const char* key, int defaultValue, bool (*valid)(int))
{
    bool ok = false;
    const int value = settings.value(key, defaultValue).toInt(&ok);
    if (!ok || !valid(value)) {
        QSGPT_WARNING(LogCategory::Settings,
                      QStringLiteral("Invalid %1/%2 value \"%3\", using %4")
                          .arg(settings.group(), QLatin1String(key),
                               settings.value(key).toString())
                          .arg(defaultValue));
        return defaultValue;
    }
    return value;
}

void PtSettings::load(QSettings& settings)
{
    // PassThrough
    settings.beginGroup("PassThrough");
    defaultTimeout = readInt(settings, "DefaultTimeout", DEFAULT_TIMEOUT,
                             [](int v) { return v >= 0; });
    verbose = settings.value("Verbose", false).toBool();
    alignment = readInt(settings, "Alignment", 0,
                        [](int v) { return AlignedBuffer::isValidAlignment(v); });
    scratchInitialSize = readInt(settings, "ScratchInitialSize", DEFAULT_SCRATCH_SIZE,
                                 [](int v) { return v >= 0; });
    senseLength = readInt(settings, "SenseLength", DEFAULT_SENSE_LENGTH,
                          [](int v) { return v >= MIN_SENSE_LENGTH && v <= MAX_SENSE_LENGTH; });
    settings.endGroup();

    // Logging
    settings.beginGroup("Logging");
    const QString level = settings.value("Level", "INFO").toString();
    logLevel = Logger::stringToLevel(level);
    logPath = settings.value("LogPath", "").toString();
    consoleOutput = settings.value("ConsoleOutput", true).toBool();
    settings.endGroup();
}

void PtSettings::save(QSettings& settings) const
{
    // PassThrough
    settings.beginGroup("PassThrough");
    settings.setValue("DefaultTimeout", defaultTimeout);
    settings.setValue("Verbose", verbose);
    settings.setValue("Alignment", alignment);
    settings.setValue("ScratchInitialSize", scratchInitialSize);
    settings.setValue("SenseLength", senseLength);
    settings.endGroup();

    // Logging
    settings.beginGroup("Logging");
    settings.setValue("Level", Logger::levelToString(logLevel));
    settings.setValue("LogPath", logPath);
    settings.setValue("ConsoleOutput", consoleOutput);
    settings.endGroup();
}

bool PtSettings::applyLogging() const
{
    Logger& logger = Logger::instance();
    logger.setLogLevel(logLevel);
    logger.setConsoleOutput(consoleOutput);

    if (logPath.isEmpty()) {
        logger.setFileOutput(false);
        return true;
    }

    logger.setFileOutput(true);
    return logger.init(logPath);
}

} // namespace qsgpt

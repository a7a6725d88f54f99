/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Logger Tests
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "util/Logger.h"

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>
#include <QVector>

using namespace qsgpt;

namespace {

class LoggerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger& logger = Logger::instance();
        logger.setConsoleOutput(false);
        logger.setLogLevel(LogLevel::Trace);
        m_handlerId = logger.addHandler([this](const LogEntry& entry) { m_entries.append(entry); });
    }

    void TearDown() override
    {
        Logger& logger = Logger::instance();
        logger.removeHandler(m_handlerId);
        logger.clearCategoryLevels();
        logger.setLogLevel(LogLevel::Info);
    }

    QVector<LogEntry> m_entries;
    int m_handlerId = 0;
};

} // namespace

TEST_F(LoggerTest, MacroCarriesCategoryAndLocation)
{
    QSGPT_WARNING(LogCategory::Device, QStringLiteral("left the stack"));

    ASSERT_EQ(m_entries.size(), 1);
    EXPECT_EQ(m_entries[0].level, LogLevel::Warning);
    EXPECT_EQ(m_entries[0].category, QStringLiteral("device"));
    EXPECT_EQ(m_entries[0].message, QStringLiteral("left the stack"));
    EXPECT_TRUE(m_entries[0].file.endsWith(QStringLiteral("LoggerTests.cpp")));
    EXPECT_GT(m_entries[0].line, 0);
}

TEST_F(LoggerTest, LevelFiltersMessages)
{
    Logger::instance().setLogLevel(LogLevel::Warning);
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::Info));
    EXPECT_TRUE(Logger::instance().isEnabled(LogLevel::Error));

    QSGPT_DEBUG(LogCategory::PassThrough, QStringLiteral("hidden"));
    QSGPT_INFO(LogCategory::PassThrough, QStringLiteral("hidden"));
    QSGPT_ERROR(LogCategory::PassThrough, QStringLiteral("shown"));

    ASSERT_EQ(m_entries.size(), 1);
    EXPECT_EQ(m_entries[0].message, QStringLiteral("shown"));
}

TEST_F(LoggerTest, CategoryLevelOverridesGlobalLevel)
{
    Logger& logger = Logger::instance();
    logger.setLogLevel(LogLevel::Warning);
    logger.setCategoryLevel(QStringLiteral("transport"), LogLevel::Debug);

    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, QStringLiteral("transport")));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, QStringLiteral("sense")));

    QSGPT_DEBUG(LogCategory::Transport, QStringLiteral("SG_IO submitted"));
    QSGPT_DEBUG(LogCategory::Sense, QStringLiteral("hidden"));

    logger.clearCategoryLevels();
    QSGPT_DEBUG(LogCategory::Transport, QStringLiteral("hidden again"));

    ASSERT_EQ(m_entries.size(), 1);
    EXPECT_EQ(m_entries[0].category, QStringLiteral("transport"));
    EXPECT_EQ(m_entries[0].message, QStringLiteral("SG_IO submitted"));
}

TEST_F(LoggerTest, RemovedHandlerStopsReceiving)
{
    int count = 0;
    const int id = Logger::instance().addHandler([&count](const LogEntry&) { ++count; });
    Logger::instance().log(LogLevel::Info, QStringLiteral("test"), QStringLiteral("one"));
    Logger::instance().removeHandler(id);
    Logger::instance().log(LogLevel::Info, QStringLiteral("test"), QStringLiteral("two"));

    EXPECT_EQ(count, 1);
    EXPECT_EQ(m_entries.size(), 2);
}

TEST_F(LoggerTest, HexDumpIsTitledAndSplitIntoLines)
{
    const quint8 cdb[] = {0x12, 0x00, 0x00, 0x00, 0x24, 0x00};
    Logger::instance().logHex(LogLevel::Debug, QStringLiteral("transport"), QStringLiteral("CDB"),
                              cdb, sizeof(cdb));

    ASSERT_EQ(m_entries.size(), 2);
    EXPECT_EQ(m_entries[0].message, QStringLiteral("CDB (6 bytes)"));
    EXPECT_TRUE(m_entries[1].message.contains(QStringLiteral("12 00 00 00 24 00")));
}

TEST_F(LoggerTest, FileOutputWritesBannerAndEntries)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("logs/qsgpt.log"));

    Logger& logger = Logger::instance();
    logger.setFileOutput(true);
    ASSERT_TRUE(logger.init(path, false));
    logger.log(LogLevel::Warning, QStringLiteral("pt"), QStringLiteral("timed out"));
    logger.shutdown();

    // shutdown() drops handlers
    m_handlerId = logger.addHandler([](const LogEntry&) {});

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QString text = QString::fromUtf8(file.readAll());
    EXPECT_TRUE(text.contains(QStringLiteral("Log Started")));
    EXPECT_TRUE(text.contains(QStringLiteral("[WARN ] [pt] timed out")));
    EXPECT_TRUE(text.contains(QStringLiteral("Log Ended")));
}

TEST(LoggerLevels, StringConversion)
{
    EXPECT_EQ(Logger::levelToString(LogLevel::Warning), QStringLiteral("WARN"));
    EXPECT_EQ(Logger::stringToLevel(QStringLiteral("warning")), LogLevel::Warning);
    EXPECT_EQ(Logger::stringToLevel(QStringLiteral(" Debug ")), LogLevel::Debug);
    EXPECT_EQ(Logger::stringToLevel(QStringLiteral("FATAL")), LogLevel::Fatal);
    EXPECT_EQ(Logger::stringToLevel(QStringLiteral("loud")), LogLevel::Info);
}

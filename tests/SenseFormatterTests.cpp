/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * SenseFormatter Tests
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "sense/SenseFormatter.h"

#include <gtest/gtest.h>

#include <initializer_list>

using namespace qsgpt;

namespace {

QByteArray bytes(std::initializer_list<int> values)
{
    QByteArray result;
    for (int v : values) {
        result.append(static_cast<char>(v));
    }
    return result;
}

} // namespace

TEST(SenseFormatter, FixedNotReady)
{
    const QByteArray sense = bytes({0x70, 0, 0x02, 0, 0, 0, 0, 0x0A, 0, 0, 0, 0, 0x3A, 0x00});
    const QString text = SenseFormatter::describe(sense);

    EXPECT_EQ(text, QStringLiteral("Fixed format, current; Sense key: Not Ready\n"
                                   " Additional sense: Medium not present\n"));
}

TEST(SenseFormatter, FixedInfoFlagsAndLeadin)
{
    const QByteArray sense = bytes({0xF0, 0, 0xA3, 0, 0, 0x01, 0x00, 0x0A, 0, 0, 0, 0, 0x11, 0x00, 0x05});
    const QString text = SenseFormatter::describe(sense, QStringLiteral(">"));

    EXPECT_TRUE(text.startsWith(QStringLiteral(">Fixed format, current; Sense key: Medium Error\n")));
    EXPECT_TRUE(text.contains(QStringLiteral(">  Info fld=0x00000100 [256]\n")));
    EXPECT_TRUE(text.contains(QStringLiteral(">  Flags: FMK ILI\n")));
    EXPECT_TRUE(text.contains(QStringLiteral(">  Field replaceable unit code: 5\n")));
}

TEST(SenseFormatter, FixedFieldPointer)
{
    const QByteArray sense = bytes({0x70, 0, 0x05, 0, 0, 0, 0, 0x0A, 0, 0, 0, 0, 0x24, 0x00, 0, 0xCB, 0x00, 0x02});
    const QString text = SenseFormatter::describe(sense);

    EXPECT_TRUE(text.contains(QStringLiteral("Additional sense: Invalid field in cdb")));
    EXPECT_TRUE(text.contains(QStringLiteral("Field pointer: Error in Command: byte 2 bit 3")));
}

TEST(SenseFormatter, DeferredDescriptorList)
{
    const QByteArray sense = bytes({0x73, 0x03, 0x11, 0x00, 0, 0, 0, 24,
                                    0x00, 0x0A, 0x80, 0x00, 0, 0, 0, 0, 0, 0, 0x12, 0x34,
                                    0x04, 0x02, 0x00, 0x40,
                                    0x0A, 0x06, 0x02, 0x04, 0x04, 0x00, 0x80, 0x00});
    const QString text = SenseFormatter::describe(sense);

    EXPECT_TRUE(text.startsWith(QStringLiteral("Descriptor format, deferred; Sense key: Medium Error\n")));
    EXPECT_TRUE(text.contains(QStringLiteral(" Sense descriptors:\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("  Descriptor type: Information: 0x0000000000001234\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("  Descriptor type: Stream commands: EOM\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("  Descriptor type: Progress indication: 50.00%")));
}

TEST(SenseFormatter, UnknownAndVendorDescriptors)
{
    const QByteArray sense = bytes({0x72, 0x05, 0x24, 0x00, 0, 0, 0, 6,
                                    0x0F, 0x00,
                                    0x80, 0x02, 0xAA, 0xBB});
    const QString list = SenseFormatter::descriptors(sense);

    EXPECT_EQ(list, QStringLiteral("  Descriptor type: Unknown [0x0f]\n"
                                   "  Descriptor type: Vendor specific [0x80]\n"));
}

TEST(SenseFormatter, TruncatedDescriptorReported)
{
    const QByteArray sense = bytes({0x72, 0x05, 0x24, 0x00, 0, 0, 0, 4, 0x02, 0x06, 0x80, 0x00});
    const QString text = SenseFormatter::describe(sense);

    EXPECT_TRUE(text.contains(QStringLiteral(">>> descriptor 1 (type 0x02) truncated")));
}

TEST(SenseFormatter, DescriptorsOfFixedFormatIsEmpty)
{
    EXPECT_TRUE(SenseFormatter::descriptors(bytes({0x70, 0, 0x02, 0, 0, 0, 0, 0x0A})).isEmpty());
}

TEST(SenseFormatter, EmptyAndUnrecognized)
{
    EXPECT_EQ(SenseFormatter::describe(QByteArray()), QStringLiteral(">>> sense buffer empty\n"));

    const QString text = SenseFormatter::describe(bytes({0x7F, 0x01, 0x02}));
    EXPECT_TRUE(text.startsWith(QStringLiteral(">>> Unrecognized sense data format, response code=0x7f\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("7f 01 02")));
}

TEST(SenseFormatter, RawHexAppended)
{
    const QByteArray sense = bytes({0x70, 0, 0x06, 0, 0, 0, 0, 0x0A, 0, 0, 0, 0, 0x29, 0x00});
    const QString text = SenseFormatter::describe(sense, QString(), true);

    EXPECT_TRUE(text.contains(QStringLiteral(" Raw sense data (in hex), sb_len=14:\n")));
    EXPECT_TRUE(text.contains(QStringLiteral("    0000  70 00 06 00 00 00 00 0a  00 00 00 00 29 00\n")));
}

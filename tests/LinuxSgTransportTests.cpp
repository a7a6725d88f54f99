/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Linux SG_IO Transport Tests
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "passthrough/platform/LinuxSgTransport.h"

#include <gtest/gtest.h>

#include <errno.h>
#include <fcntl.h>

#include <limits>

using namespace qsgpt;

#if defined(Q_OS_LINUX)

TEST(LinuxSgTransport, Identity)
{
    LinuxSgTransport transport;
    EXPECT_EQ(transport.name(), QStringLiteral("Linux sg v3 (SG_IO)"));
    EXPECT_TRUE(transport.version().contains(QLatin1Char(' ')));
    EXPECT_EQ(transport.maxCdbLength(), 16);
    EXPECT_TRUE(transport.isAvailable());
}

TEST(LinuxSgTransport, Features)
{
    LinuxSgTransport transport;
    EXPECT_TRUE(transport.supports(FeaturePacketId));
    EXPECT_TRUE(transport.supports(FeatureQueueFlags));
    EXPECT_TRUE(transport.supports(FeatureDirectIo));
    EXPECT_TRUE(transport.supports(FeatureDuration));
    EXPECT_TRUE(transport.supports(FeatureTransportErrorString));
    EXPECT_FALSE(transport.supports(FeatureTag));
    EXPECT_FALSE(transport.supports(FeatureTaskManagement));
    EXPECT_FALSE(transport.supports(FeatureTaskAttribute));
}

TEST(LinuxSgTransport, AlignmentIsPowerOfTwo)
{
    LinuxSgTransport transport;
    const int alignment = transport.dmaAlignment();
    ASSERT_GT(alignment, 0);
    EXPECT_EQ(alignment & (alignment - 1), 0);
}

TEST(LinuxSgTransport, OpenMissingNodeReturnsErrno)
{
    LinuxSgTransport transport;
    EXPECT_EQ(transport.openDevice(QStringLiteral("/dev/qsgpt-no-such-node"), O_RDWR | O_NONBLOCK, false),
              -ENOENT);
}

TEST(LinuxSgTransport, SubmitWithoutCdbIsBadParams)
{
    LinuxSgTransport transport;
    std::unique_ptr<NativeCommand> command = transport.constructCommand();
    ASSERT_TRUE(command);
    EXPECT_EQ(command->submit(-1, 5, false), PT_DO_BAD_PARAMS);
}

TEST(LinuxSgTransport, OversizedCdbIsBadParams)
{
    LinuxSgTransport transport;
    std::unique_ptr<NativeCommand> command = transport.constructCommand();
    const quint8 cdb[32] = {};
    command->setCdb(cdb, sizeof(cdb));
    EXPECT_EQ(command->submit(-1, 5, false), PT_DO_BAD_PARAMS);
}

TEST(LinuxSgTransport, BidirectionalIsBadParams)
{
    LinuxSgTransport transport;
    std::unique_ptr<NativeCommand> command = transport.constructCommand();
    const quint8 cdb[6] = {0x12, 0, 0, 0, 36, 0};
    quint8 in[36] = {};
    const quint8 out[8] = {};
    command->setCdb(cdb, sizeof(cdb));
    command->setDataIn(in, sizeof(in));
    command->setDataOut(out, sizeof(out));
    EXPECT_EQ(command->submit(-1, 5, false), PT_DO_BAD_PARAMS);
}

TEST(LinuxSgTransport, TimeoutConversion)
{
    EXPECT_EQ(LinuxSgTransport::timeoutMs(0), 60000u);
    EXPECT_EQ(LinuxSgTransport::timeoutMs(-5), 60000u);
    EXPECT_EQ(LinuxSgTransport::timeoutMs(30), 30000u);
    EXPECT_EQ(LinuxSgTransport::timeoutMs(3000000), 3000000000u);
    EXPECT_EQ(LinuxSgTransport::timeoutMs(std::numeric_limits<int>::max()),
              std::numeric_limits<unsigned int>::max());
}

TEST(LinuxSgTransport, TransportErrorText)
{
    const QString text = LinuxSgTransport::transportErrorText(0x03, 0x06);
    EXPECT_TRUE(text.startsWith(QStringLiteral("Host_status=0x03 [DID_TIME_OUT]")));
    EXPECT_TRUE(text.contains(QStringLiteral("Driver_status=0x06 [DRIVER_TIMEOUT, SUGGEST_OK]")));
}

TEST(LinuxSgTransport, TransportErrorTextOutOfRange)
{
    const QString text = LinuxSgTransport::transportErrorText(0x7f, 0);
    EXPECT_TRUE(text.contains(QStringLiteral("[invalid]")));
}

#endif // Q_OS_LINUX

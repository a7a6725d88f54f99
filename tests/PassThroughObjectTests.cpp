/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * PassThroughObject Tests
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "buffer/AlignedBuffer.h"
#include "device/DeviceHandle.h"
#include "mocks/MockTransport.h"
#include "passthrough/PassThroughObject.h"
#include "sense/SenseDecoder.h"
#include "util/Logger.h"

#include <gtest/gtest.h>

#include <errno.h>

#include <initializer_list>
#include <utility>

using namespace qsgpt;
using qsgpt::test::MockOutcome;
using qsgpt::test::MockTransport;

namespace {

QByteArray bytes(std::initializer_list<int> values)
{
    QByteArray result;
    for (int v : values) {
        result.append(static_cast<char>(v));
    }
    return result;
}

const quint8 kInquiry[] = {0x12, 0x00, 0x00, 0x00, 36, 0x00};

class PassThroughObjectTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::instance().setConsoleOutput(false);
        ASSERT_TRUE(m_device.open(QStringLiteral("/dev/sg0")).ok());
    }

    void TearDown() override
    {
        Logger::instance().setConsoleOutput(true);
    }

    // CDB, sense and a 36-byte data-in buffer attached
    void configureInquiry(PassThroughObject& pt)
    {
        ASSERT_TRUE(pt.setCdb(kInquiry, sizeof(kInquiry)).ok());
        ASSERT_TRUE(pt.setSense(m_sense).ok());
        ASSERT_TRUE(pt.setDataIn(m_dataIn).ok());
    }

    MockTransport m_transport;
    DeviceHandle m_device{m_transport};
    AlignedBuffer m_sense{32};
    AlignedBuffer m_dataIn{36, 512};
};

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_F(PassThroughObjectTest, ConstructedState)
{
    PassThroughObject pt(m_transport);
    EXPECT_TRUE(pt.constructStatus().ok());
    EXPECT_EQ(pt.state(), PtState::Constructed);
    EXPECT_EQ(pt.timeout(), PassThroughObject::DEFAULT_TIMEOUT);
}

TEST_F(PassThroughObjectTest, AllocationFailureIsResourceExhausted)
{
    m_transport.failConstruct = true;
    PassThroughObject pt(m_transport);

    EXPECT_EQ(pt.state(), PtState::Unconstructed);
    EXPECT_EQ(pt.constructStatus().error, PtError::ResourceExhausted);
    EXPECT_EQ(pt.setCdb(kInquiry, sizeof(kInquiry)).error, PtError::ResourceExhausted);
    EXPECT_EQ(pt.execute(m_device).error, PtError::ResourceExhausted);
}

TEST_F(PassThroughObjectTest, UnsupportedTransport)
{
    UnsupportedTransport unsupported;
    PassThroughObject pt(unsupported);

    EXPECT_EQ(pt.state(), PtState::Unconstructed);
    EXPECT_EQ(pt.constructStatus().error, PtError::Unsupported);
    EXPECT_EQ(pt.setCdb(kInquiry, sizeof(kInquiry)).error, PtError::Unsupported);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(PassThroughObjectTest, CdbMakesConfigured)
{
    PassThroughObject pt(m_transport);
    EXPECT_EQ(pt.setCdb(nullptr, 6).error, PtError::InvalidArgument);
    EXPECT_EQ(pt.state(), PtState::Constructed);

    ASSERT_TRUE(pt.setCdb(kInquiry, sizeof(kInquiry)).ok());
    EXPECT_EQ(pt.state(), PtState::Configured);
    EXPECT_EQ(m_transport.record.cdb, QByteArray(reinterpret_cast<const char*>(kInquiry), 6));
}

TEST_F(PassThroughObjectTest, BuffersAreForwarded)
{
    PassThroughObject pt(m_transport);
    AlignedBuffer cdb(bytes({0x2A, 0, 0, 0, 0, 0, 0, 0, 1, 0}), -1);
    AlignedBuffer out(QByteArray(512, '\x5A'), -1, 512);

    ASSERT_TRUE(pt.setCdb(cdb).ok());
    ASSERT_TRUE(pt.setSense(m_sense).ok());
    ASSERT_TRUE(pt.setDataOut(out).ok());

    EXPECT_EQ(m_transport.record.cdb.size(), 10);
    EXPECT_EQ(m_transport.record.senseMax, 32);
    EXPECT_EQ(m_transport.record.dataOut, QByteArray(512, '\x5A'));
    EXPECT_EQ(pt.setDataIn(nullptr, 4).error, PtError::InvalidArgument);
    EXPECT_EQ(pt.setDataOut(nullptr, -1).error, PtError::InvalidArgument);
}

TEST_F(PassThroughObjectTest, AttributesRecorded)
{
    PassThroughObject pt(m_transport);
    EXPECT_FALSE(pt.packetId().has_value());

    ASSERT_TRUE(pt.setPacketId(42).ok());
    ASSERT_TRUE(pt.setTag(0x1122334455ULL).ok());
    ASSERT_TRUE(pt.setTaskManagement(3).ok());
    ASSERT_TRUE(pt.setTaskAttribute(1, 7).ok());
    ASSERT_TRUE(pt.setFlags(PtFlagQueueAtHead).ok());
    ASSERT_TRUE(pt.setDirectIo(true).ok());

    EXPECT_EQ(pt.packetId(), 42);
    EXPECT_EQ(pt.tag(), 0x1122334455ULL);
    EXPECT_EQ(pt.taskManagement(), 3);
    EXPECT_EQ(pt.taskAttribute(1), 7);
    EXPECT_FALSE(pt.taskAttribute(2).has_value());
    EXPECT_EQ(pt.flags(), PtFlagQueueAtHead);

    EXPECT_EQ(m_transport.record.packetId, 42);
    EXPECT_EQ(m_transport.record.tag, 0x1122334455ULL);
    EXPECT_EQ(m_transport.record.taskAttributes.value(1), 7);
    EXPECT_EQ(m_transport.record.flags, PtFlagQueueAtHead);
    EXPECT_TRUE(m_transport.record.directIo);
}

TEST_F(PassThroughObjectTest, MissingFeaturesAreUnsupported)
{
    MockTransport minimal(PtFeatures(FeatureQueueFlags));
    PassThroughObject pt(minimal);

    EXPECT_EQ(pt.setPacketId(1).error, PtError::Unsupported);
    EXPECT_EQ(pt.setTag(1).error, PtError::Unsupported);
    EXPECT_EQ(pt.setTaskManagement(1).error, PtError::Unsupported);
    EXPECT_EQ(pt.setTaskAttribute(1, 1).error, PtError::Unsupported);
    EXPECT_EQ(pt.setDirectIo(true).error, PtError::Unsupported);
    EXPECT_TRUE(pt.setFlags(PtFlagQueueAtTail).ok());

    EXPECT_FALSE(pt.packetId().has_value());
    EXPECT_FALSE(pt.tag().has_value());
    EXPECT_FALSE(pt.taskManagement().has_value());
    EXPECT_FALSE(pt.taskAttribute(1).has_value());
    EXPECT_EQ(minimal.record.packetId, -1);
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(PassThroughObjectTest, InquiryGood)
{
    MockOutcome outcome;
    outcome.dataIn = QByteArray("\x00\x00\x05\x02", 4) + QByteArray("QSGPT   VIRTUAL");
    outcome.durationMs = 7;
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);

    ASSERT_TRUE(pt.execute(m_device, 20).ok());
    EXPECT_EQ(pt.state(), PtState::Executed);
    EXPECT_EQ(pt.resultCategory(), PtResultCategory::Good);
    EXPECT_EQ(pt.statusResponse(), 0x00);
    EXPECT_EQ(pt.senseLength(), 0);
    EXPECT_TRUE(pt.senseData().isEmpty());
    EXPECT_EQ(pt.durationMs(), 7);
    EXPECT_EQ(pt.osError(), 0);
    EXPECT_TRUE(pt.osErrorString().isEmpty());
    EXPECT_EQ(pt.errorCategory(), SenseCategory::Clean);

    EXPECT_EQ(m_transport.record.lastFd, m_device.fd());
    EXPECT_EQ(m_transport.record.lastTimeout, 20);
    EXPECT_EQ(m_dataIn[2], 0x05);
}

TEST_F(PassThroughObjectTest, CheckConditionNotReady)
{
    MockOutcome outcome;
    outcome.status = 0x02;
    outcome.sense = bytes({0x70, 0, 0x02, 0, 0, 0, 0, 0x0A, 0, 0, 0, 0, 0x3A, 0x00});
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);

    ASSERT_TRUE(pt.execute(m_device).ok());
    EXPECT_EQ(pt.resultCategory(), PtResultCategory::Sense);
    EXPECT_EQ(pt.senseLength(), 14);

    const QByteArray sense = pt.senseData();
    const std::optional<SenseHeader> header = SenseDecoder::normalize(sense);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->senseKey, 2);
    EXPECT_EQ(header->asc, 0x3A);
    EXPECT_EQ(SenseDecoder::categorize(sense), SenseCategory::NotReady);
    EXPECT_EQ(pt.errorCategory(), SenseCategory::NotReady);
}

TEST_F(PassThroughObjectTest, DescriptorSenseInformation)
{
    MockOutcome outcome;
    outcome.status = 0x02;
    outcome.sense = bytes({0x72, 0x03, 0x11, 0x00, 0, 0, 0, 0x0C,
                           0x00, 0x0A, 0x80, 0x00, 0, 0, 0, 0, 0, 0, 0x12, 0x34});
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    ASSERT_TRUE(pt.execute(m_device).ok());

    const SenseInfoField info = SenseDecoder::informationField(pt.senseData());
    EXPECT_TRUE(info.valid);
    EXPECT_EQ(info.value, 0x1234u);
    EXPECT_EQ(SenseDecoder::categorizeWithInfo(pt.senseData()), SenseCategory::MediumHardWithInfo);
}

TEST_F(PassThroughObjectTest, TimeoutThenClear)
{
    MockOutcome timeout;
    timeout.submitResult = PT_DO_TIMEOUT;
    timeout.hostStatus = 0x03;
    m_transport.script(timeout);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);

    const PtStatus status = pt.execute(m_device, 5);
    EXPECT_EQ(status.error, PtError::Timeout);
    EXPECT_EQ(pt.state(), PtState::Executed);
    EXPECT_EQ(pt.errorCategory(), SenseCategory::Timeout);

    // Executed objects must be cleared first
    EXPECT_EQ(pt.execute(m_device).error, PtError::InvalidArgument);
    EXPECT_EQ(pt.setPacketId(1).error, PtError::InvalidArgument);

    ASSERT_TRUE(pt.clear().ok());
    EXPECT_EQ(pt.state(), PtState::Configured);
    EXPECT_FALSE(pt.resultCategory().has_value());

    ASSERT_TRUE(pt.execute(m_device).ok());
    EXPECT_EQ(pt.errorCategory(), SenseCategory::Clean);
    EXPECT_EQ(m_transport.record.submitCount, 2);
    EXPECT_EQ(m_transport.record.lastTimeout, PassThroughObject::DEFAULT_TIMEOUT);
}

TEST_F(PassThroughObjectTest, OsErrorCarriesErrno)
{
    MockOutcome outcome;
    outcome.submitResult = -EBUSY;
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);

    const PtStatus status = pt.execute(m_device);
    EXPECT_EQ(status.error, PtError::OsError);
    EXPECT_EQ(status.osErrno, EBUSY);
    EXPECT_EQ(pt.osError(), EBUSY);
    EXPECT_EQ(pt.osErrorString(), safeStrerror(EBUSY));
    EXPECT_EQ(pt.resultCategory(), PtResultCategory::OsError);
    EXPECT_EQ(pt.errorCategory(), SenseCategory::Other);
}

TEST_F(PassThroughObjectTest, BadParametersKeepState)
{
    MockOutcome outcome;
    outcome.submitResult = PT_DO_BAD_PARAMS;
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);

    EXPECT_EQ(pt.execute(m_device).error, PtError::BadParameters);
    EXPECT_EQ(pt.state(), PtState::Configured);
    EXPECT_TRUE(pt.execute(m_device).ok());
}

TEST_F(PassThroughObjectTest, ExecuteWithoutCdb)
{
    PassThroughObject pt(m_transport);
    EXPECT_EQ(pt.execute(m_device).error, PtError::BadParameters);
    EXPECT_EQ(m_transport.record.submitCount, 0);
}

TEST_F(PassThroughObjectTest, ExecuteOnClosedDevice)
{
    DeviceHandle closed(m_transport);
    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    EXPECT_EQ(pt.execute(closed).error, PtError::InvalidArgument);
}

TEST_F(PassThroughObjectTest, TransportErrorDetails)
{
    MockOutcome outcome;
    outcome.hostStatus = 0x01;
    outcome.transportText = QStringLiteral("Host_status=0x01 [DID_NO_CONNECT]");
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    ASSERT_TRUE(pt.execute(m_device).ok());

    EXPECT_EQ(pt.resultCategory(), PtResultCategory::TransportError);
    EXPECT_EQ(pt.transportError(), 0x0100);
    EXPECT_EQ(pt.transportErrorString(), QStringLiteral("Host_status=0x01 [DID_NO_CONNECT]"));
    EXPECT_EQ(pt.errorCategory(), SenseCategory::Other);
}

TEST_F(PassThroughObjectTest, StatusCombinedWithSense)
{
    MockOutcome outcome;
    outcome.status = 0x18;
    outcome.sense = bytes({0x70, 0, 0x06, 0, 0, 0, 0, 0x0A, 0, 0, 0, 0, 0x29, 0x00});
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    ASSERT_TRUE(pt.execute(m_device).ok());

    EXPECT_EQ(pt.errorCategory(), SenseCategory::ReservationConflict);
}

TEST_F(PassThroughObjectTest, StatusWithoutSense)
{
    MockOutcome outcome;
    outcome.status = 0x08;
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    ASSERT_TRUE(pt.execute(m_device).ok());

    EXPECT_EQ(pt.resultCategory(), PtResultCategory::Status);
    EXPECT_EQ(pt.errorCategory(), SenseCategory::Busy);
}

TEST_F(PassThroughObjectTest, SenseTruncatedToBuffer)
{
    MockOutcome outcome;
    outcome.status = 0x02;
    outcome.sense = QByteArray(64, '\0');
    outcome.sense[0] = 0x70;
    outcome.sense[2] = 0x05;
    outcome.sense[7] = 56;
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    ASSERT_TRUE(pt.execute(m_device).ok());

    EXPECT_EQ(pt.senseLength(), 32);
    EXPECT_EQ(pt.senseData().size(), 32);
    EXPECT_EQ(pt.errorCategory(), SenseCategory::IllegalRequest);
}

TEST_F(PassThroughObjectTest, ResidualReported)
{
    MockOutcome outcome;
    outcome.resid = 12;
    m_transport.script(outcome);

    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    EXPECT_EQ(pt.resid(), 0);
    ASSERT_TRUE(pt.execute(m_device).ok());
    EXPECT_EQ(pt.resid(), 12);
}

TEST_F(PassThroughObjectTest, DurationNeedsFeature)
{
    MockTransport noDuration(PtFeatures(FeatureQueueFlags));
    DeviceHandle device(noDuration);
    ASSERT_TRUE(device.open(QStringLiteral("/dev/sg3")).ok());

    MockOutcome outcome;
    outcome.durationMs = 9;
    outcome.hostStatus = 0x07;
    outcome.transportText = QStringLiteral("hidden");
    noDuration.script(outcome);

    PassThroughObject pt(noDuration);
    configureInquiry(pt);
    ASSERT_TRUE(pt.execute(device).ok());
    EXPECT_FALSE(pt.durationMs().has_value());
    EXPECT_TRUE(pt.transportErrorString().isEmpty());
}

TEST_F(PassThroughObjectTest, ResultsUnavailableBeforeExecute)
{
    PassThroughObject pt(m_transport);
    configureInquiry(pt);

    EXPECT_FALSE(pt.resultCategory().has_value());
    EXPECT_FALSE(pt.statusResponse().has_value());
    EXPECT_FALSE(pt.durationMs().has_value());
    EXPECT_EQ(pt.senseLength(), 0);
    EXPECT_EQ(pt.transportError(), 0);
    EXPECT_TRUE(pt.senseData().isEmpty());
    EXPECT_EQ(pt.errorCategory(), SenseCategory::Other);
}

TEST_F(PassThroughObjectTest, ExecuteUsesAmbientDevice)
{
    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    EXPECT_EQ(pt.execute().error, PtError::InvalidArgument);

    {
        DeviceScope scope(m_device);
        ASSERT_TRUE(pt.execute().ok());
    }
    EXPECT_EQ(m_transport.record.lastFd, m_device.fd());
}

TEST_F(PassThroughObjectTest, TimeoutDefaultsToObjectSetting)
{
    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    pt.setTimeout(3);
    ASSERT_TRUE(pt.execute(m_device, -1, true).ok());
    EXPECT_EQ(m_transport.record.lastTimeout, 3);
    EXPECT_TRUE(m_transport.record.lastVerbose);
}

// =============================================================================
// Destruction
// =============================================================================

TEST_F(PassThroughObjectTest, DestructThenUseAfterFree)
{
    PassThroughObject pt(m_transport);
    configureInquiry(pt);
    ASSERT_TRUE(pt.destruct().ok());
    EXPECT_EQ(pt.state(), PtState::Destructed);

    EXPECT_EQ(pt.destruct().error, PtError::UseAfterFree);
    EXPECT_EQ(pt.setCdb(kInquiry, sizeof(kInquiry)).error, PtError::UseAfterFree);
    EXPECT_EQ(pt.setPacketId(1).error, PtError::UseAfterFree);
    EXPECT_EQ(pt.execute(m_device).error, PtError::UseAfterFree);
    EXPECT_EQ(pt.clear().error, PtError::UseAfterFree);
    EXPECT_FALSE(pt.resultCategory().has_value());
}

TEST_F(PassThroughObjectTest, MovedFromObjectIsReleased)
{
    PassThroughObject source(m_transport);
    configureInquiry(source);

    PassThroughObject target(std::move(source));
    EXPECT_EQ(target.state(), PtState::Configured);
    EXPECT_EQ(source.state(), PtState::Destructed);
    EXPECT_EQ(source.execute(m_device).error, PtError::UseAfterFree);
    EXPECT_TRUE(target.execute(m_device).ok());
}

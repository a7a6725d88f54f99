/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Linux SG_IO Transport Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "LinuxSgTransport.h"

#if defined(Q_OS_LINUX)

#include "../../util/Logger.h"

#include <QStringList>

#include <sys/ioctl.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <limits>
#include <string.h>
#include <scsi/sg.h>

namespace qsgpt {

// Transport version reported by version()
static constexpr int TRANSPORT_VERSION_MAJOR = 3;
static constexpr int TRANSPORT_VERSION_MINOR = 5;
static constexpr const char* TRANSPORT_VERSION_DATE = "20260301";

static constexpr int MAX_CDB_LENGTH = 16;
static constexpr int DEFAULT_TIMEOUT_SECS = 60;

// Host byte (linux scsi mid-level)
static constexpr int DID_OK = 0x00;
static constexpr int DID_TIME_OUT = 0x03;

// Driver byte
static constexpr int DRIVER_MASK = 0x0F;
static constexpr int DRIVER_TIMEOUT = 0x06;
static constexpr int DRIVER_SENSE = 0x08;

// SCSI status (before masking)
static constexpr int STATUS_CHECK_CONDITION = 0x02;
static constexpr int STATUS_COMMAND_TERMINATED = 0x22;

static const char* const kHostBytes[] = {
    "DID_OK", "DID_NO_CONNECT", "DID_BUS_BUSY", "DID_TIME_OUT",
    "DID_BAD_TARGET", "DID_ABORT", "DID_PARITY", "DID_ERROR",
    "DID_RESET", "DID_BAD_INTR", "DID_PASSTHROUGH", "DID_SOFT_ERROR",
    "DID_IMM_RETRY", "DID_REQUEUE", "DID_TRANSPORT_DISRUPTED",
    "DID_TRANSPORT_FAILFAST", "DID_TARGET_FAILURE", "DID_NEXUS_FAILURE",
    "DID_ALLOC_FAILURE", "DID_MEDIUM_ERROR",
};

static const char* const kDriverBytes[] = {
    "DRIVER_OK", "DRIVER_BUSY", "DRIVER_SOFT", "DRIVER_MEDIA",
    "DRIVER_ERROR", "DRIVER_INVALID", "DRIVER_TIMEOUT", "DRIVER_HARD",
    "DRIVER_SENSE",
};

static const char* const kDriverSuggests[] = {
    "SUGGEST_OK", "SUGGEST_RETRY", "SUGGEST_ABORT", "SUGGEST_REMAP",
    "SUGGEST_DIE", "UNKNOWN", "UNKNOWN", "UNKNOWN", "SUGGEST_SENSE",
};

template <int N>
static QString tableName(const char* const (&table)[N], int index)
{
    if (index >= 0 && index < N) {
        return QString::fromLatin1(table[index]);
    }
    return QStringLiteral("invalid");
}

// =============================================================================
// Native command
// =============================================================================

namespace {

class LinuxSgCommand : public NativeCommand
{
public:
    LinuxSgCommand()
    {
        clearResults();
    }

    void setCdb(const quint8* cdb, int length) override
    {
        m_cdb = cdb;
        m_cdbLength = length;
    }

    void setSense(quint8* sense, int maxLength) override
    {
        m_sense = sense;
        m_senseMax = maxLength;
    }

    void setDataIn(quint8* data, int length) override
    {
        m_dataIn = data;
        m_dataInLength = length;
    }

    void setDataOut(const quint8* data, int length) override
    {
        m_dataOut = data;
        m_dataOutLength = length;
    }

    void setPacketId(int packetId) override { m_packetId = packetId; }
    void setFlags(int flags) override { m_flags = flags; }
    void setDirectIo(bool enable) override { m_directIo = enable; }

    void clear() override
    {
        clearResults();
    }

    int submit(int fd, int timeoutSecs, bool verbose) override;

    PtResultCategory resultCategory() const override;
    quint8 status() const override { return static_cast<quint8>(m_hdr.status); }
    int resid() const override { return m_hdr.resid; }
    int senseLength() const override { return m_hdr.sb_len_wr; }
    int durationMs() const override { return m_submitted ? static_cast<int>(m_hdr.duration) : -1; }
    int osError() const override { return m_osError; }

    int transportError() const override
    {
        return (m_hdr.host_status << 8) | m_hdr.driver_status;
    }

    QString transportErrorString() const override
    {
        if (m_hdr.host_status == DID_OK && (m_hdr.driver_status & DRIVER_MASK) == 0) {
            return QString();
        }
        return LinuxSgTransport::transportErrorText(m_hdr.host_status, m_hdr.driver_status);
    }

    bool timedOut() const override
    {
        return m_hdr.host_status == DID_TIME_OUT ||
               (m_hdr.driver_status & DRIVER_MASK) == DRIVER_TIMEOUT;
    }

private:
    void clearResults()
    {
        memset(&m_hdr, 0, sizeof(m_hdr));
        m_osError = 0;
        m_submitted = false;
    }

    const quint8* m_cdb = nullptr;
    int m_cdbLength = 0;
    quint8* m_sense = nullptr;
    int m_senseMax = 0;
    quint8* m_dataIn = nullptr;
    int m_dataInLength = 0;
    const quint8* m_dataOut = nullptr;
    int m_dataOutLength = 0;
    int m_packetId = 0;
    int m_flags = 0;
    bool m_directIo = false;

    sg_io_hdr_t m_hdr;
    int m_osError = 0;
    bool m_submitted = false;
};

int LinuxSgCommand::submit(int fd, int timeoutSecs, bool verbose)
{
    clearResults();

    if (!m_cdb || m_cdbLength <= 0) {
        QSGPT_WARNING(LogCategory::Transport, QStringLiteral("No CDB given"));
        return PT_DO_BAD_PARAMS;
    }
    if (m_cdbLength > MAX_CDB_LENGTH) {
        QSGPT_WARNING(LogCategory::Transport,
                      QStringLiteral("CDB too long (%1 > %2 bytes)").arg(m_cdbLength).arg(MAX_CDB_LENGTH));
        return PT_DO_BAD_PARAMS;
    }
    if (m_dataIn && m_dataInLength > 0 && m_dataOut && m_dataOutLength > 0) {
        QSGPT_WARNING(LogCategory::Transport, QStringLiteral("Bidirectional transfer not supported by sg v3"));
        return PT_DO_BAD_PARAMS;
    }

    m_hdr.interface_id = 'S';
    m_hdr.cmd_len = static_cast<unsigned char>(m_cdbLength);
    m_hdr.cmdp = const_cast<unsigned char*>(m_cdb);

    if (m_sense && m_senseMax > 0) {
        m_hdr.sbp = m_sense;
        m_hdr.mx_sb_len = static_cast<unsigned char>(qMin(m_senseMax, 255));
        memset(m_sense, 0, static_cast<size_t>(m_senseMax));
    }

    if (m_dataIn && m_dataInLength > 0) {
        m_hdr.dxfer_direction = SG_DXFER_FROM_DEV;
        m_hdr.dxferp = m_dataIn;
        m_hdr.dxfer_len = static_cast<unsigned int>(m_dataInLength);
    } else if (m_dataOut && m_dataOutLength > 0) {
        m_hdr.dxfer_direction = SG_DXFER_TO_DEV;
        m_hdr.dxferp = const_cast<quint8*>(m_dataOut);
        m_hdr.dxfer_len = static_cast<unsigned int>(m_dataOutLength);
    } else {
        m_hdr.dxfer_direction = SG_DXFER_NONE;
    }

    m_hdr.timeout = LinuxSgTransport::timeoutMs(timeoutSecs);
    m_hdr.pack_id = m_packetId;

    // Neither or both queue flags: leave the driver default
    const int queueFlags = m_flags & (PtFlagQueueAtHead | PtFlagQueueAtTail);
    if (queueFlags == PtFlagQueueAtHead) {
        m_hdr.flags |= SG_FLAG_Q_AT_HEAD;
    } else if (queueFlags == PtFlagQueueAtTail) {
        m_hdr.flags |= SG_FLAG_Q_AT_TAIL;
    }
    if (m_directIo) {
        m_hdr.flags |= SG_FLAG_DIRECT_IO;
    }

    if (verbose) {
        Logger::instance().logHex(LogLevel::Debug, QString::fromLatin1(LogCategory::Transport),
                                  QStringLiteral("SG_IO cdb (fd=%1, timeout=%2 ms):").arg(fd).arg(m_hdr.timeout),
                                  m_cdb, m_cdbLength);
    }

    if (ioctl(fd, SG_IO, &m_hdr) < 0) {
        m_osError = errno;
        QSGPT_WARNING(LogCategory::Transport,
                      QStringLiteral("SG_IO ioctl failed: %1").arg(safeStrerror(m_osError)));
        return -m_osError;
    }
    m_submitted = true;

    if (verbose) {
        QSGPT_DEBUG(LogCategory::Transport,
                    QStringLiteral("SG_IO done: status=0x%1 host=0x%2 driver=0x%3 resid=%4 duration=%5 ms")
                        .arg(static_cast<int>(m_hdr.status), 2, 16, QLatin1Char('0'))
                        .arg(static_cast<int>(m_hdr.host_status), 2, 16, QLatin1Char('0'))
                        .arg(static_cast<int>(m_hdr.driver_status), 2, 16, QLatin1Char('0'))
                        .arg(m_hdr.resid)
                        .arg(m_hdr.duration));
        if (m_hdr.sb_len_wr > 0) {
            Logger::instance().logHex(LogLevel::Debug, QString::fromLatin1(LogCategory::Transport),
                                      QStringLiteral("SG_IO sense:"), m_sense, m_hdr.sb_len_wr);
        }
    }

    if (timedOut()) {
        return PT_DO_TIMEOUT;
    }
    return 0;
}

PtResultCategory LinuxSgCommand::resultCategory() const
{
    const int driver = m_hdr.driver_status & DRIVER_MASK;
    const int status = m_hdr.status & 0x7E;

    if (m_osError) {
        return PtResultCategory::OsError;
    }
    if (m_hdr.host_status) {
        return PtResultCategory::TransportError;
    }
    if (driver && driver != DRIVER_SENSE) {
        return PtResultCategory::TransportError;
    }
    if (driver == DRIVER_SENSE || status == STATUS_CHECK_CONDITION || status == STATUS_COMMAND_TERMINATED) {
        return PtResultCategory::Sense;
    }
    if (status) {
        return PtResultCategory::Status;
    }
    return PtResultCategory::Good;
}

} // namespace

// =============================================================================
// Transport
// =============================================================================

LinuxSgTransport::LinuxSgTransport()
    : PassThroughTransport(PtFeatures(FeaturePacketId | FeatureQueueFlags | FeatureDirectIo |
                                      FeatureDuration | FeatureTransportErrorString))
    , m_pageSize(static_cast<int>(sysconf(_SC_PAGESIZE)))
{
    if (m_pageSize <= 0) {
        m_pageSize = 4096;
    }
}

LinuxSgTransport::~LinuxSgTransport()
{
}

QString LinuxSgTransport::name() const
{
    return QStringLiteral("Linux sg v3 (SG_IO)");
}

QString LinuxSgTransport::version() const
{
    return QStringLiteral("%1.%2 %3")
        .arg(TRANSPORT_VERSION_MAJOR)
        .arg(TRANSPORT_VERSION_MINOR)
        .arg(QString::fromLatin1(TRANSPORT_VERSION_DATE));
}

int LinuxSgTransport::maxCdbLength() const
{
    return MAX_CDB_LENGTH;
}

int LinuxSgTransport::dmaAlignment() const
{
    return m_pageSize;
}

int LinuxSgTransport::openDevice(const QString& deviceName, int flags, bool verbose)
{
    const QByteArray pathBytes = deviceName.toLocal8Bit();
    const int fd = ::open(pathBytes.constData(), flags);

    if (fd < 0) {
        const int err = errno;
        QSGPT_WARNING(LogCategory::Transport,
                      QStringLiteral("Failed to open %1: %2").arg(deviceName, safeStrerror(err)));
        return -err;
    }

    if (verbose) {
        // Older sg drivers and non-sg nodes may not answer, SG_IO can still work
        int sgVersion = 0;
        if (ioctl(fd, SG_GET_VERSION_NUM, &sgVersion) == 0) {
            QSGPT_DEBUG(LogCategory::Transport,
                        QStringLiteral("Opened %1 (fd=%2), sg driver version %3")
                            .arg(deviceName).arg(fd).arg(sgVersion));
        } else {
            QSGPT_DEBUG(LogCategory::Transport,
                        QStringLiteral("Opened %1 (fd=%2), not an sg node").arg(deviceName).arg(fd));
        }
    }

    return fd;
}

int LinuxSgTransport::closeDevice(int fd)
{
    if (::close(fd) < 0) {
        const int err = errno;
        QSGPT_WARNING(LogCategory::Transport,
                      QStringLiteral("Failed to close fd %1: %2").arg(fd).arg(safeStrerror(err)));
        return -err;
    }
    return 0;
}

std::unique_ptr<NativeCommand> LinuxSgTransport::constructCommand()
{
    return std::unique_ptr<NativeCommand>(new LinuxSgCommand());
}

unsigned int LinuxSgTransport::timeoutMs(int timeoutSecs)
{
    const quint64 seconds = timeoutSecs > 0 ? static_cast<quint64>(timeoutSecs) : DEFAULT_TIMEOUT_SECS;
    const quint64 ms = seconds * 1000;
    return static_cast<unsigned int>(qMin<quint64>(ms, std::numeric_limits<unsigned int>::max()));
}

QString LinuxSgTransport::transportErrorText(int hostStatus, int driverStatus)
{
    QStringList parts;
    parts << QStringLiteral("Host_status=0x%1 [%2]")
                 .arg(hostStatus, 2, 16, QLatin1Char('0'))
                 .arg(tableName(kHostBytes, hostStatus));
    parts << QStringLiteral("Driver_status=0x%1 [%2, %3]")
                 .arg(driverStatus, 2, 16, QLatin1Char('0'))
                 .arg(tableName(kDriverBytes, driverStatus & DRIVER_MASK))
                 .arg(tableName(kDriverSuggests, (driverStatus >> 4) & 0x0F));
    return parts.join(QLatin1Char('\n'));
}

} // namespace qsgpt

#endif // Q_OS_LINUX

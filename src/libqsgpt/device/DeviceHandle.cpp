/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Device Handle Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "DeviceHandle.h"
#include "../passthrough/PassThroughTransport.h"
#include "../util/Logger.h"

#include <QThread>
#include <QThreadStorage>
#include <QVector>

#include <fcntl.h>

namespace qsgpt {

// Ambient handles of the calling thread, innermost last
static QVector<DeviceHandle*>& ambientStack()
{
    static QThreadStorage<QVector<DeviceHandle*>> stacks;
    return stacks.localData();
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

DeviceHandle::DeviceHandle(PassThroughTransport& transport)
    : m_transport(transport)
    , m_fd(-1)
    , m_flags(0)
    , m_verbose(false)
    , m_closed(false)
    , m_enterThread(nullptr)
    , m_enterCount(0)
{
}

DeviceHandle::DeviceHandle()
    : DeviceHandle(PassThroughTransport::defaultTransport())
{
}

DeviceHandle::~DeviceHandle()
{
    if (enteredElsewhere()) {
        QSGPT_ERROR(LogCategory::Device,
                    QStringLiteral("%1 destroyed while entered on another thread").arg(m_deviceName));
        m_enterCount = 0;
        m_enterThread = nullptr;
    }
    dropFromStack();
    if (isOpen()) {
        const PtStatus status = close();
        if (!status.ok()) {
            QSGPT_WARNING(LogCategory::Device, status.toString());
        }
    }
}

// =============================================================================
// Open / Close
// =============================================================================

PtStatus DeviceHandle::open(const QString& deviceName, bool readOnly, bool verbose)
{
    const int flags = (readOnly ? O_RDONLY : O_RDWR) | O_NONBLOCK;
    return openFlags(deviceName, flags, verbose);
}

PtStatus DeviceHandle::openFlags(const QString& deviceName, int flags, bool verbose)
{
    if (isOpen()) {
        return PtStatus::failure(PtError::InvalidArgument,
                                 QStringLiteral("%1 already open").arg(m_deviceName));
    }
    if (!m_transport.isAvailable()) {
        return PtStatus::failure(PtError::Unsupported,
                                 QStringLiteral("No pass-through transport on this platform"));
    }

    const int result = m_transport.openDevice(deviceName, flags, verbose);
    if (result < 0) {
        return PtStatus::failure(PtError::OsError,
                                 QStringLiteral("open %1: %2").arg(deviceName, safeStrerror(result)),
                                 -result);
    }

    m_deviceName = deviceName;
    m_fd = result;
    m_flags = flags;
    m_verbose = verbose;
    m_closed = false;

    QSGPT_DEBUG(LogCategory::Device, QStringLiteral("Opened %1 (fd=%2)").arg(deviceName).arg(m_fd));
    return PtStatus::success();
}

PtStatus DeviceHandle::close()
{
    if (m_closed) {
        return PtStatus::failure(PtError::UseAfterFree,
                                 QStringLiteral("%1 already closed").arg(m_deviceName));
    }
    if (!isOpen()) {
        return PtStatus::failure(PtError::InvalidArgument, QStringLiteral("Device not open"));
    }

    if (enteredElsewhere()) {
        return PtStatus::failure(PtError::InvalidArgument,
                                 QStringLiteral("%1 is entered on another thread, exit it there first")
                                     .arg(m_deviceName));
    }
    dropFromStack();

    const int fd = m_fd;
    m_fd = -1;
    m_closed = true;

    const int result = m_transport.closeDevice(fd);
    if (result < 0) {
        return PtStatus::failure(PtError::OsError,
                                 QStringLiteral("close %1: %2").arg(m_deviceName, safeStrerror(result)),
                                 -result);
    }

    QSGPT_DEBUG(LogCategory::Device, QStringLiteral("Closed %1").arg(m_deviceName));
    return PtStatus::success();
}

// =============================================================================
// Ambient stack
// =============================================================================

PtStatus DeviceHandle::enter()
{
    if (!isOpen()) {
        return PtStatus::failure(PtError::InvalidArgument,
                                 QStringLiteral("Cannot enter a device that is not open"));
    }
    if (enteredElsewhere()) {
        return PtStatus::failure(PtError::InvalidArgument,
                                 QStringLiteral("%1 is already entered on another thread").arg(m_deviceName));
    }
    ambientStack().append(this);
    m_enterThread = QThread::currentThread();
    ++m_enterCount;
    return PtStatus::success();
}

bool DeviceHandle::enteredElsewhere() const
{
    return m_enterCount > 0 && m_enterThread != QThread::currentThread();
}

// Only the entering thread's stack can hold this handle
void DeviceHandle::dropFromStack()
{
    if (m_enterCount > 0 && !enteredElsewhere()) {
        ambientStack().removeAll(this);
        m_enterCount = 0;
        m_enterThread = nullptr;
    }
}

void DeviceHandle::exit()
{
    QVector<DeviceHandle*>& stack = ambientStack();

    if (!stack.isEmpty() && stack.last() == this) {
        stack.removeLast();
        releaseEntry();
        return;
    }

    const int index = stack.lastIndexOf(this);
    if (index >= 0) {
        QSGPT_WARNING(LogCategory::Device,
                      QStringLiteral("%1 left the device stack out of order").arg(m_deviceName));
        stack.remove(index);
        releaseEntry();
    } else {
        QSGPT_WARNING(LogCategory::Device,
                      QStringLiteral("exit() on %1 which is not entered").arg(m_deviceName));
    }
}

void DeviceHandle::releaseEntry()
{
    if (--m_enterCount == 0) {
        m_enterThread = nullptr;
    }
}

DeviceHandle* DeviceHandle::current()
{
    const QVector<DeviceHandle*>& stack = ambientStack();
    return stack.isEmpty() ? nullptr : stack.last();
}

int DeviceHandle::ambientDepth()
{
    return static_cast<int>(ambientStack().size());
}

// =============================================================================
// DeviceScope
// =============================================================================

DeviceScope::DeviceScope(DeviceHandle& handle)
    : m_handle(handle)
    , m_status(handle.enter())
{
    if (!m_status.ok()) {
        QSGPT_WARNING(LogCategory::Device, m_status.toString());
    }
}

DeviceScope::~DeviceScope()
{
    // close() already took the handle off the stack
    if (m_status.ok() && m_handle.isOpen()) {
        m_handle.exit();
    }
}

} // namespace qsgpt

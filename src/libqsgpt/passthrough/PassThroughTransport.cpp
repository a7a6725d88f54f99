/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Pass-through Transport Selection
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "PassThroughTransport.h"

#if defined(Q_OS_LINUX)
#include "platform/LinuxSgTransport.h"
#endif

#include <errno.h>

namespace qsgpt {

// =============================================================================
// UnsupportedTransport
// =============================================================================

UnsupportedTransport::UnsupportedTransport()
    : PassThroughTransport(PtFeatures())
{
}

QString UnsupportedTransport::name() const
{
    return QStringLiteral("unsupported");
}

QString UnsupportedTransport::version() const
{
    return QStringLiteral("0.0 00000000");
}

int UnsupportedTransport::openDevice(const QString& deviceName, int flags, bool verbose)
{
    Q_UNUSED(deviceName)
    Q_UNUSED(flags)
    Q_UNUSED(verbose)
    return -ENOSYS;
}

int UnsupportedTransport::closeDevice(int fd)
{
    Q_UNUSED(fd)
    return -ENOSYS;
}

std::unique_ptr<NativeCommand> UnsupportedTransport::constructCommand()
{
    return nullptr;
}

// =============================================================================
// Platform default
// =============================================================================

PassThroughTransport& PassThroughTransport::defaultTransport()
{
#if defined(Q_OS_LINUX)
    static LinuxSgTransport transport;
#else
    static UnsupportedTransport transport;
#endif
    return transport;
}

} // namespace qsgpt

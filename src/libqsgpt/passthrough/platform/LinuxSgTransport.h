/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Linux SG_IO Transport Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_LINUXSGTRANSPORT_H
#define QSGPT_LINUXSGTRANSPORT_H

#include "../PassThroughTransport.h"

#if defined(Q_OS_LINUX)

namespace qsgpt {

/**
 * @brief Pass-through over the Linux sg v3 interface (SG_IO ioctl)
 *
 * Works on /dev/sg* as well as block and tape nodes that accept SG_IO.
 */
class LIBQSGPT_EXPORT LinuxSgTransport : public PassThroughTransport
{
public:
    LinuxSgTransport();
    ~LinuxSgTransport() override;

    QString name() const override;
    QString version() const override;
    int maxCdbLength() const override;
    int dmaAlignment() const override;

    int openDevice(const QString& deviceName, int flags, bool verbose) override;
    int closeDevice(int fd) override;

    std::unique_ptr<NativeCommand> constructCommand() override;

    /**
     * @brief sg_io_hdr timeout for @p timeoutSecs (0 or less: 60 s), capped at UINT_MAX ms
     */
    static unsigned int timeoutMs(int timeoutSecs);

    /**
     * @brief "Host_status=..." / "Driver_status=..." text for the raw codes
     */
    static QString transportErrorText(int hostStatus, int driverStatus);

private:
    int m_pageSize;
};

} // namespace qsgpt

#endif // Q_OS_LINUX

#endif // QSGPT_LINUXSGTRANSPORT_H

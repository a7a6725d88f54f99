/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Device Handle Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_DEVICEHANDLE_H
#define QSGPT_DEVICEHANDLE_H

#include "../libqsgpt_global.h"
#include "../core/PtTypes.h"

#include <QString>

QT_FORWARD_DECLARE_CLASS(QThread)

namespace qsgpt {

class PassThroughTransport;

/**
 * @brief Open pass-through device descriptor
 *
 * Closes itself on destruction. A handle may be made the calling
 * thread's ambient execution target with enter()/exit() (or a DeviceScope);
 * PassThroughObject::execute() without an explicit device uses the most
 * recently entered handle.
 *
 * While entered, the handle belongs to the entering thread: entering it
 * from another thread or closing it there is refused until it has been
 * exited.
 */
class LIBQSGPT_EXPORT DeviceHandle
{
public:
    explicit DeviceHandle(PassThroughTransport& transport);
    DeviceHandle();
    ~DeviceHandle();

    DeviceHandle(const DeviceHandle&) = delete;
    DeviceHandle& operator=(const DeviceHandle&) = delete;

    /**
     * @brief Open read-write or read-only, non-blocking
     */
    PtStatus open(const QString& deviceName, bool readOnly = false, bool verbose = false);

    /**
     * @brief Open with explicit open(2) flags
     */
    PtStatus openFlags(const QString& deviceName, int flags, bool verbose = false);

    /**
     * @brief Release the descriptor
     * @return UseAfterFree if already closed, InvalidArgument if never opened
     *         or still entered on another thread
     */
    PtStatus close();

    bool isOpen() const { return m_fd >= 0; }
    int fd() const { return m_fd; }
    QString deviceName() const { return m_deviceName; }
    int flags() const { return m_flags; }
    bool isVerbose() const { return m_verbose; }

    PassThroughTransport& transport() const { return m_transport; }

    /**
     * @brief Push this handle as the thread's ambient target
     * @return InvalidArgument if not open or still entered on another thread
     */
    PtStatus enter();

    /**
     * @brief Remove this handle from the ambient stack
     */
    void exit();

    /**
     * @brief Current ambient handle of the calling thread, or nullptr
     */
    static DeviceHandle* current();

    /**
     * @brief Number of handles entered on the calling thread
     */
    static int ambientDepth();

private:
    PassThroughTransport& m_transport;
    QString m_deviceName;
    int m_fd;
    int m_flags;
    bool m_verbose;
    bool m_closed;
    QThread* m_enterThread;
    int m_enterCount;

    bool enteredElsewhere() const;
    void dropFromStack();
    void releaseEntry();
};

/**
 * @brief Scoped enter()/exit() of a DeviceHandle
 */
class LIBQSGPT_EXPORT DeviceScope
{
public:
    explicit DeviceScope(DeviceHandle& handle);
    ~DeviceScope();

    DeviceScope(const DeviceScope&) = delete;
    DeviceScope& operator=(const DeviceScope&) = delete;

    /**
     * @brief Result of the enter() made by the constructor
     */
    PtStatus status() const { return m_status; }
    bool isActive() const { return m_status.ok(); }

private:
    DeviceHandle& m_handle;
    PtStatus m_status;
};

} // namespace qsgpt

#endif // QSGPT_DEVICEHANDLE_H

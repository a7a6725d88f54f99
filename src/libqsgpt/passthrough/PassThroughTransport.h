/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Pass-through Transport Interface
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_PASSTHROUGHTRANSPORT_H
#define QSGPT_PASSTHROUGHTRANSPORT_H

#include "../libqsgpt_global.h"
#include "../core/PtTypes.h"

#include <QString>

#include <memory>

namespace qsgpt {

/**
 * @brief OS-level command context owned by a PassThroughObject
 *
 * Buffers passed to the setters are referenced, not copied. submit()
 * blocks until the device answers or the timeout expires and returns
 * 0 on success, PT_DO_BAD_PARAMS, PT_DO_TIMEOUT or a negated errno.
 *
 * Optional capabilities have no-op defaults; callers consult
 * PassThroughTransport::features() before using them.
 */
class LIBQSGPT_EXPORT NativeCommand
{
public:
    virtual ~NativeCommand() = default;

    virtual void setCdb(const quint8* cdb, int length) = 0;
    virtual void setSense(quint8* sense, int maxLength) = 0;
    virtual void setDataIn(quint8* data, int length) = 0;
    virtual void setDataOut(const quint8* data, int length) = 0;

    virtual void setPacketId(int packetId) { Q_UNUSED(packetId) }
    virtual void setTag(quint64 tag) { Q_UNUSED(tag) }
    virtual void setTaskManagement(int function) { Q_UNUSED(function) }
    virtual void setTaskAttribute(int attribute, int priority) { Q_UNUSED(attribute) Q_UNUSED(priority) }
    virtual void setFlags(int flags) { Q_UNUSED(flags) }
    virtual void setDirectIo(bool enable) { Q_UNUSED(enable) }

    /**
     * @brief Reset results and native state, keep attached buffers
     */
    virtual void clear() = 0;

    virtual int submit(int fd, int timeoutSecs, bool verbose) = 0;

    virtual PtResultCategory resultCategory() const = 0;
    virtual quint8 status() const = 0;
    virtual int resid() const = 0;
    virtual int senseLength() const = 0;

    /**
     * @brief Command duration, -1 if the transport did not measure it
     */
    virtual int durationMs() const { return -1; }

    virtual int osError() const = 0;
    virtual int transportError() const = 0;
    virtual QString transportErrorString() const { return QString(); }

    /**
     * @brief True if the transport (not the device) reported a timeout
     */
    virtual bool timedOut() const = 0;
};

/**
 * @brief Platform pass-through mechanism
 *
 * The capability set is fixed when the transport is created so that
 * callers ask once instead of probing per call.
 */
class LIBQSGPT_EXPORT PassThroughTransport
{
public:
    virtual ~PassThroughTransport() = default;

    PassThroughTransport(const PassThroughTransport&) = delete;
    PassThroughTransport& operator=(const PassThroughTransport&) = delete;

    virtual QString name() const = 0;

    /**
     * @brief "<major>.<minor> <yyyymmdd>"
     */
    virtual QString version() const = 0;

    /**
     * @brief False for the placeholder on platforms without pass-through
     */
    virtual bool isAvailable() const { return true; }

    PtFeatures features() const { return m_features; }
    bool supports(PtFeature feature) const { return m_features.testFlag(feature); }

    virtual int maxCdbLength() const = 0;

    /**
     * @brief Required data buffer alignment in bytes (0 = none)
     */
    virtual int dmaAlignment() const = 0;

    /**
     * @return File descriptor, or a negated errno
     */
    virtual int openDevice(const QString& deviceName, int flags, bool verbose) = 0;

    /**
     * @return 0, or a negated errno
     */
    virtual int closeDevice(int fd) = 0;

    /**
     * @return New native command, null if it could not be allocated
     */
    virtual std::unique_ptr<NativeCommand> constructCommand() = 0;

    /**
     * @brief Transport for the current platform
     */
    static PassThroughTransport& defaultTransport();

protected:
    explicit PassThroughTransport(PtFeatures features)
        : m_features(features)
    {
    }

private:
    PtFeatures m_features;
};

/**
 * @brief Stand-in where no pass-through mechanism is implemented
 *
 * Opening a device and constructing a command always fail.
 */
class LIBQSGPT_EXPORT UnsupportedTransport : public PassThroughTransport
{
public:
    UnsupportedTransport();

    QString name() const override;
    QString version() const override;
    bool isAvailable() const override { return false; }
    int maxCdbLength() const override { return 0; }
    int dmaAlignment() const override { return 0; }
    int openDevice(const QString& deviceName, int flags, bool verbose) override;
    int closeDevice(int fd) override;
    std::unique_ptr<NativeCommand> constructCommand() override;
};

} // namespace qsgpt

#endif // QSGPT_PASSTHROUGHTRANSPORT_H

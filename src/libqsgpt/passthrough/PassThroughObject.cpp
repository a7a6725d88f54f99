/*
 * QSgPt - Qt-based SCSI pass-through toolkit
 * libqsgpt - Pass-through Core Library
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "PassThroughObject.h"
#include "PassThroughTransport.h"

#include "buffer/AlignedBuffer.h"
#include "device/DeviceHandle.h"
#include "sense/SenseDecoder.h"
#include "util/Logger.h"

#include <QMap>

#include <memory>
#include <utility>

namespace qsgpt {

static PtStatus useAfterFree()
{
    return PtStatus::failure(PtError::UseAfterFree, QStringLiteral("Pass-through object already destructed"));
}

static PtStatus unsupported(const char *what)
{
    return PtStatus::failure(PtError::Unsupported,
                             QStringLiteral("Transport does not support %1").arg(QLatin1String(what)));
}

// ============================================================================
// PassThroughObject Private Implementation
// ============================================================================

class PassThroughObject::Private
{
public:
    explicit Private(PassThroughTransport &t)
        : transport(t)
    {
    }

    PassThroughTransport &transport;
    std::unique_ptr<NativeCommand> native;
    PtStatus constructStatus;
    PtState state = PtState::Unconstructed;
    int timeoutSeconds = DEFAULT_TIMEOUT;

    bool hasCdb = false;
    quint8 *sense = nullptr;
    int senseMax = 0;

    std::optional<int> packetId;
    std::optional<quint64> tag;
    std::optional<int> taskManagement;
    QMap<int, int> taskAttributes;
    int flags = 0;

    PtStatus checkUsable() const;
    PtStatus checkConfigurable() const;
    bool executed() const { return state == PtState::Executed; }
};

PtStatus PassThroughObject::Private::checkUsable() const
{
    if (state == PtState::Destructed) {
        return useAfterFree();
    }
    if (state == PtState::Unconstructed || !native) {
        return constructStatus;
    }
    return PtStatus::success();
}

PtStatus PassThroughObject::Private::checkConfigurable() const
{
    PtStatus status = checkUsable();
    if (!status.ok()) {
        return status;
    }
    if (state == PtState::Executed) {
        return PtStatus::failure(PtError::InvalidArgument,
                                 QStringLiteral("Command already executed, clear() it first"));
    }
    return status;
}

// ============================================================================
// PassThroughObject Implementation
// ============================================================================

PassThroughObject::PassThroughObject(PassThroughTransport &transport)
    : d(new Private(transport))
{
    if (!transport.isAvailable()) {
        d->constructStatus = PtStatus::failure(PtError::Unsupported,
                                               QStringLiteral("No pass-through transport on this platform"));
        return;
    }

    d->native = transport.constructCommand();
    if (!d->native) {
        d->constructStatus = PtStatus::failure(PtError::ResourceExhausted,
                                               QStringLiteral("Could not allocate %1 command")
                                                   .arg(transport.name()));
        QSGPT_ERROR(LogCategory::PassThrough, d->constructStatus.message);
        return;
    }

    d->state = PtState::Constructed;
}

PassThroughObject::PassThroughObject()
    : PassThroughObject(PassThroughTransport::defaultTransport())
{
}

PassThroughObject::~PassThroughObject()
{
    delete d;
}

PassThroughObject::PassThroughObject(PassThroughObject &&other) noexcept
    : d(other.d)
{
    other.d = nullptr;
}

PassThroughObject &PassThroughObject::operator=(PassThroughObject &&other) noexcept
{
    if (this != &other) {
        delete d;
        d = other.d;
        other.d = nullptr;
    }
    return *this;
}

PtStatus PassThroughObject::constructStatus() const
{
    return d ? d->constructStatus : useAfterFree();
}

PtState PassThroughObject::state() const
{
    return d ? d->state : PtState::Destructed;
}

// === Buffers ===

PtStatus PassThroughObject::setCdb(const quint8 *cdb, int length)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (!cdb || length <= 0) {
        return PtStatus::failure(PtError::InvalidArgument, QStringLiteral("Empty CDB"));
    }

    d->native->setCdb(cdb, length);
    d->hasCdb = true;
    d->state = PtState::Configured;
    return status;
}

PtStatus PassThroughObject::setCdb(const AlignedBuffer &cdb)
{
    return setCdb(cdb.constData(), cdb.size());
}

PtStatus PassThroughObject::setSense(quint8 *sense, int maxLength)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (!sense || maxLength < 0) {
        return PtStatus::failure(PtError::InvalidArgument, QStringLiteral("Invalid sense buffer"));
    }

    d->native->setSense(sense, maxLength);
    d->sense = sense;
    d->senseMax = maxLength;
    return status;
}

PtStatus PassThroughObject::setSense(AlignedBuffer &sense)
{
    return setSense(sense.data(), sense.size());
}

PtStatus PassThroughObject::setDataIn(quint8 *data, int length)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (length < 0 || (!data && length > 0)) {
        return PtStatus::failure(PtError::InvalidArgument, QStringLiteral("Invalid data-in buffer"));
    }

    d->native->setDataIn(data, length);
    return status;
}

PtStatus PassThroughObject::setDataIn(AlignedBuffer &data)
{
    return setDataIn(data.data(), data.size());
}

PtStatus PassThroughObject::setDataOut(const quint8 *data, int length)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (length < 0 || (!data && length > 0)) {
        return PtStatus::failure(PtError::InvalidArgument, QStringLiteral("Invalid data-out buffer"));
    }

    d->native->setDataOut(data, length);
    return status;
}

PtStatus PassThroughObject::setDataOut(const AlignedBuffer &data)
{
    return setDataOut(data.constData(), data.size());
}

// === Attributes ===

PtStatus PassThroughObject::setPacketId(int packetId)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (!d->transport.supports(FeaturePacketId)) {
        return unsupported("packet ids");
    }

    d->native->setPacketId(packetId);
    d->packetId = packetId;
    return status;
}

PtStatus PassThroughObject::setTag(quint64 tag)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (!d->transport.supports(FeatureTag)) {
        return unsupported("command tags");
    }

    d->native->setTag(tag);
    d->tag = tag;
    return status;
}

PtStatus PassThroughObject::setTaskManagement(int function)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (!d->transport.supports(FeatureTaskManagement)) {
        return unsupported("task management functions");
    }

    d->native->setTaskManagement(function);
    d->taskManagement = function;
    return status;
}

PtStatus PassThroughObject::setTaskAttribute(int attribute, int priority)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (!d->transport.supports(FeatureTaskAttribute)) {
        return unsupported("task attributes");
    }

    d->native->setTaskAttribute(attribute, priority);
    d->taskAttributes.insert(attribute, priority);
    return status;
}

PtStatus PassThroughObject::setFlags(int flags)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (!d->transport.supports(FeatureQueueFlags)) {
        return unsupported("pass-through flags");
    }

    d->native->setFlags(flags);
    d->flags = flags;
    return status;
}

PtStatus PassThroughObject::setDirectIo(bool enable)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkConfigurable();
    if (!status.ok()) {
        return status;
    }
    if (!d->transport.supports(FeatureDirectIo)) {
        return unsupported("direct I/O");
    }

    d->native->setDirectIo(enable);
    return status;
}

std::optional<int> PassThroughObject::packetId() const
{
    return d ? d->packetId : std::nullopt;
}

std::optional<quint64> PassThroughObject::tag() const
{
    return d ? d->tag : std::nullopt;
}

std::optional<int> PassThroughObject::taskManagement() const
{
    return d ? d->taskManagement : std::nullopt;
}

std::optional<int> PassThroughObject::taskAttribute(int attribute) const
{
    if (!d || !d->taskAttributes.contains(attribute)) {
        return std::nullopt;
    }
    return d->taskAttributes.value(attribute);
}

int PassThroughObject::flags() const
{
    return d ? d->flags : 0;
}

void PassThroughObject::setTimeout(int seconds)
{
    if (d) {
        d->timeoutSeconds = seconds;
    }
}

int PassThroughObject::timeout() const
{
    return d ? d->timeoutSeconds : DEFAULT_TIMEOUT;
}

// === Execution ===

PtStatus PassThroughObject::execute(DeviceHandle &device, int timeoutSecs, bool verbose)
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkUsable();
    if (!status.ok()) {
        return status;
    }
    if (d->state == PtState::Executed) {
        return PtStatus::failure(PtError::InvalidArgument,
                                 QStringLiteral("Command already executed, clear() it first"));
    }
    if (!d->hasCdb) {
        return PtStatus::failure(PtError::BadParameters, QStringLiteral("No CDB set"));
    }
    if (!device.isOpen()) {
        return PtStatus::failure(PtError::InvalidArgument, QStringLiteral("Device not open"));
    }

    const int timeout = timeoutSecs >= 0 ? timeoutSecs : d->timeoutSeconds;
    if (verbose) {
        QSGPT_DEBUG(LogCategory::PassThrough,
                    QStringLiteral("Executing on %1 (timeout %2 s)").arg(device.deviceName()).arg(timeout));
    }

    const int result = d->native->submit(device.fd(), timeout, verbose);

    if (result < 0) {
        d->state = PtState::Executed;
        return PtStatus::failure(PtError::OsError,
                                 QStringLiteral("Pass-through on %1 failed: %2")
                                     .arg(device.deviceName(), safeStrerror(result)),
                                 -result);
    }

    switch (result) {
    case 0:
        d->state = PtState::Executed;
        return PtStatus::success();
    case PT_DO_TIMEOUT:
        d->state = PtState::Executed;
        QSGPT_WARNING(LogCategory::PassThrough,
                      QStringLiteral("Command timed out on %1 after %2 s").arg(device.deviceName()).arg(timeout));
        return PtStatus::failure(PtError::Timeout,
                                 QStringLiteral("Command timed out after %1 s").arg(timeout));
    case PT_DO_BAD_PARAMS:
        return PtStatus::failure(PtError::BadParameters,
                                 QStringLiteral("Transport rejected the command setup"));
    default:
        return PtStatus::failure(PtError::BadParameters,
                                 QStringLiteral("Unexpected transport result %1").arg(result));
    }
}

PtStatus PassThroughObject::execute(int timeoutSecs, bool verbose)
{
    DeviceHandle *device = DeviceHandle::current();
    if (!device) {
        if (!d) {
            return useAfterFree();
        }
        return PtStatus::failure(PtError::InvalidArgument, QStringLiteral("No device given and none entered"));
    }
    return execute(*device, timeoutSecs, verbose);
}

PtStatus PassThroughObject::clear()
{
    if (!d) {
        return useAfterFree();
    }
    PtStatus status = d->checkUsable();
    if (!status.ok()) {
        return status;
    }

    d->native->clear();
    d->state = d->hasCdb ? PtState::Configured : PtState::Constructed;
    return status;
}

PtStatus PassThroughObject::destruct()
{
    if (!d || d->state == PtState::Destructed) {
        return useAfterFree();
    }

    d->native.reset();
    d->sense = nullptr;
    d->senseMax = 0;
    d->state = PtState::Destructed;
    return PtStatus::success();
}

// === Results ===

std::optional<PtResultCategory> PassThroughObject::resultCategory() const
{
    if (!d || !d->executed()) {
        return std::nullopt;
    }
    return d->native->resultCategory();
}

std::optional<quint8> PassThroughObject::statusResponse() const
{
    if (!d || !d->executed()) {
        return std::nullopt;
    }
    return d->native->status();
}

int PassThroughObject::resid() const
{
    return (d && d->executed()) ? d->native->resid() : 0;
}

int PassThroughObject::senseLength() const
{
    return (d && d->executed()) ? d->native->senseLength() : 0;
}

std::optional<int> PassThroughObject::durationMs() const
{
    if (!d || !d->executed() || !d->transport.supports(FeatureDuration)) {
        return std::nullopt;
    }
    const int duration = d->native->durationMs();
    if (duration < 0) {
        return std::nullopt;
    }
    return duration;
}

int PassThroughObject::osError() const
{
    return (d && d->executed()) ? d->native->osError() : 0;
}

QString PassThroughObject::osErrorString() const
{
    const int err = osError();
    return err ? safeStrerror(err) : QString();
}

int PassThroughObject::transportError() const
{
    return (d && d->executed()) ? d->native->transportError() : 0;
}

QString PassThroughObject::transportErrorString() const
{
    if (!d || !d->executed() || !d->transport.supports(FeatureTransportErrorString)) {
        return QString();
    }
    return d->native->transportErrorString();
}

QByteArray PassThroughObject::senseData() const
{
    if (!d || !d->executed() || !d->sense) {
        return QByteArray();
    }
    const int length = qMin(d->native->senseLength(), d->senseMax);
    if (length <= 0) {
        return QByteArray();
    }
    return QByteArray(reinterpret_cast<const char *>(d->sense), length);
}

SenseCategory PassThroughObject::errorCategory() const
{
    if (!d || !d->executed()) {
        return SenseCategory::Other;
    }

    if (d->native->osError()) {
        return SenseCategory::Other;
    }
    if (d->native->timedOut()) {
        return SenseCategory::Timeout;
    }
    if (d->native->resultCategory() == PtResultCategory::TransportError) {
        return SenseCategory::Other;
    }

    const SenseCategory statusCategory = SenseDecoder::categorizeStatus(d->native->status());
    const QByteArray sense = senseData();
    if (sense.isEmpty()) {
        return statusCategory;
    }

    // CHECK CONDITION only says "look at the sense data"
    const SenseCategory senseCategory = SenseDecoder::categorize(sense);
    if (statusCategory == SenseCategory::Sense) {
        return senseCategory;
    }
    return SenseDecoder::combine(statusCategory, senseCategory);
}

} // namespace qsgpt

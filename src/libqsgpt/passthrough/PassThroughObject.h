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

#pragma once

#include "libqsgpt_global.h"
#include "core/PtTypes.h"
#include "sense/SenseTypes.h"

#include <QByteArray>
#include <QString>

#include <optional>

namespace qsgpt {

class AlignedBuffer;
class DeviceHandle;
class PassThroughTransport;

/**
 * @brief Lifecycle state of a PassThroughObject
 */
enum class PtState {
    Unconstructed,  ///< Native command could not be created
    Constructed,    ///< Ready, no CDB yet
    Configured,     ///< CDB attached, executable
    Executed,       ///< Results readable, clear() before the next execute()
    Destructed      ///< Released, every call fails with UseAfterFree
};

/**
 * @brief One SCSI command in flight through a pass-through transport
 *
 * Owns the transport's native command. Typical use:
 *
 * @code
 * PassThroughObject pt;
 * pt.setCdb(cdb, sizeof(cdb));
 * pt.setSense(sense, sizeof(sense));
 * pt.setDataIn(buffer);
 * PtStatus status = pt.execute(device);
 * @endcode
 *
 * Buffers are referenced, not copied; they must stay alive until execute()
 * returns. execute() blocks for the duration of the command. A command may
 * be executed again after clear(), which keeps the attached buffers.
 *
 * Not thread-safe; distinct objects may run on distinct threads.
 */
class LIBQSGPT_EXPORT PassThroughObject
{
public:
    static constexpr int DEFAULT_TIMEOUT = 60;

    /**
     * @brief Construct the native command
     *
     * On failure state() is Unconstructed and constructStatus() says why.
     */
    explicit PassThroughObject(PassThroughTransport &transport);
    PassThroughObject();
    ~PassThroughObject();

    PassThroughObject(const PassThroughObject &) = delete;
    PassThroughObject &operator=(const PassThroughObject &) = delete;

    PassThroughObject(PassThroughObject &&other) noexcept;
    PassThroughObject &operator=(PassThroughObject &&other) noexcept;

    PtStatus constructStatus() const;
    PtState state() const;

    // === Configuration ===

    PtStatus setCdb(const quint8 *cdb, int length);
    PtStatus setCdb(const AlignedBuffer &cdb);
    PtStatus setSense(quint8 *sense, int maxLength);
    PtStatus setSense(AlignedBuffer &sense);
    PtStatus setDataIn(quint8 *data, int length);
    PtStatus setDataIn(AlignedBuffer &data);
    PtStatus setDataOut(const quint8 *data, int length);
    PtStatus setDataOut(const AlignedBuffer &data);

    /**
     * @brief Optional attributes, Unsupported if the transport lacks them
     */
    PtStatus setPacketId(int packetId);
    PtStatus setTag(quint64 tag);
    PtStatus setTaskManagement(int function);
    PtStatus setTaskAttribute(int attribute, int priority);
    PtStatus setFlags(int flags);
    PtStatus setDirectIo(bool enable);

    std::optional<int> packetId() const;
    std::optional<quint64> tag() const;
    std::optional<int> taskManagement() const;
    std::optional<int> taskAttribute(int attribute) const;
    int flags() const;

    /**
     * @brief Timeout used when execute() is given none, in seconds
     */
    void setTimeout(int seconds);
    int timeout() const;

    // === Execution ===

    /**
     * @brief Submit the command to @p device and wait for completion
     * @param timeoutSecs Seconds, negative for timeout()
     * @return OsError, Timeout, BadParameters or InvalidArgument on failure
     */
    PtStatus execute(DeviceHandle &device, int timeoutSecs = -1, bool verbose = false);

    /**
     * @brief Submit to the calling thread's ambient device
     */
    PtStatus execute(int timeoutSecs = -1, bool verbose = false);

    /**
     * @brief Forget results, keep buffers and attributes
     */
    PtStatus clear();

    /**
     * @brief Release the native command now instead of at destruction
     */
    PtStatus destruct();

    // === Results (defined once executed) ===

    std::optional<PtResultCategory> resultCategory() const;
    std::optional<quint8> statusResponse() const;
    int resid() const;
    int senseLength() const;

    /**
     * @brief Duration, none if the transport does not measure it
     */
    std::optional<int> durationMs() const;

    int osError() const;
    QString osErrorString() const;
    int transportError() const;
    QString transportErrorString() const;

    /**
     * @brief Copy of the sense bytes the device returned
     */
    QByteArray senseData() const;

    /**
     * @brief Outcome category combining transport, status and sense
     *
     * Other until the command has been executed.
     */
    SenseCategory errorCategory() const;

private:
    class Private;
    Private *d;
};

} // namespace qsgpt

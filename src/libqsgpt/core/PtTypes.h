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

#include <QFlags>
#include <QString>

namespace qsgpt {

/**
 * @brief Error kinds reported by buffer, pass-through and device operations
 */
enum class PtError {
    None,
    InvalidArgument,    ///< Caller bug (bad alignment, missing device, wrong state)
    ResourceExhausted,  ///< Native allocation failed
    OsError,            ///< open/close/submit failed; osErrno holds the code
    Timeout,            ///< Transport reported a command timeout
    BadParameters,      ///< Transport rejected the command setup
    UseAfterFree,       ///< Object already released
    Unsupported         ///< Transport lacks the requested capability
};

/**
 * @brief Outcome of a fallible operation
 */
struct LIBQSGPT_EXPORT PtStatus {
    PtError error = PtError::None;
    int osErrno = 0;
    QString message;

    bool ok() const { return error == PtError::None; }

    /**
     * @brief "<ErrorName>: <message>" or "OK"
     */
    QString toString() const;

    static PtStatus success();
    static PtStatus failure(PtError error, const QString &message, int osErrno = 0);
};

/**
 * @brief Stable identifier for an error kind (e.g. "InvalidArgument")
 */
LIBQSGPT_EXPORT QString ptErrorName(PtError error);

/**
 * @brief strerror() that always yields a usable string
 *
 * Negative codes are flipped. Unknown codes give "Unknown error <n>".
 */
LIBQSGPT_EXPORT QString safeStrerror(int errnum);

/**
 * @brief Return codes of NativeCommand::submit() besides 0 and -errno
 */
constexpr int PT_DO_BAD_PARAMS = 1;
constexpr int PT_DO_TIMEOUT = 2;

/**
 * @brief Pass-through result categories, highest applicable one wins
 */
enum class PtResultCategory {
    Good            = 0,
    Status          = 1,    ///< Other than GOOD and CHECK CONDITION
    Sense           = 2,
    TransportError  = 3,
    OsError         = 4
};

/**
 * @brief Optional transport capabilities
 */
enum PtFeature {
    FeaturePacketId             = 0x0001,
    FeatureTag                  = 0x0002,
    FeatureTaskManagement       = 0x0004,
    FeatureTaskAttribute        = 0x0008,
    FeatureQueueFlags           = 0x0010,
    FeatureDirectIo             = 0x0020,
    FeatureDuration             = 0x0040,
    FeatureTransportErrorString = 0x0080
};
Q_DECLARE_FLAGS(PtFeatures, PtFeature)

/**
 * @brief Pass-through flags, OR-ed together
 *
 * If neither or both queue flags are given the pass-through default applies.
 */
enum PtFlag {
    PtFlagFunction      = 0x01,
    PtFlagQueueAtTail   = 0x10,
    PtFlagQueueAtHead   = 0x20
};

} // namespace qsgpt

Q_DECLARE_OPERATORS_FOR_FLAGS(qsgpt::PtFeatures)

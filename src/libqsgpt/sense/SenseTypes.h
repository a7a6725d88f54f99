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

#include <QtGlobal>

namespace qsgpt {

/**
 * @brief SCSI status codes (SAM-4)
 */
enum class ScsiStatus : quint8 {
    Good                        = 0x00,
    CheckCondition              = 0x02,
    ConditionMet                = 0x04,
    Busy                        = 0x08,
    Intermediate                = 0x10,     ///< Obsolete in SAM-4
    IntermediateConditionMet    = 0x14,     ///< Obsolete in SAM-4
    ReservationConflict         = 0x18,
    CommandTerminated           = 0x22,     ///< Obsolete in SAM-3
    TaskSetFull                 = 0x28,
    AcaActive                   = 0x30,
    TaskAborted                 = 0x40
};

/**
 * @brief SCSI sense key values (SPC-4)
 */
enum class SenseKey : quint8 {
    NoSense         = 0x00,
    RecoveredError  = 0x01,
    NotReady        = 0x02,
    MediumError     = 0x03,
    HardwareError   = 0x04,
    IllegalRequest  = 0x05,
    UnitAttention   = 0x06,
    DataProtect     = 0x07,
    BlankCheck      = 0x08,
    VendorSpecific  = 0x09,
    CopyAborted     = 0x0A,
    AbortedCommand  = 0x0B,
    Reserved        = 0x0C,
    VolumeOverflow  = 0x0D,
    Miscompare      = 0x0E,
    Completed       = 0x0F
};

/**
 * @brief Outcome category of a command
 *
 * The numeric values are a fixed contract and usable as process exit codes.
 * When a status-derived and a sense-derived category both apply the larger
 * value wins, which is why status-only categories sit in the same space.
 * The *WithInfo values are alternates reported only when the information
 * field is valid; they take no part in that ordering.
 */
enum class SenseCategory {
    Clean                   = 0,
    NotReady                = 2,
    MediumHard              = 3,
    IllegalRequest          = 5,
    UnitAttention           = 6,
    DataProtect             = 7,
    InvalidOpcode           = 9,
    CopyAborted             = 10,
    AbortedCommand          = 11,
    Miscompare              = 14,
    IllegalRequestWithInfo  = 17,
    MediumHardWithInfo      = 18,
    NoSense                 = 20,
    Recovered               = 21,
    ReservationConflict     = 24,
    ConditionMet            = 25,
    Busy                    = 26,
    TaskSetFull             = 27,
    AcaActive               = 28,
    TaskAborted             = 29,
    Timeout                 = 33,
    Protection              = 40,
    ProtectionWithInfo      = 41,
    Malformed               = 97,
    Sense                   = 98,
    Other                   = 99
};

/**
 * @brief Sense data descriptor types (SPC-4 / SBC-3 / SAT)
 */
enum SenseDescriptorType {
    SenseDescInformation        = 0x00,
    SenseDescCommandSpecific    = 0x01,
    SenseDescSenseKeySpecific   = 0x02,
    SenseDescFieldReplaceable   = 0x03,
    SenseDescStreamCommands     = 0x04,
    SenseDescBlockCommands      = 0x05,
    SenseDescOsdObjectId        = 0x06,
    SenseDescOsdIntegrity       = 0x07,
    SenseDescOsdAttribute       = 0x08,
    SenseDescAtaStatusReturn    = 0x09,
    SenseDescProgressIndication = 0x0A,
    SenseDescUserDataSegment    = 0x0B,
    SenseDescForwardedSense     = 0x0C,
    SenseDescDirectAccessBlock  = 0x0D
};

/**
 * @brief Format-independent view of a sense buffer header
 *
 * For fixed format, byte4..byte6 hold the raw fixed-format bytes 4..6 (the
 * low part of the information field) and additionalLength is always 0.
 * For descriptor format they hold the reserved header bytes 4..6 and
 * additionalLength counts the descriptor bytes that follow byte 7.
 */
struct LIBQSGPT_EXPORT SenseHeader {
    quint8 responseCode = 0;    ///< 0x70..0x73
    quint8 senseKey = 0;
    quint8 asc = 0;
    quint8 ascq = 0;
    quint8 byte4 = 0;
    quint8 byte5 = 0;
    quint8 byte6 = 0;
    quint8 additionalLength = 0;

    bool isDescriptorFormat() const { return responseCode >= 0x72; }
    bool isDeferred() const { return responseCode == 0x71 || responseCode == 0x73; }
};

/**
 * @brief Information field lookup result
 */
struct SenseInfoField {
    bool valid = false;
    quint64 value = 0;
};

/**
 * @brief Stream command flags (fixed byte 2 or stream commands descriptor)
 */
struct SenseStreamFlags {
    bool anySet = false;
    bool filemark = false;
    bool eom = false;
    bool ili = false;
};

} // namespace qsgpt

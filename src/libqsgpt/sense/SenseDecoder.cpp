/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Sense Data Decoder Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "SenseDecoder.h"
#include "../util/Logger.h"

namespace qsgpt {

// Fixed format layout
static constexpr int FIXED_SENSE_KEY = 2;
static constexpr int FIXED_INFO = 3;
static constexpr int FIXED_ADD_LENGTH = 7;
static constexpr int FIXED_ASC = 12;
static constexpr int FIXED_ASCQ = 13;
static constexpr int FIXED_SKS = 15;
static constexpr int FIXED_MIN_PROGRESS_LENGTH = 18;

// Descriptor format layout
static constexpr int DESC_HEADER_LENGTH = 8;

static const quint8* bytesOf(const QByteArray& data)
{
    return reinterpret_cast<const quint8*>(data.constData());
}

static quint16 be16(const quint8* p)
{
    return static_cast<quint16>((p[0] << 8) | p[1]);
}

static quint32 be32(const quint8* p)
{
    return (static_cast<quint32>(p[0]) << 24) |
           (static_cast<quint32>(p[1]) << 16) |
           (static_cast<quint32>(p[2]) << 8) |
           static_cast<quint32>(p[3]);
}

static quint64 be64(const quint8* p)
{
    return (static_cast<quint64>(be32(p)) << 32) | be32(p + 4);
}

static quint8 responseCodeOf(const quint8* sense, int length)
{
    return (sense && length > 0) ? (sense[0] & 0x7F) : 0;
}

static bool isFixed(quint8 responseCode)
{
    return responseCode == 0x70 || responseCode == 0x71;
}

static bool isDescriptor(quint8 responseCode)
{
    return responseCode == 0x72 || responseCode == 0x73;
}

// =============================================================================
// Header
// =============================================================================

std::optional<SenseHeader> SenseDecoder::normalize(const quint8* sense, int length)
{
    const quint8 responseCode = responseCodeOf(sense, length);
    if (!isFixed(responseCode) && !isDescriptor(responseCode)) {
        return std::nullopt;
    }

    SenseHeader header;
    header.responseCode = responseCode;

    if (isDescriptor(responseCode)) {
        if (length > 1) {
            header.senseKey = sense[1] & 0x0F;
        }
        if (length > 2) {
            header.asc = sense[2];
        }
        if (length > 3) {
            header.ascq = sense[3];
        }
        if (length > 4) {
            header.byte4 = sense[4];
        }
        if (length > 5) {
            header.byte5 = sense[5];
        }
        if (length > 6) {
            header.byte6 = sense[6];
        }
        if (length > 7) {
            header.additionalLength = sense[7];
        }
        return header;
    }

    if (length > FIXED_SENSE_KEY) {
        header.senseKey = sense[FIXED_SENSE_KEY] & 0x0F;
    }

    // The additional length field bounds what the device actually filled in
    int effective = length;
    if (length > FIXED_ADD_LENGTH) {
        effective = qMin(length, sense[FIXED_ADD_LENGTH] + 8);
        if (effective > FIXED_ASC) {
            header.asc = sense[FIXED_ASC];
        }
        if (effective > FIXED_ASCQ) {
            header.ascq = sense[FIXED_ASCQ];
        }
    }
    if (length > 4) {
        header.byte4 = sense[4];
    }
    if (length > 5) {
        header.byte5 = sense[5];
    }
    if (length > 6) {
        header.byte6 = sense[6];
    }
    header.additionalLength = 0;

    return header;
}

std::optional<SenseHeader> SenseDecoder::normalize(const QByteArray& sense)
{
    return normalize(bytesOf(sense), static_cast<int>(sense.size()));
}

// =============================================================================
// Descriptors
// =============================================================================

std::optional<int> SenseDecoder::findDescriptor(const quint8* sense, int length, int descriptorType)
{
    if (!sense || length < DESC_HEADER_LENGTH) {
        return std::nullopt;
    }
    if (!isDescriptor(responseCodeOf(sense, length))) {
        return std::nullopt;
    }

    const int listLength = qMin(static_cast<int>(sense[7]), length - DESC_HEADER_LENGTH);
    const int end = DESC_HEADER_LENGTH + listLength;

    int offset = DESC_HEADER_LENGTH;
    while (offset < end) {
        // Need both the type and the length byte
        if (offset + 1 >= end) {
            QSGPT_TRACE(LogCategory::Sense,
                        QStringLiteral("Descriptor header at %1 truncated").arg(offset));
            return std::nullopt;
        }

        const int descriptorLength = sense[offset + 1] + 2;
        if (sense[offset] == descriptorType) {
            if (offset + descriptorLength > end) {
                QSGPT_TRACE(LogCategory::Sense,
                            QStringLiteral("Descriptor 0x%1 at %2 overruns sense length %3")
                                .arg(descriptorType, 2, 16, QLatin1Char('0'))
                                .arg(offset).arg(end));
                return std::nullopt;
            }
            return offset;
        }
        offset += descriptorLength;
    }

    return std::nullopt;
}

std::optional<int> SenseDecoder::findDescriptor(const QByteArray& sense, int descriptorType)
{
    return findDescriptor(bytesOf(sense), static_cast<int>(sense.size()), descriptorType);
}

// =============================================================================
// Fields
// =============================================================================

std::optional<SenseKey> SenseDecoder::senseKey(const quint8* sense, int length)
{
    const quint8 responseCode = responseCodeOf(sense, length);
    if (isFixed(responseCode) && length > FIXED_SENSE_KEY) {
        return static_cast<SenseKey>(sense[FIXED_SENSE_KEY] & 0x0F);
    }
    if (isDescriptor(responseCode) && length > 1) {
        return static_cast<SenseKey>(sense[1] & 0x0F);
    }
    return std::nullopt;
}

std::optional<SenseKey> SenseDecoder::senseKey(const QByteArray& sense)
{
    return senseKey(bytesOf(sense), static_cast<int>(sense.size()));
}

SenseInfoField SenseDecoder::informationField(const quint8* sense, int length)
{
    SenseInfoField info;
    if (!sense || length < 7) {
        return info;
    }

    const quint8 responseCode = responseCodeOf(sense, length);
    if (isFixed(responseCode)) {
        info.value = be32(sense + FIXED_INFO);
        info.valid = (sense[0] & 0x80) != 0;
    } else if (isDescriptor(responseCode)) {
        const std::optional<int> offset = findDescriptor(sense, length, SenseDescInformation);
        if (offset && sense[*offset + 1] == 0x0A) {
            info.value = be64(sense + *offset + 4);
            info.valid = true;
        }
    }

    return info;
}

SenseInfoField SenseDecoder::informationField(const QByteArray& sense)
{
    return informationField(bytesOf(sense), static_cast<int>(sense.size()));
}

static SenseStreamFlags streamFlagsFrom(quint8 flags)
{
    SenseStreamFlags result;
    result.filemark = (flags & 0x80) != 0;
    result.eom = (flags & 0x40) != 0;
    result.ili = (flags & 0x20) != 0;
    result.anySet = result.filemark || result.eom || result.ili;
    return result;
}

SenseStreamFlags SenseDecoder::filemarkEomIli(const quint8* sense, int length)
{
    if (!sense || length < 7) {
        return SenseStreamFlags();
    }

    const quint8 responseCode = responseCodeOf(sense, length);
    if (isFixed(responseCode)) {
        return streamFlagsFrom(sense[FIXED_SENSE_KEY]);
    }
    if (isDescriptor(responseCode)) {
        const std::optional<int> offset = findDescriptor(sense, length, SenseDescStreamCommands);
        if (offset && sense[*offset + 1] >= 2) {
            return streamFlagsFrom(sense[*offset + 3]);
        }
    }
    return SenseStreamFlags();
}

SenseStreamFlags SenseDecoder::filemarkEomIli(const QByteArray& sense)
{
    return filemarkEomIli(bytesOf(sense), static_cast<int>(sense.size()));
}

std::optional<quint16> SenseDecoder::progress(const quint8* sense, int length)
{
    if (!sense || length < 7) {
        return std::nullopt;
    }

    const std::optional<SenseKey> key = senseKey(sense, length);
    const bool keyAllowsProgress = key && (*key == SenseKey::NoSense || *key == SenseKey::NotReady);

    const quint8 responseCode = responseCodeOf(sense, length);
    if (isFixed(responseCode)) {
        if (length >= FIXED_MIN_PROGRESS_LENGTH && keyAllowsProgress && (sense[FIXED_SKS] & 0x80)) {
            return be16(sense + FIXED_SKS + 1);
        }
        return std::nullopt;
    }

    if (!isDescriptor(responseCode)) {
        return std::nullopt;
    }

    if (keyAllowsProgress) {
        const std::optional<int> sks = findDescriptor(sense, length, SenseDescSenseKeySpecific);
        if (sks && sense[*sks + 1] == 0x06 && (sense[*sks + 4] & 0x80)) {
            return be16(sense + *sks + 5);
        }
    }

    const std::optional<int> indication = findDescriptor(sense, length, SenseDescProgressIndication);
    if (indication && sense[*indication + 1] == 0x06) {
        return be16(sense + *indication + 6);
    }

    return std::nullopt;
}

std::optional<quint16> SenseDecoder::progress(const QByteArray& sense)
{
    return progress(bytesOf(sense), static_cast<int>(sense.size()));
}

// =============================================================================
// Classification
// =============================================================================

SenseCategory SenseDecoder::categorize(const quint8* sense, int length)
{
    if (!sense || length <= 2) {
        return SenseCategory::Sense;
    }

    const std::optional<SenseHeader> header = normalize(sense, length);
    if (!header) {
        return SenseCategory::Sense;
    }

    switch (static_cast<SenseKey>(header->senseKey)) {
    case SenseKey::NoSense:
        return SenseCategory::NoSense;
    case SenseKey::RecoveredError:
        return SenseCategory::Recovered;
    case SenseKey::NotReady:
        return SenseCategory::NotReady;
    case SenseKey::MediumError:
    case SenseKey::HardwareError:
    case SenseKey::BlankCheck:
        return SenseCategory::MediumHard;
    case SenseKey::UnitAttention:
        return SenseCategory::UnitAttention;
    case SenseKey::DataProtect:
        return SenseCategory::DataProtect;
    case SenseKey::IllegalRequest:
        if (header->asc == 0x20 && header->ascq == 0x00) {
            return SenseCategory::InvalidOpcode;
        }
        return SenseCategory::IllegalRequest;
    case SenseKey::AbortedCommand:
        // 0x10/xx: protection information check failures
        if (header->asc == 0x10) {
            return SenseCategory::Protection;
        }
        return SenseCategory::AbortedCommand;
    case SenseKey::Miscompare:
        return SenseCategory::Miscompare;
    case SenseKey::CopyAborted:
        return SenseCategory::CopyAborted;
    default:
        return SenseCategory::Sense;
    }
}

SenseCategory SenseDecoder::categorize(const QByteArray& sense)
{
    return categorize(bytesOf(sense), static_cast<int>(sense.size()));
}

SenseCategory SenseDecoder::categorizeWithInfo(const quint8* sense, int length)
{
    const SenseCategory category = categorize(sense, length);

    switch (category) {
    case SenseCategory::IllegalRequest:
    case SenseCategory::MediumHard:
    case SenseCategory::Protection:
        break;
    default:
        return category;
    }

    if (!informationField(sense, length).valid) {
        return category;
    }

    switch (category) {
    case SenseCategory::IllegalRequest:
        return SenseCategory::IllegalRequestWithInfo;
    case SenseCategory::MediumHard:
        return SenseCategory::MediumHardWithInfo;
    default:
        return SenseCategory::ProtectionWithInfo;
    }
}

SenseCategory SenseDecoder::categorizeWithInfo(const QByteArray& sense)
{
    return categorizeWithInfo(bytesOf(sense), static_cast<int>(sense.size()));
}

SenseCategory SenseDecoder::categorizeStatus(quint8 status)
{
    switch (static_cast<ScsiStatus>(status & 0x7E)) {
    case ScsiStatus::Good:
        return SenseCategory::Clean;
    case ScsiStatus::CheckCondition:
    case ScsiStatus::CommandTerminated:
        return SenseCategory::Sense;
    case ScsiStatus::ConditionMet:
        return SenseCategory::ConditionMet;
    case ScsiStatus::Busy:
        return SenseCategory::Busy;
    case ScsiStatus::ReservationConflict:
        return SenseCategory::ReservationConflict;
    case ScsiStatus::TaskSetFull:
        return SenseCategory::TaskSetFull;
    case ScsiStatus::AcaActive:
        return SenseCategory::AcaActive;
    case ScsiStatus::TaskAborted:
        return SenseCategory::TaskAborted;
    default:
        return SenseCategory::Other;
    }
}

SenseCategory SenseDecoder::combine(SenseCategory a, SenseCategory b)
{
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

} // namespace qsgpt

/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Sense Data Decoder Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_SENSEDECODER_H
#define QSGPT_SENSEDECODER_H

#include "SenseTypes.h"

#include <QByteArray>

#include <optional>

namespace qsgpt {

/**
 * @brief Decoding of fixed and descriptor format sense data
 *
 * All functions are pure and accept truncated or malformed input: they
 * never read past @c length and degrade to "absent" rather than failing.
 * Both current (0x70/0x72) and deferred (0x71/0x73) response codes are
 * understood; anything else counts as no sense.
 */
class LIBQSGPT_EXPORT SenseDecoder
{
public:
    SenseDecoder() = delete;

    /**
     * @brief Normalize the sense header
     * @return Header, or none for response code 0 / unknown codes / too short
     */
    static std::optional<SenseHeader> normalize(const quint8* sense, int length);
    static std::optional<SenseHeader> normalize(const QByteArray& sense);

    /**
     * @brief Locate a descriptor in descriptor format sense
     * @param descriptorType Type tag to look for
     * @return Byte offset of the descriptor inside @p sense, none if the
     *         sense is fixed format, the type is absent or the list is
     *         truncated before the match ends
     */
    static std::optional<int> findDescriptor(const quint8* sense, int length, int descriptorType);
    static std::optional<int> findDescriptor(const QByteArray& sense, int descriptorType);

    /**
     * @brief Sense key, from either format
     */
    static std::optional<SenseKey> senseKey(const quint8* sense, int length);
    static std::optional<SenseKey> senseKey(const QByteArray& sense);

    /**
     * @brief Information field
     *
     * Fixed format: 4 bytes at offset 3, valid bit in byte 0.
     * Descriptor format: the 8 byte value of the Information descriptor.
     */
    static SenseInfoField informationField(const quint8* sense, int length);
    static SenseInfoField informationField(const QByteArray& sense);

    /**
     * @brief FILEMARK, EOM and ILI bits
     */
    static SenseStreamFlags filemarkEomIli(const quint8* sense, int length);
    static SenseStreamFlags filemarkEomIli(const QByteArray& sense);

    /**
     * @brief Progress indication (0..65535 of 65536)
     */
    static std::optional<quint16> progress(const quint8* sense, int length);
    static std::optional<quint16> progress(const QByteArray& sense);

    /**
     * @brief Progress as a whole percentage
     */
    static int progressPercent(quint16 progress) { return static_cast<int>(progress) * 100 / 65536; }

    /**
     * @brief Classify the sense data
     * @return Category from the sense key (and asc/ascq where relevant),
     *         Sense if the buffer cannot be decoded
     */
    static SenseCategory categorize(const quint8* sense, int length);
    static SenseCategory categorize(const QByteArray& sense);

    /**
     * @brief categorize() upgraded to the *WithInfo alternates
     *
     * Applies to IllegalRequest, MediumHard and Protection when the
     * information field is valid.
     */
    static SenseCategory categorizeWithInfo(const quint8* sense, int length);
    static SenseCategory categorizeWithInfo(const QByteArray& sense);

    /**
     * @brief Classify a SCSI status byte
     */
    static SenseCategory categorizeStatus(quint8 status);

    /**
     * @brief Effective category of two applicable ones (numerically larger)
     */
    static SenseCategory combine(SenseCategory a, SenseCategory b);
};

} // namespace qsgpt

#endif // QSGPT_SENSEDECODER_H

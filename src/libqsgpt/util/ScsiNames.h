/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * SCSI Names Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_SCSINAMES_H
#define QSGPT_SCSINAMES_H

#include "../libqsgpt_global.h"
#include "../core/PtTypes.h"
#include "../sense/SenseTypes.h"

#include <QByteArray>
#include <QString>

namespace qsgpt {

/**
 * @brief SCSI peripheral device types (5 bit field)
 */
enum class PeripheralDeviceType : quint8 {
    Disk        = 0x00,
    Tape        = 0x01,
    Printer     = 0x02,
    Processor   = 0x03,
    WriteOnce   = 0x04,
    Mmc         = 0x05,     ///< CD/DVD/BD
    Scanner     = 0x06,
    Optical     = 0x07,
    MediumChanger = 0x08,
    Comms       = 0x09,
    Sac         = 0x0C,     ///< Storage array controller
    Ses         = 0x0D,     ///< Enclosure services
    Rbc         = 0x0E,     ///< Reduced block commands
    Ocrw        = 0x0F,
    Bcc         = 0x10,
    Osd         = 0x11,
    Adc         = 0x12,     ///< Automation/drive interface
    Smd         = 0x13,
    Zbc         = 0x14,     ///< Host managed zoned block
    Wlun        = 0x1E,
    Unknown     = 0x1F
};

/**
 * @brief Protocol identifiers
 */
enum class TransportProtocol : quint8 {
    Fcp         = 0x0,
    Spi         = 0x1,
    Ssa         = 0x2,
    Ieee1394    = 0x3,
    Srp         = 0x4,
    Iscsi       = 0x5,
    Sas         = 0x6,
    Adt         = 0x7,
    Ata         = 0x8,
    Uas         = 0x9,
    Sop         = 0xA,
    Pcie        = 0xB,
    None        = 0xF
};

/**
 * @brief Diagnostic name tables for SCSI codes
 *
 * Lookups only; nothing here drives decisions. Unknown codes produce a
 * bracketed hex placeholder rather than an empty string, except for the
 * designator tables which return an empty string for out-of-range input.
 */
class LIBQSGPT_EXPORT ScsiNames
{
public:
    ScsiNames() = delete;

    /**
     * @brief CDB length implied by the opcode group
     *
     * Wrong for variable length (0x7F) and some vendor commands.
     */
    static int commandSize(quint8 opcode);

    /**
     * @brief Opcode name, with device-type specific variants
     */
    static QString opcodeName(quint8 opcode, PeripheralDeviceType pdt = PeripheralDeviceType::Disk);

    /**
     * @brief Name of a service action of a multiplexed opcode (0x9E, 0xA3, ...)
     */
    static QString serviceActionName(quint8 opcode, int serviceAction,
                                     PeripheralDeviceType pdt = PeripheralDeviceType::Disk);

    /**
     * @brief Name of a whole CDB, resolving the service action where needed
     */
    static QString commandName(const QByteArray& cdb, PeripheralDeviceType pdt = PeripheralDeviceType::Disk);

    static QString statusName(quint8 status);
    static QString senseKeyName(int senseKey);

    /**
     * @brief Additional sense code text, with a generic fallback
     */
    static QString ascAscqText(quint8 asc, quint8 ascq);

    static QString categoryName(SenseCategory category);
    static QString resultCategoryName(PtResultCategory category);

    static QString pdtName(int pdt);

    /**
     * @brief Map a device type onto the one whose command set it follows
     *
     * E.g. RBC and ZBC decay to Disk, ADC and Printer to Tape.
     */
    static PeripheralDeviceType pdtDecay(int pdt);

    static QString transportProtocolName(int protocol);

    static QString designatorTypeName(int type);
    static QString designatorCodeSetName(int codeSet);
    static QString designatorAssociationName(int association);
};

} // namespace qsgpt

#endif // QSGPT_SCSINAMES_H

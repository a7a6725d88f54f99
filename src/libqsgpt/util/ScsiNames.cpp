/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * SCSI Names Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "ScsiNames.h"

namespace qsgpt {

namespace {

struct CodeName {
    int code;
    const char* name;
};

// Common to all device types
const CodeName kOpcodes[] = {
    { 0x00, "Test Unit Ready" },
    { 0x01, "Rezero Unit" },
    { 0x03, "Request Sense" },
    { 0x04, "Format Unit" },
    { 0x05, "Read Block Limits" },
    { 0x07, "Reassign Blocks" },
    { 0x08, "Read(6)" },
    { 0x0A, "Write(6)" },
    { 0x0B, "Seek(6)" },
    { 0x12, "Inquiry" },
    { 0x15, "Mode select(6)" },
    { 0x16, "Reserve(6)" },
    { 0x17, "Release(6)" },
    { 0x1A, "Mode sense(6)" },
    { 0x1B, "Start stop unit" },
    { 0x1C, "Receive diagnostic results" },
    { 0x1D, "Send diagnostic" },
    { 0x1E, "Prevent allow medium removal" },
    { 0x25, "Read capacity(10)" },
    { 0x28, "Read(10)" },
    { 0x2A, "Write(10)" },
    { 0x2B, "Seek(10)" },
    { 0x2E, "Write and verify(10)" },
    { 0x2F, "Verify(10)" },
    { 0x34, "Pre-fetch(10)" },
    { 0x35, "Synchronize cache(10)" },
    { 0x37, "Read defect data(10)" },
    { 0x3B, "Write buffer" },
    { 0x3C, "Read buffer" },
    { 0x41, "Write same(10)" },
    { 0x42, "Unmap" },
    { 0x43, "Read TOC/PMA/ATIP" },
    { 0x46, "Get configuration" },
    { 0x4A, "Get event status notification" },
    { 0x4C, "Log select" },
    { 0x4D, "Log sense" },
    { 0x51, "Read disc information" },
    { 0x55, "Mode select(10)" },
    { 0x56, "Reserve(10)" },
    { 0x57, "Release(10)" },
    { 0x5A, "Mode sense(10)" },
    { 0x5E, "Persistent reserve in" },
    { 0x5F, "Persistent reserve out" },
    { 0x7F, "Variable length" },
    { 0x83, "Third party copy out" },
    { 0x84, "Third party copy in" },
    { 0x85, "ATA pass-through(16)" },
    { 0x86, "Access control in" },
    { 0x87, "Access control out" },
    { 0x88, "Read(16)" },
    { 0x89, "Compare and write" },
    { 0x8A, "Write(16)" },
    { 0x8C, "Read attribute" },
    { 0x8D, "Write attribute" },
    { 0x8E, "Write and verify(16)" },
    { 0x8F, "Verify(16)" },
    { 0x90, "Pre-fetch(16)" },
    { 0x91, "Synchronize cache(16)" },
    { 0x93, "Write same(16)" },
    { 0x9E, "Service action in(16)" },
    { 0x9F, "Service action out(16)" },
    { 0xA0, "Report luns" },
    { 0xA1, "ATA pass-through(12)" },
    { 0xA2, "Security protocol in" },
    { 0xA3, "Maintenance in" },
    { 0xA4, "Maintenance out" },
    { 0xA8, "Read(12)" },
    { 0xAA, "Write(12)" },
    { 0xAF, "Verify(12)" },
    { 0xB5, "Security protocol out" },
    { 0xBB, "Set CD speed" },
    { 0xBE, "Read CD" },
};

// Sequential access (tape) overrides
const CodeName kTapeOpcodes[] = {
    { 0x01, "Rewind" },
    { 0x04, "Format medium" },
    { 0x10, "Write filemarks(6)" },
    { 0x11, "Space(6)" },
    { 0x13, "Verify(6)" },
    { 0x19, "Erase(6)" },
    { 0x1B, "Load unload" },
    { 0x2B, "Locate(10)" },
    { 0x34, "Read position" },
    { 0x44, "Report density support" },
    { 0x82, "Allow overwrite" },
    { 0x91, "Space(16)" },
    { 0x92, "Locate(16)" },
    { 0x93, "Erase(16)" },
};

// Medium changer overrides
const CodeName kChangerOpcodes[] = {
    { 0x07, "Initialize element status" },
    { 0xA5, "Move medium" },
    { 0xA6, "Exchange medium" },
    { 0xB8, "Read element status" },
};

const CodeName kServiceActionIn16[] = {
    { 0x10, "Read capacity(16)" },
    { 0x11, "Read long(16)" },
    { 0x12, "Get LBA status" },
    { 0x13, "Report referrals" },
    { 0x14, "Stream control" },
    { 0x15, "Background control" },
    { 0x16, "Get stream status" },
};

const CodeName kServiceActionOut16[] = {
    { 0x11, "Write long(16)" },
};

const CodeName kMaintenanceIn[] = {
    { 0x05, "Report identifying information" },
    { 0x0A, "Report target port groups" },
    { 0x0B, "Report aliases" },
    { 0x0C, "Report supported operation codes" },
    { 0x0D, "Report supported task management functions" },
    { 0x0E, "Report priority" },
    { 0x0F, "Report timestamp" },
};

const CodeName kMaintenanceOut[] = {
    { 0x06, "Set identifying information" },
    { 0x0A, "Set target port groups" },
    { 0x0B, "Change aliases" },
    { 0x0E, "Set priority" },
    { 0x0F, "Set timestamp" },
};

const CodeName kPersistentReserveIn[] = {
    { 0x00, "Persistent reserve in, read keys" },
    { 0x01, "Persistent reserve in, read reservation" },
    { 0x02, "Persistent reserve in, report capabilities" },
    { 0x03, "Persistent reserve in, read full status" },
};

const CodeName kPersistentReserveOut[] = {
    { 0x00, "Persistent reserve out, register" },
    { 0x01, "Persistent reserve out, reserve" },
    { 0x02, "Persistent reserve out, release" },
    { 0x03, "Persistent reserve out, clear" },
    { 0x04, "Persistent reserve out, preempt" },
    { 0x05, "Persistent reserve out, preempt and abort" },
    { 0x06, "Persistent reserve out, register and ignore existing key" },
    { 0x07, "Persistent reserve out, register and move" },
};

const CodeName kVariableLength[] = {
    { 0x0009, "Read(32)" },
    { 0x000A, "Verify(32)" },
    { 0x000B, "Write(32)" },
    { 0x000C, "Write and verify(32)" },
    { 0x000D, "Write same(32)" },
};

struct AscName {
    quint8 asc;
    quint8 ascq;
    const char* text;
};

const AscName kAscAscq[] = {
    { 0x00, 0x00, "No additional sense information" },
    { 0x00, 0x01, "Filemark detected" },
    { 0x00, 0x02, "End-of-partition/medium detected" },
    { 0x00, 0x04, "Beginning-of-partition/medium detected" },
    { 0x00, 0x05, "End-of-data detected" },
    { 0x00, 0x16, "Operation in progress" },
    { 0x00, 0x17, "Cleaning requested" },
    { 0x04, 0x00, "Logical unit not ready, cause not reportable" },
    { 0x04, 0x01, "Logical unit is in process of becoming ready" },
    { 0x04, 0x02, "Logical unit not ready, initializing command required" },
    { 0x04, 0x03, "Logical unit not ready, manual intervention required" },
    { 0x04, 0x04, "Logical unit not ready, format in progress" },
    { 0x04, 0x07, "Logical unit not ready, operation in progress" },
    { 0x04, 0x09, "Logical unit not ready, self-test in progress" },
    { 0x04, 0x11, "Logical unit not ready, notify (enable spinup) required" },
    { 0x05, 0x00, "Logical unit does not respond to selection" },
    { 0x08, 0x00, "Logical unit communication failure" },
    { 0x0C, 0x00, "Write error" },
    { 0x10, 0x01, "Logical block guard check failed" },
    { 0x10, 0x02, "Logical block application tag check failed" },
    { 0x10, 0x03, "Logical block reference tag check failed" },
    { 0x11, 0x00, "Unrecovered read error" },
    { 0x14, 0x00, "Recorded entity not found" },
    { 0x14, 0x01, "Record not found" },
    { 0x14, 0x03, "End-of-data not found" },
    { 0x1A, 0x00, "Parameter list length error" },
    { 0x20, 0x00, "Invalid command operation code" },
    { 0x21, 0x00, "Logical block address out of range" },
    { 0x24, 0x00, "Invalid field in cdb" },
    { 0x25, 0x00, "Logical unit not supported" },
    { 0x26, 0x00, "Invalid field in parameter list" },
    { 0x27, 0x00, "Write protected" },
    { 0x28, 0x00, "Not ready to ready change, medium may have changed" },
    { 0x29, 0x00, "Power on, reset, or bus device reset occurred" },
    { 0x29, 0x01, "Power on occurred" },
    { 0x29, 0x02, "SCSI bus reset occurred" },
    { 0x2A, 0x01, "Mode parameters changed" },
    { 0x2A, 0x09, "Capacity data has changed" },
    { 0x30, 0x00, "Incompatible medium installed" },
    { 0x31, 0x00, "Medium format corrupted" },
    { 0x3A, 0x00, "Medium not present" },
    { 0x3A, 0x01, "Medium not present - tray closed" },
    { 0x3A, 0x02, "Medium not present - tray open" },
    { 0x3B, 0x00, "Sequential positioning error" },
    { 0x3F, 0x0E, "Reported luns data has changed" },
    { 0x44, 0x00, "Internal target failure" },
    { 0x47, 0x00, "SCSI parity error" },
    { 0x4E, 0x00, "Overlapped commands attempted" },
    { 0x50, 0x00, "Write append error" },
    { 0x53, 0x02, "Medium removal prevented" },
    { 0x5D, 0x00, "Failure prediction threshold exceeded" },
    { 0x5D, 0xFF, "Failure prediction threshold exceeded (false)" },
};

QString lookup(const CodeName* table, int count, int code)
{
    for (int i = 0; i < count; ++i) {
        if (table[i].code == code) {
            return QString::fromLatin1(table[i].name);
        }
    }
    return QString();
}

template <int N>
QString lookup(const CodeName (&table)[N], int code)
{
    return lookup(table, N, code);
}

QString hexCode(int value)
{
    return QStringLiteral("0x%1").arg(value, 2, 16, QLatin1Char('0'));
}

} // namespace

// =============================================================================
// Commands
// =============================================================================

int ScsiNames::commandSize(quint8 opcode)
{
    switch ((opcode >> 5) & 0x7) {
    case 0:
        return 6;
    case 3:
    case 5:
        return 12;
    case 4:
        return 16;
    default:
        return 10;
    }
}

QString ScsiNames::opcodeName(quint8 opcode, PeripheralDeviceType pdt)
{
    QString name;
    switch (pdtDecay(static_cast<int>(pdt))) {
    case PeripheralDeviceType::Tape:
        name = lookup(kTapeOpcodes, opcode);
        break;
    case PeripheralDeviceType::MediumChanger:
        name = lookup(kChangerOpcodes, opcode);
        break;
    default:
        break;
    }

    if (name.isEmpty()) {
        name = lookup(kOpcodes, opcode);
    }
    if (!name.isEmpty()) {
        return name;
    }
    if (opcode >= 0xC0) {
        return QStringLiteral("Vendor specific [%1]").arg(hexCode(opcode));
    }
    return QStringLiteral("Opcode=%1").arg(hexCode(opcode));
}

QString ScsiNames::serviceActionName(quint8 opcode, int serviceAction, PeripheralDeviceType pdt)
{
    QString name;
    switch (opcode) {
    case 0x5E:
        name = lookup(kPersistentReserveIn, serviceAction);
        break;
    case 0x5F:
        name = lookup(kPersistentReserveOut, serviceAction);
        break;
    case 0x7F:
        name = lookup(kVariableLength, serviceAction);
        break;
    case 0x9E:
        name = lookup(kServiceActionIn16, serviceAction);
        break;
    case 0x9F:
        name = lookup(kServiceActionOut16, serviceAction);
        break;
    case 0xA3:
        name = lookup(kMaintenanceIn, serviceAction);
        break;
    case 0xA4:
        name = lookup(kMaintenanceOut, serviceAction);
        break;
    default:
        break;
    }

    if (!name.isEmpty()) {
        return name;
    }
    return QStringLiteral("%1, service action=%2").arg(opcodeName(opcode, pdt), hexCode(serviceAction));
}

QString ScsiNames::commandName(const QByteArray& cdb, PeripheralDeviceType pdt)
{
    if (cdb.isEmpty()) {
        return QStringLiteral("<empty cdb>");
    }

    const quint8* bytes = reinterpret_cast<const quint8*>(cdb.constData());
    const quint8 opcode = bytes[0];

    switch (opcode) {
    case 0x7F:
        if (cdb.size() >= 10) {
            return serviceActionName(opcode, (bytes[8] << 8) | bytes[9], pdt);
        }
        break;
    case 0x5E:
    case 0x5F:
    case 0x9E:
    case 0x9F:
    case 0xA3:
    case 0xA4:
        if (cdb.size() >= 2) {
            return serviceActionName(opcode, bytes[1] & 0x1F, pdt);
        }
        break;
    default:
        break;
    }

    return opcodeName(opcode, pdt);
}

// =============================================================================
// Status and sense
// =============================================================================

QString ScsiNames::statusName(quint8 status)
{
    switch (static_cast<ScsiStatus>(status & 0x7E)) {
    case ScsiStatus::Good:                      return QStringLiteral("Good");
    case ScsiStatus::CheckCondition:            return QStringLiteral("Check Condition");
    case ScsiStatus::ConditionMet:              return QStringLiteral("Condition Met");
    case ScsiStatus::Busy:                      return QStringLiteral("Busy");
    case ScsiStatus::Intermediate:              return QStringLiteral("Intermediate (obsolete)");
    case ScsiStatus::IntermediateConditionMet:  return QStringLiteral("Intermediate-Condition Met (obsolete)");
    case ScsiStatus::ReservationConflict:       return QStringLiteral("Reservation Conflict");
    case ScsiStatus::CommandTerminated:         return QStringLiteral("Command Terminated (obsolete)");
    case ScsiStatus::TaskSetFull:               return QStringLiteral("Task Set Full");
    case ScsiStatus::AcaActive:                 return QStringLiteral("ACA Active");
    case ScsiStatus::TaskAborted:               return QStringLiteral("Task Aborted");
    }
    return QStringLiteral("Unknown status [%1]").arg(hexCode(status));
}

QString ScsiNames::senseKeyName(int senseKey)
{
    switch (senseKey) {
    case 0x0: return QStringLiteral("No Sense");
    case 0x1: return QStringLiteral("Recovered Error");
    case 0x2: return QStringLiteral("Not Ready");
    case 0x3: return QStringLiteral("Medium Error");
    case 0x4: return QStringLiteral("Hardware Error");
    case 0x5: return QStringLiteral("Illegal Request");
    case 0x6: return QStringLiteral("Unit Attention");
    case 0x7: return QStringLiteral("Data Protect");
    case 0x8: return QStringLiteral("Blank Check");
    case 0x9: return QStringLiteral("Vendor Specific");
    case 0xA: return QStringLiteral("Copy Aborted");
    case 0xB: return QStringLiteral("Aborted Command");
    case 0xC: return QStringLiteral("Equal");
    case 0xD: return QStringLiteral("Volume Overflow");
    case 0xE: return QStringLiteral("Miscompare");
    case 0xF: return QStringLiteral("Completed");
    default:
        return QStringLiteral("invalid value: %1").arg(hexCode(senseKey));
    }
}

QString ScsiNames::ascAscqText(quint8 asc, quint8 ascq)
{
    for (const AscName& entry : kAscAscq) {
        if (entry.asc == asc && entry.ascq == ascq) {
            return QString::fromLatin1(entry.text);
        }
    }

    // Ranges carrying a parameter in the qualifier
    if (asc == 0x40 && ascq >= 0x80) {
        return QStringLiteral("Diagnostic failure on component %1").arg(hexCode(ascq));
    }
    if (asc == 0x4D) {
        return QStringLiteral("Tagged overlapped commands (task tag %1)").arg(hexCode(ascq));
    }

    if (asc >= 0x80) {
        return QStringLiteral("vendor specific ASC=%1, ASCQ=%2").arg(hexCode(asc), hexCode(ascq));
    }
    if (ascq >= 0x80) {
        return QStringLiteral("ASC=%1, vendor specific qualification ASCQ=%2").arg(hexCode(asc), hexCode(ascq));
    }
    return QStringLiteral("ASC=%1 ASCQ=%2").arg(hexCode(asc), hexCode(ascq));
}

QString ScsiNames::categoryName(SenseCategory category)
{
    switch (category) {
    case SenseCategory::Clean:                  return QStringLiteral("No errors");
    case SenseCategory::NotReady:               return QStringLiteral("Not ready");
    case SenseCategory::MediumHard:             return QStringLiteral("Medium or hardware error");
    case SenseCategory::IllegalRequest:         return QStringLiteral("Illegal request");
    case SenseCategory::UnitAttention:          return QStringLiteral("Unit attention");
    case SenseCategory::DataProtect:            return QStringLiteral("Data protect");
    case SenseCategory::InvalidOpcode:          return QStringLiteral("Illegal request, invalid opcode");
    case SenseCategory::CopyAborted:            return QStringLiteral("Copy aborted");
    case SenseCategory::AbortedCommand:         return QStringLiteral("Aborted command");
    case SenseCategory::Miscompare:             return QStringLiteral("Miscompare");
    case SenseCategory::IllegalRequestWithInfo: return QStringLiteral("Illegal request, with info");
    case SenseCategory::MediumHardWithInfo:     return QStringLiteral("Medium or hardware error, with info");
    case SenseCategory::NoSense:                return QStringLiteral("No sense data");
    case SenseCategory::Recovered:              return QStringLiteral("Recovered error");
    case SenseCategory::ReservationConflict:    return QStringLiteral("Reservation conflict");
    case SenseCategory::ConditionMet:           return QStringLiteral("Condition met");
    case SenseCategory::Busy:                   return QStringLiteral("Busy");
    case SenseCategory::TaskSetFull:            return QStringLiteral("Task set full");
    case SenseCategory::AcaActive:              return QStringLiteral("ACA active");
    case SenseCategory::TaskAborted:            return QStringLiteral("Task aborted");
    case SenseCategory::Timeout:                return QStringLiteral("SCSI command timeout");
    case SenseCategory::Protection:             return QStringLiteral("Aborted command, protection");
    case SenseCategory::ProtectionWithInfo:     return QStringLiteral("Aborted command, protection, with info");
    case SenseCategory::Malformed:              return QStringLiteral("Malformed response");
    case SenseCategory::Sense:                  return QStringLiteral("Some other sense data problem");
    case SenseCategory::Other:                  return QStringLiteral("Some other error/warning");
    }
    return QStringLiteral("Sense category: %1").arg(static_cast<int>(category));
}

QString ScsiNames::resultCategoryName(PtResultCategory category)
{
    switch (category) {
    case PtResultCategory::Good:            return QStringLiteral("Good");
    case PtResultCategory::Status:          return QStringLiteral("Status");
    case PtResultCategory::Sense:           return QStringLiteral("Sense");
    case PtResultCategory::TransportError:  return QStringLiteral("Transport error");
    case PtResultCategory::OsError:         return QStringLiteral("OS error");
    }
    return QStringLiteral("Unknown result category");
}

// =============================================================================
// Device types and transports
// =============================================================================

QString ScsiNames::pdtName(int pdt)
{
    switch (pdt) {
    case 0x00: return QStringLiteral("disk");
    case 0x01: return QStringLiteral("tape");
    case 0x02: return QStringLiteral("printer");
    case 0x03: return QStringLiteral("processor");
    case 0x04: return QStringLiteral("write once optical disk");
    case 0x05: return QStringLiteral("cd/dvd");
    case 0x06: return QStringLiteral("scanner");
    case 0x07: return QStringLiteral("optical memory device");
    case 0x08: return QStringLiteral("medium changer");
    case 0x09: return QStringLiteral("communications");
    case 0x0A: return QStringLiteral("graphics [0xa]");
    case 0x0B: return QStringLiteral("graphics [0xb]");
    case 0x0C: return QStringLiteral("storage array controller");
    case 0x0D: return QStringLiteral("enclosure services device");
    case 0x0E: return QStringLiteral("simplified direct access device");
    case 0x0F: return QStringLiteral("optical card reader/writer device");
    case 0x10: return QStringLiteral("bridge controller commands");
    case 0x11: return QStringLiteral("object based storage");
    case 0x12: return QStringLiteral("automation/driver interface");
    case 0x13: return QStringLiteral("security manager device");
    case 0x14: return QStringLiteral("host managed zoned block");
    case 0x1E: return QStringLiteral("well known logical unit");
    case 0x1F: return QStringLiteral("unknown or no device type");
    default:
        break;
    }
    if (pdt > 0x14 && pdt < 0x1E) {
        return QStringLiteral("reserved [%1]").arg(hexCode(pdt));
    }
    return QStringLiteral("bad pdt");
}

PeripheralDeviceType ScsiNames::pdtDecay(int pdt)
{
    if (pdt < 0 || pdt > 0x1F) {
        return PeripheralDeviceType::Unknown;
    }

    switch (static_cast<PeripheralDeviceType>(pdt)) {
    case PeripheralDeviceType::WriteOnce:
    case PeripheralDeviceType::Optical:
    case PeripheralDeviceType::Rbc:
    case PeripheralDeviceType::Zbc:
        return PeripheralDeviceType::Disk;
    case PeripheralDeviceType::Printer:
    case PeripheralDeviceType::Adc:
        return PeripheralDeviceType::Tape;
    default:
        return static_cast<PeripheralDeviceType>(pdt);
    }
}

QString ScsiNames::transportProtocolName(int protocol)
{
    switch (protocol) {
    case 0x0: return QStringLiteral("Fibre Channel Protocol for SCSI (FCP-4)");
    case 0x1: return QStringLiteral("SCSI Parallel Interface (SPI-5)");
    case 0x2: return QStringLiteral("Serial Storage Architecture SCSI-3 Protocol (SSA-S3P)");
    case 0x3: return QStringLiteral("Serial Bus Protocol for IEEE 1394 (SBP-3)");
    case 0x4: return QStringLiteral("SCSI RDMA Protocol (SRP)");
    case 0x5: return QStringLiteral("Internet SCSI (iSCSI)");
    case 0x6: return QStringLiteral("Serial Attached SCSI Protocol (SPL-4)");
    case 0x7: return QStringLiteral("Automation/Drive Interface Transport (ADT-2)");
    case 0x8: return QStringLiteral("AT Attachment Interface (ACS-2)");
    case 0x9: return QStringLiteral("USB Attached SCSI (UAS-2)");
    case 0xA: return QStringLiteral("SCSI over PCI Express (SOP)");
    case 0xB: return QStringLiteral("PCIe");
    case 0xF: return QStringLiteral("No specific protocol");
    default:
        return QStringLiteral("[%1]").arg(hexCode(protocol));
    }
}

QString ScsiNames::designatorTypeName(int type)
{
    switch (type) {
    case 0x0: return QStringLiteral("vendor specific [0x0]");
    case 0x1: return QStringLiteral("T10 vendor identification");
    case 0x2: return QStringLiteral("EUI-64 based");
    case 0x3: return QStringLiteral("NAA");
    case 0x4: return QStringLiteral("Relative target port");
    case 0x5: return QStringLiteral("Target port group");
    case 0x6: return QStringLiteral("Logical unit group");
    case 0x7: return QStringLiteral("MD5 logical unit identifier");
    case 0x8: return QStringLiteral("SCSI name string");
    case 0x9: return QStringLiteral("Protocol specific port identifier");
    case 0xA: return QStringLiteral("UUID identifier");
    default:
        break;
    }
    if (type > 0xA && type <= 0xF) {
        return QStringLiteral("[%1]").arg(hexCode(type));
    }
    return QString();
}

QString ScsiNames::designatorCodeSetName(int codeSet)
{
    switch (codeSet) {
    case 0x1: return QStringLiteral("Binary");
    case 0x2: return QStringLiteral("ASCII");
    case 0x3: return QStringLiteral("UTF-8");
    default:
        break;
    }
    if (codeSet >= 0 && codeSet <= 0xF) {
        return QStringLiteral("Reserved [%1]").arg(hexCode(codeSet));
    }
    return QString();
}

QString ScsiNames::designatorAssociationName(int association)
{
    switch (association) {
    case 0: return QStringLiteral("Addressed logical unit");
    case 1: return QStringLiteral("Target port");
    case 2: return QStringLiteral("Target device that contains addressed lu");
    case 3: return QStringLiteral("Reserved [0x3]");
    default:
        return QString();
    }
}

} // namespace qsgpt

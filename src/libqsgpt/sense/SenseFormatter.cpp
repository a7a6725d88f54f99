/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Sense Text Formatter Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "SenseFormatter.h"
#include "SenseDecoder.h"
#include "../util/HexFormatter.h"
#include "../util/ScsiNames.h"

#include <QStringList>

namespace qsgpt {

static QString hex(quint64 value, int width = 2)
{
    return QStringLiteral("0x%1").arg(value, width, 16, QLatin1Char('0'));
}

static QString percent(quint16 progress)
{
    return QString::number(static_cast<double>(progress) * 100.0 / 65536.0, 'f', 2) + QLatin1Char('%');
}

QString SenseFormatter::senseKeySpecific(quint8 senseKey, const quint8* sks)
{
    const int value = (sks[1] << 8) | sks[2];

    switch (static_cast<SenseKey>(senseKey)) {
    case SenseKey::IllegalRequest: {
        QString text = QStringLiteral("Field pointer: Error in %1: byte %2")
                           .arg((sks[0] & 0x40) ? QStringLiteral("Command") : QStringLiteral("Data parameters"))
                           .arg(value);
        if (sks[0] & 0x08) {
            text += QStringLiteral(" bit %1").arg(sks[0] & 0x07);
        }
        return text;
    }
    case SenseKey::NoSense:
    case SenseKey::NotReady:
        return QStringLiteral("Progress indication: %1").arg(percent(static_cast<quint16>(value)));
    case SenseKey::HardwareError:
    case SenseKey::MediumError:
    case SenseKey::RecoveredError:
        return QStringLiteral("Actual retry count: %1").arg(value);
    case SenseKey::CopyAborted:
        return QStringLiteral("Segment pointer: byte %1 relative to %2")
            .arg(value)
            .arg((sks[0] & 0x20) ? QStringLiteral("segment descriptor") : QStringLiteral("parameter list"));
    case SenseKey::UnitAttention:
        return QStringLiteral("Unit attention condition queue: %1")
            .arg((sks[0] & 0x01) ? QStringLiteral("overflowed") : QStringLiteral("ok, no overflow"));
    default:
        return QStringLiteral("Sense key specific: unexpected for sense key %1").arg(hex(senseKey));
    }
}

QString SenseFormatter::descriptors(const QByteArray& sense, const QString& leadin)
{
    QString out;
    const int length = static_cast<int>(sense.size());
    const quint8* bytes = reinterpret_cast<const quint8*>(sense.constData());

    const std::optional<SenseHeader> header = SenseDecoder::normalize(sense);
    if (!header || !header->isDescriptorFormat() || length < 8) {
        return out;
    }

    const int end = 8 + qMin(static_cast<int>(bytes[7]), length - 8);
    int offset = 8;
    int index = 1;

    while (offset < end) {
        if (offset + 1 >= end) {
            out += leadin + QStringLiteral("  >>> descriptor list truncated at byte %1\n").arg(offset);
            break;
        }

        const quint8 type = bytes[offset];
        const int payloadLength = bytes[offset + 1];
        if (offset + 2 + payloadLength > end) {
            out += leadin + QStringLiteral("  >>> descriptor %1 (type %2) truncated\n").arg(index).arg(hex(type));
            break;
        }

        const quint8* d = bytes + offset;
        QString line = leadin + QStringLiteral("  Descriptor type: ");

        switch (type) {
        case SenseDescInformation:
            line += QStringLiteral("Information");
            if (payloadLength == 0x0A) {
                quint64 value = 0;
                for (int i = 4; i < 12; ++i) {
                    value = (value << 8) | d[i];
                }
                line += QStringLiteral(": %1%2").arg(hex(value, 16),
                                                     (d[2] & 0x80) ? QString() : QStringLiteral(" [valid=0]"));
            } else {
                line += QStringLiteral(": bad length %1").arg(payloadLength);
            }
            break;
        case SenseDescCommandSpecific:
            line += QStringLiteral("Command specific");
            if (payloadLength == 0x0A) {
                quint64 value = 0;
                for (int i = 4; i < 12; ++i) {
                    value = (value << 8) | d[i];
                }
                line += QStringLiteral(": %1").arg(hex(value, 16));
            }
            break;
        case SenseDescSenseKeySpecific:
            line += QStringLiteral("Sense key specific");
            if (payloadLength == 0x06 && (d[4] & 0x80)) {
                line += QStringLiteral(": ") + senseKeySpecific(header->senseKey, d + 4);
            } else if (payloadLength == 0x06) {
                line += QStringLiteral(": SKSV=0");
            }
            break;
        case SenseDescFieldReplaceable:
            line += QStringLiteral("Field replaceable unit");
            if (payloadLength >= 2) {
                line += QStringLiteral(": code=%1").arg(d[3]);
            }
            break;
        case SenseDescStreamCommands:
            line += QStringLiteral("Stream commands");
            if (payloadLength >= 2) {
                QStringList flags;
                if (d[3] & 0x80) {
                    flags << QStringLiteral("FILEMARK");
                }
                if (d[3] & 0x40) {
                    flags << QStringLiteral("EOM");
                }
                if (d[3] & 0x20) {
                    flags << QStringLiteral("ILI");
                }
                line += QStringLiteral(": ") + (flags.isEmpty() ? QStringLiteral("no flags set") : flags.join(QLatin1Char(' ')));
            }
            break;
        case SenseDescBlockCommands:
            line += QStringLiteral("Block commands");
            if (payloadLength >= 2) {
                line += QStringLiteral(": Incorrect Length Indicator %1")
                            .arg((d[3] & 0x20) ? QStringLiteral("set") : QStringLiteral("clear"));
            }
            break;
        case SenseDescAtaStatusReturn:
            line += QStringLiteral("ATA status return");
            if (payloadLength == 0x0C) {
                line += QStringLiteral(": extend=%1 error=%2 count=%3 device=%4 status=%5")
                            .arg(d[2] & 0x01)
                            .arg(hex(d[3]))
                            .arg(hex((d[4] << 8) | d[5], 4))
                            .arg(hex(d[12]))
                            .arg(hex(d[13]));
            }
            break;
        case SenseDescProgressIndication:
            line += QStringLiteral("Progress indication");
            if (payloadLength == 0x06) {
                line += QStringLiteral(": %1 [sense key %2, asc %3, ascq %4]")
                            .arg(percent(static_cast<quint16>((d[6] << 8) | d[7])))
                            .arg(hex(d[2]))
                            .arg(hex(d[3]))
                            .arg(hex(d[4]));
            }
            break;
        default:
            if (type >= 0x80) {
                line += QStringLiteral("Vendor specific [%1]").arg(hex(type));
            } else {
                line += QStringLiteral("Unknown [%1]").arg(hex(type));
            }
            break;
        }

        out += line + QLatin1Char('\n');
        offset += 2 + payloadLength;
        ++index;
    }

    return out;
}

QString SenseFormatter::describe(const QByteArray& sense, const QString& leadin, bool rawHex)
{
    QString out;

    if (sense.isEmpty()) {
        return leadin + QStringLiteral(">>> sense buffer empty\n");
    }

    const quint8* bytes = reinterpret_cast<const quint8*>(sense.constData());
    const int length = static_cast<int>(sense.size());
    const std::optional<SenseHeader> header = SenseDecoder::normalize(sense);

    if (!header) {
        out += leadin + QStringLiteral(">>> Unrecognized sense data format, response code=%1\n")
                            .arg(hex(bytes[0] & 0x7F));
        out += HexFormatter::dump(sense, HexFormat::WithAscii, leadin + QStringLiteral("  "));
        return out;
    }

    out += leadin + QStringLiteral("%1 format, %2; Sense key: %3\n")
                        .arg(header->isDescriptorFormat() ? QStringLiteral("Descriptor") : QStringLiteral("Fixed"),
                             header->isDeferred() ? QStringLiteral("deferred") : QStringLiteral("current"),
                             ScsiNames::senseKeyName(header->senseKey));
    out += leadin + QStringLiteral(" Additional sense: %1\n").arg(ScsiNames::ascAscqText(header->asc, header->ascq));

    if (!header->isDescriptorFormat()) {
        const SenseInfoField info = SenseDecoder::informationField(sense);
        if (length >= 7 && (info.valid || info.value != 0)) {
            out += leadin + QStringLiteral("  Info fld=%1 [%2]%3\n")
                                .arg(hex(info.value, 8))
                                .arg(info.value)
                                .arg(info.valid ? QString() : QStringLiteral(" (not valid)"));
        }

        const SenseStreamFlags flags = SenseDecoder::filemarkEomIli(sense);
        if (flags.anySet) {
            QStringList names;
            if (flags.filemark) {
                names << QStringLiteral("FMK");
            }
            if (flags.eom) {
                names << QStringLiteral("EOM");
            }
            if (flags.ili) {
                names << QStringLiteral("ILI");
            }
            out += leadin + QStringLiteral("  Flags: %1\n").arg(names.join(QLatin1Char(' ')));
        }

        if (length > 14 && bytes[14] != 0) {
            out += leadin + QStringLiteral("  Field replaceable unit code: %1\n").arg(bytes[14]);
        }
        if (length >= 18 && (bytes[15] & 0x80)) {
            out += leadin + QStringLiteral("  ") + senseKeySpecific(header->senseKey, bytes + 15) + QLatin1Char('\n');
        }
    } else {
        const QString list = descriptors(sense, leadin);
        if (!list.isEmpty()) {
            out += leadin + QStringLiteral(" Sense descriptors:\n");
            out += list;
        }
    }

    if (rawHex) {
        out += leadin + QStringLiteral(" Raw sense data (in hex), sb_len=%1:\n").arg(length);
        out += HexFormatter::dump(sense, HexFormat::NoAscii, leadin + QStringLiteral("    "));
    }

    return out;
}

} // namespace qsgpt

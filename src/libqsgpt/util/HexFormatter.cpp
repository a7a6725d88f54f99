/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Hex Formatter Implementation
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#include "HexFormatter.h"

#include <QRegularExpression>
#include <QStringList>

namespace qsgpt {

static constexpr int BYTES_PER_LINE = 16;

static QString hexByte(quint8 value)
{
    return QStringLiteral("%1").arg(value, 2, 16, QLatin1Char('0'));
}

QString HexFormatter::dump(const quint8* data, int length, HexFormat format, const QString& leadin)
{
    QString result;
    if (!data || length <= 0) {
        return result;
    }

    for (int offset = 0; offset < length; offset += BYTES_PER_LINE) {
        const int count = qMin(BYTES_PER_LINE, length - offset);
        QString line = leadin;

        if (format != HexFormat::HexOnly) {
            line += QStringLiteral("%1  ").arg(offset, 4, 16, QLatin1Char('0'));
        }

        for (int i = 0; i < BYTES_PER_LINE; ++i) {
            if (i > 0) {
                line += (i == 8) ? QStringLiteral("  ") : QStringLiteral(" ");
            }
            line += (i < count) ? hexByte(data[offset + i]) : QStringLiteral("  ");
        }

        if (format == HexFormat::WithAscii) {
            line += QStringLiteral("  ");
            for (int i = 0; i < count; ++i) {
                const quint8 c = data[offset + i];
                line += (c >= 0x20 && c < 0x7F) ? QLatin1Char(static_cast<char>(c)) : QLatin1Char('.');
            }
        }

        // Short last line leaves padding behind
        while (format != HexFormat::WithAscii && line.endsWith(QLatin1Char(' '))) {
            line.chop(1);
        }
        result += line;
        result += QLatin1Char('\n');
    }

    return result;
}

QString HexFormatter::dump(const QByteArray& data, HexFormat format, const QString& leadin)
{
    return dump(reinterpret_cast<const quint8*>(data.constData()), static_cast<int>(data.size()),
                format, leadin);
}

QString HexFormatter::formatBytes(const quint8* data, int length)
{
    QStringList parts;
    for (int i = 0; data && i < length; ++i) {
        parts << hexByte(data[i]);
    }
    return parts.join(QLatin1Char(' '));
}

QString HexFormatter::formatBytes(const QByteArray& data)
{
    return formatBytes(reinterpret_cast<const quint8*>(data.constData()), static_cast<int>(data.size()));
}

QByteArray HexFormatter::parseHex(const QString& text, bool* ok)
{
    if (ok) {
        *ok = false;
    }

    static const QRegularExpression separators(QStringLiteral("[\\s,:]+"));
    const QStringList tokens = text.split(separators, Qt::SkipEmptyParts);

    QByteArray result;
    for (QString token : tokens) {
        if (token.startsWith(QLatin1String("0x"), Qt::CaseInsensitive)) {
            token = token.mid(2);
        }
        if (token.isEmpty()) {
            return QByteArray();
        }
        if (token.size() == 1) {
            token.prepend(QLatin1Char('0'));
        }
        if (token.size() % 2 != 0) {
            return QByteArray();
        }

        for (int i = 0; i < token.size(); i += 2) {
            bool byteOk = false;
            const uint value = token.mid(i, 2).toUInt(&byteOk, 16);
            if (!byteOk) {
                return QByteArray();
            }
            result.append(static_cast<char>(value));
        }
    }

    if (ok) {
        *ok = !result.isEmpty();
    }
    return result;
}

} // namespace qsgpt

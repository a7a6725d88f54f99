/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Hex Formatter Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_HEXFORMATTER_H
#define QSGPT_HEXFORMATTER_H

#include "../libqsgpt_global.h"

#include <QByteArray>
#include <QString>

namespace qsgpt {

/**
 * @brief Hex dump layout
 */
enum class HexFormat {
    WithAscii,  ///< Address, 16 bytes, then printable ASCII ('.' otherwise)
    NoAscii,    ///< Address and 16 bytes
    HexOnly     ///< 16 bytes per line, no address
};

/**
 * @brief Utility class for hex dumps of CDBs, sense and data buffers
 */
class LIBQSGPT_EXPORT HexFormatter
{
public:
    /**
     * @brief Multi-line hex dump
     *
     * 16 bytes per line with an extra space between the 8th and 9th byte.
     * Every line starts with @p leadin and ends with '\n'.
     */
    static QString dump(const quint8* data, int length,
                        HexFormat format = HexFormat::WithAscii,
                        const QString& leadin = QString());

    static QString dump(const QByteArray& data,
                        HexFormat format = HexFormat::WithAscii,
                        const QString& leadin = QString());

    /**
     * @brief Single line of space separated bytes, e.g. "12 00 00 00 24 00"
     */
    static QString formatBytes(const quint8* data, int length);

    static QString formatBytes(const QByteArray& data);

    /**
     * @brief Parse hex text into bytes
     *
     * Accepts tokens separated by spaces, commas, colons or newlines. A
     * token may carry a 0x prefix and hold one byte ("a", "0a") or several
     * contiguous pairs ("12000000").
     * @param text Input text
     * @param ok Set to false on malformed input
     * @return Parsed bytes, empty on error
     */
    static QByteArray parseHex(const QString& text, bool* ok = nullptr);

private:
    HexFormatter() = default; // Static class
};

} // namespace qsgpt

#endif // QSGPT_HEXFORMATTER_H

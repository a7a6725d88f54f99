/**
 * QSgPt - Qt-based SCSI pass-through toolkit
 * Sense Text Formatter Header
 *
 * Copyright (c) 2026 Jeffrey ZHU (zhxsh1225@gmail.com)
 */

#ifndef QSGPT_SENSEFORMATTER_H
#define QSGPT_SENSEFORMATTER_H

#include "SenseTypes.h"

#include <QByteArray>
#include <QString>

namespace qsgpt {

/**
 * @brief Human-readable rendering of sense data
 *
 * Output is line oriented, each line prefixed with @c leadin and
 * terminated by a newline.
 */
class LIBQSGPT_EXPORT SenseFormatter
{
public:
    SenseFormatter() = delete;

    /**
     * @brief Describe a sense buffer
     * @param sense Raw sense bytes (as much as the device returned)
     * @param leadin Prefix for every line
     * @param rawHex Append a hex dump of the raw bytes
     */
    static QString describe(const QByteArray& sense, const QString& leadin = QString(),
                            bool rawHex = false);

    /**
     * @brief One line per descriptor of a descriptor format sense buffer
     *
     * Returns an empty string for fixed format or an empty list.
     */
    static QString descriptors(const QByteArray& sense, const QString& leadin = QString());

private:
    static QString senseKeySpecific(quint8 senseKey, const quint8* sks);
};

} // namespace qsgpt

#endif // QSGPT_SENSEFORMATTER_H

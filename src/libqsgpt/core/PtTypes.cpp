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

#include "PtTypes.h"

#include <string.h>

namespace qsgpt {

QString PtStatus::toString() const
{
    if (ok()) {
        return QStringLiteral("OK");
    }
    if (message.isEmpty()) {
        return ptErrorName(error);
    }
    return QStringLiteral("%1: %2").arg(ptErrorName(error), message);
}

PtStatus PtStatus::success()
{
    return PtStatus();
}

PtStatus PtStatus::failure(PtError error, const QString &message, int osErrno)
{
    PtStatus status;
    status.error = error;
    status.osErrno = osErrno;
    status.message = message;
    return status;
}

QString ptErrorName(PtError error)
{
    switch (error) {
    case PtError::None:              return QStringLiteral("None");
    case PtError::InvalidArgument:   return QStringLiteral("InvalidArgument");
    case PtError::ResourceExhausted: return QStringLiteral("ResourceExhausted");
    case PtError::OsError:           return QStringLiteral("OsError");
    case PtError::Timeout:           return QStringLiteral("Timeout");
    case PtError::BadParameters:     return QStringLiteral("BadParameters");
    case PtError::UseAfterFree:      return QStringLiteral("UseAfterFree");
    case PtError::Unsupported:       return QStringLiteral("Unsupported");
    }
    return QStringLiteral("Unknown");
}

QString safeStrerror(int errnum)
{
    if (errnum < 0) {
        errnum = -errnum;
    }

    char buffer[256] = {};
#if defined(Q_OS_WIN)
    if (strerror_s(buffer, sizeof(buffer), errnum) != 0) {
        buffer[0] = '\0';
    }
    const char *text = buffer;
#elif defined(__GLIBC__) && defined(_GNU_SOURCE)
    // GNU variant may return a static string instead of filling buffer
    const char *text = strerror_r(errnum, buffer, sizeof(buffer));
#else
    const char *text = (strerror_r(errnum, buffer, sizeof(buffer)) == 0) ? buffer : nullptr;
#endif

    if (!text || text[0] == '\0') {
        return QStringLiteral("Unknown error %1").arg(errnum);
    }
    return QString::fromLocal8Bit(text);
}

} // namespace qsgpt

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

#include <QtCore/qglobal.h>
#include <QString>

// LIBQSGPT_STATIC is set on the static target and propagated to users
#if defined(LIBQSGPT_STATIC)
#  define LIBQSGPT_EXPORT
#elif defined(LIBQSGPT_LIBRARY)
#  define LIBQSGPT_EXPORT Q_DECL_EXPORT
#else
#  define LIBQSGPT_EXPORT Q_DECL_IMPORT
#endif

#ifndef QSGPT_VERSION_MAJOR
#  define QSGPT_VERSION_MAJOR 1
#  define QSGPT_VERSION_MINOR 0
#  define QSGPT_VERSION_PATCH 0
#endif

namespace qsgpt {

// Taken from project() in CMakeLists.txt
constexpr int VERSION_MAJOR = QSGPT_VERSION_MAJOR;
constexpr int VERSION_MINOR = QSGPT_VERSION_MINOR;
constexpr int VERSION_PATCH = QSGPT_VERSION_PATCH;

/**
 * @brief "major.minor.patch", reported by the CLI and the log banner
 */
inline QString versionString()
{
    return QStringLiteral("%1.%2.%3").arg(VERSION_MAJOR).arg(VERSION_MINOR).arg(VERSION_PATCH);
}

} // namespace qsgpt


/************************************************************************\

    Glance - Prefetching image viewer
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "LoadError.h"

#include <QCoreApplication>

LoadError LoadError::notFound(const QString &message)
{
    return {Kind::NotFound, message};
}

LoadError LoadError::unsupported(const QString &message)
{
    return {Kind::Unsupported, message};
}

LoadError LoadError::uploadFailed(const QString &message)
{
    return {Kind::UploadFailed, message};
}

LoadError LoadError::other(const QString &message)
{
    return {Kind::Other, message};
}

/**
 * @brief Returns the user-facing description of an error kind.
 * @param kind Error kind to describe.
 * @return Translated description.
 */
QString LoadError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::NotFound:
        return QCoreApplication::translate("LoadError", "File not found");
    case Kind::Unsupported:
        return QCoreApplication::translate("LoadError", "Unsupported image format");
    case Kind::UploadFailed:
        return QCoreApplication::translate("LoadError", "Bitmap upload failed");
    case Kind::Other:
    default:
        return QCoreApplication::translate("LoadError", "Error");
    }
}

/**
 * @brief Formats the error for logs and the view.
 * @return Kind description, followed by the detail message when present.
 */
QString LoadError::toString() const
{
    if (message.isEmpty()) {
        return kindName(kind);
    }
    return QStringLiteral("%1: %2").arg(kindName(kind), message);
}

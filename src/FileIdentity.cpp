
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

#include "FileIdentity.h"

#include <QDir>

FileIdentity::FileIdentity(const QString &normalizedPath)
    : m_path(normalizedPath)
{
}

/**
 * @brief Builds the cache identity of a file path.
 * @param path Absolute or relative file path.
 * @return Identity keyed by the normalized path, invalid for an empty path.
 */
FileIdentity FileIdentity::fromPath(const QString &path)
{
    return FileIdentity(normalizePath(path));
}

/**
 * @brief Normalizes a path for consistent comparisons across platforms.
 * @param path Input path to normalize.
 * @return Clean absolute path using forward slashes, empty for an empty path.
 */
QString FileIdentity::normalizePath(const QString &path)
{
    if (path.isEmpty()) {
        return QString();
    }
    QString normalized = QDir::fromNativeSeparators(path);
    normalized = QDir::cleanPath(QDir(normalized).absolutePath());
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return normalized;
}

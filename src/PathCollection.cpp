
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

#include "PathCollection.h"

#include <QCollator>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QVector>
#include <algorithm>
#include <limits>
#include <utility>

#include "FileIdentity.h"
#include "Logging.h"

namespace {

struct SortEntry {
    QString path;
    QString fileName;
    qint64 modified = 0;
    qint64 byteSize = 0;
};

struct PathCollectionConstants {
    static constexpr qint64 unknownMetadata = std::numeric_limits<qint64>::max();
};

/**
 * @brief Normalizes an extension allow-list for suffix comparisons.
 * @param extensions Extensions with or without a leading dot.
 * @param extensionCase Case rule applied to suffix comparisons.
 * @return Set of non-empty extensions, lowercased when case-insensitive.
 */
QSet<QString> normalizeExtensions(const QStringList &extensions, Qt::CaseSensitivity extensionCase)
{
    QSet<QString> set;
    for (const QString &extension : extensions) {
        QString trimmed = extension.trimmed();
        while (trimmed.startsWith(QLatin1Char('.'))) {
            trimmed.remove(0, 1);
        }
        if (trimmed.isEmpty()) {
            continue;
        }
        set.insert(extensionCase == Qt::CaseInsensitive ? trimmed.toLower() : trimmed);
    }
    return set;
}

/**
 * @brief Captures the metadata a sort needs, once per path.
 * @param path File path to inspect.
 * @return Sort entry. Unreadable metadata sorts last in ascending order.
 */
SortEntry makeSortEntry(const QString &path)
{
    const QFileInfo info(path);
    SortEntry entry;
    entry.path = path;
    entry.fileName = info.fileName();
    if (info.exists()) {
        const QDateTime modified = info.lastModified();
        entry.modified = modified.isValid() ? modified.toMSecsSinceEpoch() : PathCollectionConstants::unknownMetadata;
        entry.byteSize = info.size();
    } else {
        entry.modified = PathCollectionConstants::unknownMetadata;
        entry.byteSize = PathCollectionConstants::unknownMetadata;
    }
    return entry;
}

} // namespace

/**
 * @brief Enumerates the viewable files of a folder.
 * @param directory Folder to enumerate.
 * @param extensions Allowed file suffixes.
 * @param sortKey Ordering key.
 * @param sortOrder Ordering direction.
 * @param initialFile File to place the cursor on when found.
 * @param extensionCase Case rule for suffix matching.
 * @return Ordered collection, empty when the folder cannot be listed.
 */
PathCollection PathCollection::build(const QString &directory,
                                     const QStringList &extensions,
                                     SortKey sortKey,
                                     Qt::SortOrder sortOrder,
                                     const QString &initialFile,
                                     Qt::CaseSensitivity extensionCase)
{
    PathCollection collection;
    collection.m_sortKey = sortKey;
    collection.m_sortOrder = sortOrder;

    const QFileInfo directoryInfo(directory);
    if (directory.isEmpty() || !directoryInfo.isDir()) {
        qCWarning(lcNavigation) << "not a directory:" << directory;
        return collection;
    }
    collection.m_directory = directoryInfo.absoluteFilePath();

    const QSet<QString> allowed = normalizeExtensions(extensions, extensionCase);
    const QDir dir(collection.m_directory);
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::NoSort);
    for (const QFileInfo &info : entries) {
        if (!info.isFile()) {
            continue;
        }
        const QString suffix = extensionCase == Qt::CaseInsensitive ? info.suffix().toLower() : info.suffix();
        if (suffix.isEmpty() || !allowed.contains(suffix)) {
            continue;
        }
        collection.m_paths.append(info.absoluteFilePath());
    }

    collection.sortPaths();
    if (!initialFile.isEmpty()) {
        collection.m_index = std::max(0, collection.indexOf(initialFile));
    }

    qCDebug(lcNavigation) << "enumerated" << collection.m_paths.size() << "files in" << collection.m_directory;
    return collection;
}

QString PathCollection::current() const
{
    if (m_paths.isEmpty()) {
        return QString();
    }
    return m_paths.at(m_index);
}

/**
 * @brief Finds a path in the collection.
 * @param path Path to look up, compared by normalized identity.
 * @return Index of the path, or -1 when absent.
 */
int PathCollection::indexOf(const QString &path) const
{
    const FileIdentity wanted = FileIdentity::fromPath(path);
    if (!wanted.isValid()) {
        return -1;
    }
    for (int i = 0; i < m_paths.size(); ++i) {
        if (FileIdentity::fromPath(m_paths.at(i)) == wanted) {
            return i;
        }
    }
    return -1;
}

/**
 * @brief Moves the cursor forward and returns the files that must be resident.
 * @param lookahead Number of files after the new cursor to warm.
 * @return Paths from the new cursor to the end of the window, or only the last
 *         path when the cursor already is on it.
 */
QStringList PathCollection::next(int lookahead)
{
    if (m_paths.isEmpty()) {
        return {};
    }
    const int last = size() - 1;
    if (m_index >= last) {
        return {m_paths.at(last)};
    }
    m_index += 1;
    const int span = std::min(std::max(0, lookahead), last - m_index);
    return m_paths.mid(m_index, span + 1);
}

/**
 * @brief Moves the cursor backward and returns the files that must be resident.
 * @param lookahead Number of files before the new cursor to warm.
 * @return Paths from the start of the window to the new cursor, in collection
 *         order, or only the first path when the cursor already is on it.
 */
QStringList PathCollection::prev(int lookahead)
{
    if (m_paths.isEmpty()) {
        return {};
    }
    if (m_index <= 0) {
        return {m_paths.first()};
    }
    m_index -= 1;
    const int span = std::min(std::max(0, lookahead), m_index);
    return m_paths.mid(m_index - span, span + 1);
}

/**
 * @brief Re-sorts the collection and drops files that disappeared.
 * @param sortKey New ordering key.
 * @param sortOrder New ordering direction.
 */
void PathCollection::reorder(SortKey sortKey, Qt::SortOrder sortOrder)
{
    m_sortKey = sortKey;
    m_sortOrder = sortOrder;
    if (m_paths.isEmpty()) {
        return;
    }

    const QString currentPath = current();
    sortPaths();
    const qsizetype before = m_paths.size();
    m_paths.erase(std::remove_if(m_paths.begin(), m_paths.end(), [](const QString &path) {
        return !QFileInfo(path).isFile();
    }), m_paths.end());
    if (m_paths.size() != before) {
        qCDebug(lcNavigation) << "dropped" << before - m_paths.size() << "vanished files";
    }
    m_index = std::max(0, indexOf(currentPath));
}

void PathCollection::sortPaths()
{
    QVector<SortEntry> entries;
    entries.reserve(m_paths.size());
    for (const QString &path : std::as_const(m_paths)) {
        entries.append(makeSortEntry(path));
    }

    QCollator collator;
    collator.setCaseSensitivity(Qt::CaseInsensitive);

    auto ascending = [&](const SortEntry &left, const SortEntry &right) {
        switch (m_sortKey) {
        case SortKey::Modified:
            if (left.modified != right.modified) {
                return left.modified < right.modified;
            }
            break;
        case SortKey::Size:
            if (left.byteSize != right.byteSize) {
                return left.byteSize < right.byteSize;
            }
            break;
        case SortKey::Name:
        default:
            break;
        }
        const int byName = collator.compare(left.fileName, right.fileName);
        if (byName != 0) {
            return byName < 0;
        }
        return left.path < right.path;
    };

    if (m_sortOrder == Qt::AscendingOrder) {
        std::sort(entries.begin(), entries.end(), ascending);
    } else {
        std::sort(entries.begin(), entries.end(), [&](const SortEntry &left, const SortEntry &right) {
            return ascending(right, left);
        });
    }

    m_paths.clear();
    for (const SortEntry &entry : std::as_const(entries)) {
        m_paths.append(entry.path);
    }
}

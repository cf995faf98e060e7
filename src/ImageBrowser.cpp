
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

#include "ImageBrowser.h"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QUrl>

#include <utility>

#include "BitmapDevice.h"
#include "FileIdentity.h"
#include "ImageCacheManager.h"
#include "Logging.h"

namespace {
struct ImageBrowserConstants {
    static constexpr double bytesPerMegabyte = 1024.0 * 1024.0;
    static constexpr int megabytePrecision = 1;
};

QString toMegabytes(qsizetype bytes)
{
    return QString::number(static_cast<double>(bytes) / ImageBrowserConstants::bytesPerMegabyte,
                           'f',
                           ImageBrowserConstants::megabytePrecision);
}

QString toLocalPath(const QString &pathOrUrl)
{
    const QString trimmed = pathOrUrl.trimmed();
    if (trimmed.startsWith(QLatin1String("file:"), Qt::CaseInsensitive)) {
        return QUrl(trimmed).toLocalFile();
    }
    return trimmed;
}
} // namespace

/**
 * @brief Creates the browser on top of a cache facade.
 * @param cache Cache facade used for loads and lookups. Not owned.
 * @param device Device handed to every load.
 * @param settings Extensions, ordering, lookahead and view settings.
 * @param parent Parent QObject for ownership.
 */
ImageBrowser::ImageBrowser(ImageCacheManager *cache,
                           QSharedPointer<BitmapDevice> device,
                           const BrowserSettings &settings,
                           QObject *parent)
    : QObject(parent)
    , m_cache(cache)
    , m_device(std::move(device))
    , m_settings(settings)
{
    if (m_cache) {
        connect(m_cache, &ImageCacheManager::imageLoaded, this, &ImageBrowser::onImageLoaded);
    }
}

QString ImageBrowser::currentPath() const
{
    return m_collection.current();
}

int ImageBrowser::currentIndex() const
{
    return m_collection.index();
}

int ImageBrowser::count() const
{
    return m_collection.size();
}

QString ImageBrowser::directory() const
{
    return m_collection.directory();
}

/**
 * @brief Returns the window title for the current position.
 * @return "glance <position>/<count> <path>", or "glance" with nothing open.
 */
QString ImageBrowser::title() const
{
    if (m_collection.directory().isEmpty()) {
        return QStringLiteral("glance");
    }
    const int position = m_collection.isEmpty() ? 0 : m_collection.index() + 1;
    return QStringLiteral("glance %1/%2 %3")
        .arg(position)
        .arg(m_collection.size())
        .arg(QDir::toNativeSeparators(m_collection.current()));
}

QString ImageBrowser::sortKey() const
{
    return BrowserSettings::sortKeyName(m_settings.sortKey);
}

QString ImageBrowser::sortOrder() const
{
    return BrowserSettings::sortOrderName(m_settings.sortOrder);
}

int ImageBrowser::revision() const
{
    return m_revision;
}

/**
 * @brief Returns the image provider URL of the current file.
 * @return "image://bitmaps/<id>", or an empty string with nothing to show.
 */
QString ImageBrowser::imageSource() const
{
    if (m_collection.isEmpty()) {
        return QString();
    }
    return QStringLiteral("image://bitmaps/") + imageId(m_revision, m_collection.current());
}

QString ImageBrowser::currentError() const
{
    if (!m_cache || m_collection.isEmpty()) {
        return QString();
    }
    const BitmapLookup lookup = m_cache->get(m_collection.current());
    return lookup.isFailed() ? lookup.error.toString() : QString();
}

QString ImageBrowser::memoryText() const
{
    if (!m_cache) {
        return QString();
    }
    return QStringLiteral("bmp: %1/%2(MB)\nimage: %3/%4(MB)")
        .arg(toMegabytes(m_cache->bitmapCacheSize()),
             toMegabytes(m_cache->bitmapCacheCapacity()),
             toMegabytes(m_cache->imageCacheSize()),
             toMegabytes(m_cache->imageCacheCapacity()));
}

bool ImageBrowser::showMemory() const
{
    return m_showMemory;
}

void ImageBrowser::setShowMemory(bool show)
{
    if (m_showMemory == show) {
        return;
    }
    m_showMemory = show;
    emit showMemoryChanged();
}

QColor ImageBrowser::background() const
{
    return m_settings.background;
}

bool ImageBrowser::smoothScaling() const
{
    return m_settings.smoothScaling;
}

QVariantMap ImageBrowser::keyBindings() const
{
    return m_settings.keyBindingMap();
}

/**
 * @brief Returns the file dialog filter built from the allowed extensions.
 * @return Single filter entry listing every extension.
 */
QStringList ImageBrowser::nameFilters() const
{
    QStringList patterns;
    for (const QString &extension : m_settings.extensions) {
        patterns.append(QStringLiteral("*.") + extension);
    }
    return {tr("Images (%1)").arg(patterns.join(QLatin1Char(' ')))};
}

QRect ImageBrowser::windowGeometry() const
{
    return m_settings.windowGeometry;
}

const PathCollection &ImageBrowser::collection() const
{
    return m_collection;
}

/**
 * @brief Returns the settings including the current ordering and geometry.
 * @return Settings to persist.
 */
BrowserSettings ImageBrowser::settings() const
{
    return m_settings;
}

/**
 * @brief Builds an image provider id for a file.
 *
 * The revision makes QML request the image again after a load completes.
 * The path is base64url encoded so that URL normalization leaves it intact.
 *
 * @param revision Browser revision.
 * @param path File path.
 * @return "<revision>/<encoded path>".
 */
QString ImageBrowser::imageId(int revision, const QString &path)
{
    const QByteArray encoded = path.toUtf8().toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals);
    return QString::number(revision) + QLatin1Char('/') + QString::fromLatin1(encoded);
}

QString ImageBrowser::pathFromImageId(const QString &id)
{
    const int separator = id.indexOf(QLatin1Char('/'));
    if (separator < 0) {
        return QString();
    }
    const QByteArray encoded = id.mid(separator + 1).toLatin1();
    return QString::fromUtf8(QByteArray::fromBase64(encoded, QByteArray::Base64UrlEncoding));
}

/**
 * @brief Opens a folder, or the folder of a file positioned on that file.
 * @param pathOrUrl Local path or file URL.
 * @return True when a folder was opened, false when the path is neither.
 */
bool ImageBrowser::open(const QString &pathOrUrl)
{
    const QString path = toLocalPath(pathOrUrl);
    const QFileInfo info(path);
    QString directoryPath;
    QString initialFile;
    if (info.isFile()) {
        directoryPath = info.absolutePath();
        initialFile = info.absoluteFilePath();
    } else if (info.isDir()) {
        directoryPath = info.absoluteFilePath();
    } else {
        qCWarning(lcNavigation) << "cannot open" << pathOrUrl;
        emit openFailed(pathOrUrl);
        return false;
    }

    if (m_cache) {
        m_cache->clear();
    }
    m_collection = PathCollection::build(directoryPath,
                                         m_settings.extensions,
                                         m_settings.sortKey,
                                         m_settings.sortOrder,
                                         initialFile,
                                         m_settings.extensionCase());
    qCInfo(lcNavigation) << "opened" << directoryPath << "with" << m_collection.size() << "images";

    emit collectionChanged();
    emit currentChanged();
    emit revisionChanged();
    emit cacheChanged();

    if (!m_collection.isEmpty()) {
        const int remaining = m_collection.size() - m_collection.index() - 1;
        const int span = qMin(qMax(0, m_settings.lookahead), remaining);
        warm(m_collection.paths().mid(m_collection.index(), span + 1));
    }
    return true;
}

/**
 * @brief Steps to the next file and warms the forward window.
 * @return Paths requested from the cache.
 */
QStringList ImageBrowser::next()
{
    const int before = m_collection.index();
    const QStringList window = m_collection.next(m_settings.lookahead);
    warm(window);
    if (m_collection.index() != before) {
        emit currentChanged();
        emit revisionChanged();
    }
    return window;
}

/**
 * @brief Steps to the previous file and warms the backward window.
 * @return Paths requested from the cache.
 */
QStringList ImageBrowser::prev()
{
    const int before = m_collection.index();
    const QStringList window = m_collection.prev(m_settings.lookahead);
    warm(window);
    if (m_collection.index() != before) {
        emit currentChanged();
        emit revisionChanged();
    }
    return window;
}

bool ImageBrowser::reorder(const QString &sortKey, const QString &sortOrder)
{
    PathCollection::SortKey key = m_settings.sortKey;
    Qt::SortOrder order = m_settings.sortOrder;
    if (!BrowserSettings::parseSortKey(sortKey, &key) || !BrowserSettings::parseSortOrder(sortOrder, &order)) {
        qCWarning(lcNavigation) << "unknown ordering" << sortKey << sortOrder;
        return false;
    }
    reorder(key, order);
    return true;
}

/**
 * @brief Re-sorts the open folder, keeping the cursor on the same file.
 * @param sortKey New ordering key.
 * @param sortOrder New ordering direction.
 */
void ImageBrowser::reorder(PathCollection::SortKey sortKey, Qt::SortOrder sortOrder)
{
    m_settings.sortKey = sortKey;
    m_settings.sortOrder = sortOrder;
    const int sizeBefore = m_collection.size();
    m_collection.reorder(sortKey, sortOrder);
    emit orderChanged();
    if (m_collection.size() != sizeBefore) {
        emit collectionChanged();
    }
    emit currentChanged();
    emit revisionChanged();
    if (!m_collection.isEmpty()) {
        warm({m_collection.current()});
    }
}

void ImageBrowser::toggleMemory()
{
    setShowMemory(!m_showMemory);
}

void ImageBrowser::setWindowGeometry(int x, int y, int width, int height)
{
    const QRect geometry(x, y, width, height);
    if (!geometry.isValid() || geometry == m_settings.windowGeometry) {
        return;
    }
    m_settings.windowGeometry = geometry;
    emit windowGeometryChanged();
}

// Only the file on screen needs a new image request.
void ImageBrowser::onImageLoaded(const QString &path)
{
    emit cacheChanged();
    if (m_collection.isEmpty() || FileIdentity::fromPath(path) != FileIdentity::fromPath(m_collection.current())) {
        return;
    }
    m_revision += 1;
    emit revisionChanged();
}

void ImageBrowser::warm(const QStringList &paths)
{
    if (!m_cache) {
        return;
    }
    for (const QString &path : paths) {
        m_cache->load(path, m_device);
        qCDebug(lcNavigation) << "load:" << path;
    }
}


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

#include "BitmapImageProvider.h"

#include "ImageBrowser.h"
#include "ImageCacheManager.h"
#include "Logging.h"

BitmapImageProvider::BitmapImageProvider(ImageCacheManager *cache)
    : QQuickImageProvider(QQuickImageProvider::Image)
    , m_cache(cache)
{
}

/**
 * @brief Returns the resident bitmap of the file encoded in @p id.
 * @param id Image id built by ImageBrowser::imageId().
 * @param size Receives the full bitmap size.
 * @param requestedSize Size hint from QML, applied with aspect ratio kept.
 * @return Bitmap pixels, or a null image while the file is missing or failed.
 */
QImage BitmapImageProvider::requestImage(const QString &id, QSize *size, const QSize &requestedSize)
{
    if (!m_cache) {
        return QImage();
    }
    const QString path = ImageBrowser::pathFromImageId(id);
    if (path.isEmpty()) {
        return QImage();
    }

    const BitmapLookup lookup = m_cache->get(path);
    if (!lookup.isReady()) {
        if (lookup.isFailed()) {
            qCDebug(lcCache) << "no bitmap for" << path << lookup.error.toString();
        }
        return QImage();
    }

    QImage image = lookup.bitmap.pixels;
    if (size) {
        *size = image.size();
    }
    if (requestedSize.isValid() && !requestedSize.isEmpty() && requestedSize != image.size()) {
        image = image.scaled(requestedSize, Qt::KeepAspectRatio, Qt::SmoothTransformation);
    }
    return image;
}

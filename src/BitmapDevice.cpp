
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

#include "BitmapDevice.h"

RasterBitmapDevice::RasterBitmapDevice(int maxTextureSize)
    : m_maxTextureSize(maxTextureSize > 0 ? maxTextureSize : defaultMaxTextureSize)
{
}

UploadResult RasterBitmapDevice::upload(const RawImage &image)
{
    UploadResult result;
    if (image.isNull()) {
        result.error = LoadError::uploadFailed(QStringLiteral("Empty image"));
        return result;
    }
    const QSize size = image.size();
    if (size.width() > m_maxTextureSize || size.height() > m_maxTextureSize) {
        result.error = LoadError::uploadFailed(QStringLiteral("%1x%2 exceeds the maximum texture size %3")
                                                   .arg(size.width())
                                                   .arg(size.height())
                                                   .arg(m_maxTextureSize));
        return result;
    }

    result.bitmap.pixels = image.pixels.convertToFormat(QImage::Format_RGBA8888_Premultiplied);
    if (result.bitmap.pixels.isNull()) {
        result.error = LoadError::uploadFailed(QStringLiteral("Pixel conversion failed"));
        return result;
    }
    result.bitmap.handle = m_nextHandle.fetchAndAddRelaxed(1);
    result.ok = true;
    return result;
}

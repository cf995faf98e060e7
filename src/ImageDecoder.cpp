
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

#include "ImageDecoder.h"

#include <QFileInfo>
#include <QImageReader>

/**
 * @brief Decodes an image file to RGBA8888 pixels.
 * @param path File path to decode.
 * @return Decoded pixels, or the mapped reader error.
 */
DecodeResult ImageReaderDecoder::decode(const QString &path)
{
    DecodeResult result;
    if (!QFileInfo::exists(path)) {
        result.error = LoadError::notFound(path);
        return result;
    }

    QImageReader reader(path);
    reader.setAutoTransform(true);
    const QImage image = reader.read();
    if (image.isNull()) {
        switch (reader.error()) {
        case QImageReader::FileNotFoundError:
            result.error = LoadError::notFound(path);
            break;
        case QImageReader::UnsupportedFormatError:
            result.error = LoadError::unsupported(path);
            break;
        default:
            result.error = LoadError::other(reader.errorString());
            break;
        }
        return result;
    }

    result.image.pixels = image.convertToFormat(QImage::Format_RGBA8888);
    if (result.image.isNull()) {
        result.error = LoadError::other(QStringLiteral("Pixel conversion failed"));
        return result;
    }
    result.ok = true;
    return result;
}


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

#include "BrowserSettings.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

#include "BitmapDevice.h"
#include "Logging.h"

namespace {
constexpr char browseGroup[] = "browse";
constexpr char cacheGroup[] = "cache";
constexpr char windowGroup[] = "window";
constexpr char viewGroup[] = "view";
constexpr char keysGroup[] = "keys";
constexpr char logGroup[] = "log";

constexpr char extensionsKey[] = "extensions";
constexpr char extensionCaseKey[] = "extensionCaseSensitive";
constexpr char lookaheadKey[] = "lookahead";
constexpr char sortKeyKey[] = "sortKey";
constexpr char sortOrderKey[] = "sortOrder";
constexpr char workerThreadsKey[] = "workerThreads";
constexpr char bitmapBytesKey[] = "bitmapBytes";
constexpr char imageBytesKey[] = "imageBytes";
constexpr char maxTextureSizeKey[] = "maxTextureSize";
constexpr char geometryKey[] = "geometry";
constexpr char backgroundKey[] = "background";
constexpr char smoothScalingKey[] = "smoothScaling";
constexpr char logFileKey[] = "file";

struct BrowserSettingsDefaults {
    static constexpr int lookahead = 5;
    static constexpr int maxLookahead = 1024;
    static constexpr qsizetype bitmapCacheBytes = qsizetype(512) * 1024 * 1024;
    static constexpr qsizetype imageCacheBytes = qsizetype(1024) * 1024 * 1024;
    static constexpr int windowWidth = 640;
    static constexpr int windowHeight = 480;
    static constexpr qreal backgroundLevel = 0.15;
};

QStringList defaultExtensions()
{
    return {
        QStringLiteral("png"),
        QStringLiteral("jpg"),
        QStringLiteral("jpeg"),
        QStringLiteral("bmp"),
        QStringLiteral("ico"),
        QStringLiteral("tif"),
        QStringLiteral("tiff"),
        QStringLiteral("pnm"),
        QStringLiteral("pbm"),
        QStringLiteral("pgm"),
        QStringLiteral("ppm"),
        QStringLiteral("tga"),
    };
}

QHash<QString, QStringList> defaultKeyBindings()
{
    return {
        {QStringLiteral("open"), {QStringLiteral("O")}},
        {QStringLiteral("prev"), {QStringLiteral("A"), QStringLiteral("Left")}},
        {QStringLiteral("next"), {QStringLiteral("D"), QStringLiteral("Right")}},
        {QStringLiteral("printMemory"), {QStringLiteral("F1")}},
    };
}

QString defaultLogFile()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        base = QDir::currentPath();
    }
    return QDir(base).filePath(QStringLiteral("glance.log"));
}

QStringList trimmedNonEmpty(const QStringList &values)
{
    QStringList result;
    for (const QString &value : values) {
        const QString trimmed = value.trimmed();
        if (!trimmed.isEmpty()) {
            result.append(trimmed);
        }
    }
    return result;
}

int readInt(QSettings &settings, const char *key, int fallback, int minimum)
{
    bool ok = false;
    const int value = settings.value(QLatin1String(key), fallback).toInt(&ok);
    if (!ok || value < minimum) {
        qCWarning(lcSettings) << "invalid value for" << settings.group() + QLatin1Char('/') + QLatin1String(key)
                              << "- using" << fallback;
        return fallback;
    }
    return value;
}

qsizetype readBytes(QSettings &settings, const char *key, qsizetype fallback)
{
    bool ok = false;
    const qlonglong value = settings.value(QLatin1String(key), qlonglong(fallback)).toLongLong(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcSettings) << "invalid value for" << settings.group() + QLatin1Char('/') + QLatin1String(key)
                              << "- using" << fallback;
        return fallback;
    }
    return static_cast<qsizetype>(value);
}

} // namespace

/**
 * @brief Returns the settings used when nothing is stored yet.
 * @return Default settings.
 */
BrowserSettings BrowserSettings::defaults()
{
    BrowserSettings settings;
    settings.extensions = defaultExtensions();
    settings.extensionCaseSensitive = false;
    settings.lookahead = BrowserSettingsDefaults::lookahead;
    settings.sortKey = PathCollection::SortKey::Name;
    settings.sortOrder = Qt::AscendingOrder;
    settings.workerThreads = ImageCacheManager::defaultWorkerThreads(settings.lookahead);
    settings.bitmapCacheBytes = BrowserSettingsDefaults::bitmapCacheBytes;
    settings.imageCacheBytes = BrowserSettingsDefaults::imageCacheBytes;
    settings.maxTextureSize = RasterBitmapDevice::defaultMaxTextureSize;
    settings.windowGeometry = QRect(0, 0, BrowserSettingsDefaults::windowWidth, BrowserSettingsDefaults::windowHeight);
    settings.background = QColor::fromRgbF(BrowserSettingsDefaults::backgroundLevel,
                                           BrowserSettingsDefaults::backgroundLevel,
                                           BrowserSettingsDefaults::backgroundLevel);
    settings.smoothScaling = true;
    settings.keyBindings = defaultKeyBindings();
    settings.logFile = defaultLogFile();
    return settings;
}

/**
 * @brief Reads settings, replacing missing or invalid values with defaults.
 * @param settings Settings storage to read from.
 * @return Validated settings.
 */
BrowserSettings BrowserSettings::load(QSettings &settings)
{
    BrowserSettings result = defaults();

    settings.beginGroup(QLatin1String(browseGroup));
    if (settings.contains(QLatin1String(extensionsKey))) {
        const QStringList extensions = trimmedNonEmpty(settings.value(QLatin1String(extensionsKey)).toStringList());
        if (extensions.isEmpty()) {
            qCWarning(lcSettings) << "empty extension list - using defaults";
        } else {
            result.extensions = extensions;
        }
    }
    result.extensionCaseSensitive = settings.value(QLatin1String(extensionCaseKey), result.extensionCaseSensitive).toBool();
    result.lookahead = readInt(settings, lookaheadKey, result.lookahead, 0);
    if (result.lookahead > BrowserSettingsDefaults::maxLookahead) {
        qCWarning(lcSettings) << "lookahead" << result.lookahead << "capped to" << BrowserSettingsDefaults::maxLookahead;
        result.lookahead = BrowserSettingsDefaults::maxLookahead;
    }
    if (settings.contains(QLatin1String(sortKeyKey))
        && !parseSortKey(settings.value(QLatin1String(sortKeyKey)).toString(), &result.sortKey)) {
        qCWarning(lcSettings) << "unknown sort key" << settings.value(QLatin1String(sortKeyKey)).toString();
    }
    if (settings.contains(QLatin1String(sortOrderKey))
        && !parseSortOrder(settings.value(QLatin1String(sortOrderKey)).toString(), &result.sortOrder)) {
        qCWarning(lcSettings) << "unknown sort order" << settings.value(QLatin1String(sortOrderKey)).toString();
    }
    settings.endGroup();

    settings.beginGroup(QLatin1String(cacheGroup));
    result.workerThreads = readInt(settings, workerThreadsKey,
                                   ImageCacheManager::defaultWorkerThreads(result.lookahead), 1);
    result.bitmapCacheBytes = readBytes(settings, bitmapBytesKey, result.bitmapCacheBytes);
    result.imageCacheBytes = readBytes(settings, imageBytesKey, result.imageCacheBytes);
    result.maxTextureSize = readInt(settings, maxTextureSizeKey, result.maxTextureSize, 1);
    settings.endGroup();

    settings.beginGroup(QLatin1String(windowGroup));
    const QRect geometry = settings.value(QLatin1String(geometryKey), result.windowGeometry).toRect();
    if (geometry.isValid()) {
        result.windowGeometry = geometry;
    } else {
        qCWarning(lcSettings) << "invalid window geometry" << geometry;
    }
    settings.endGroup();

    settings.beginGroup(QLatin1String(viewGroup));
    if (settings.contains(QLatin1String(backgroundKey))) {
        const QColor background(settings.value(QLatin1String(backgroundKey)).toString());
        if (background.isValid()) {
            result.background = background;
        } else {
            qCWarning(lcSettings) << "invalid background color" << settings.value(QLatin1String(backgroundKey));
        }
    }
    result.smoothScaling = settings.value(QLatin1String(smoothScalingKey), result.smoothScaling).toBool();
    settings.endGroup();

    settings.beginGroup(QLatin1String(keysGroup));
    const QStringList actions = result.keyBindings.keys();
    for (const QString &action : actions) {
        if (!settings.contains(action)) {
            continue;
        }
        const QStringList sequences = trimmedNonEmpty(settings.value(action).toStringList());
        if (sequences.isEmpty()) {
            qCWarning(lcSettings) << "no key bound to" << action << "- using defaults";
            continue;
        }
        result.keyBindings.insert(action, sequences);
    }
    settings.endGroup();

    settings.beginGroup(QLatin1String(logGroup));
    result.logFile = settings.value(QLatin1String(logFileKey), result.logFile).toString();
    settings.endGroup();

    return result;
}

/**
 * @brief Writes every setting and flushes the storage.
 * @param settings Settings storage to write to.
 */
void BrowserSettings::save(QSettings &settings) const
{
    settings.beginGroup(QLatin1String(browseGroup));
    settings.setValue(QLatin1String(extensionsKey), extensions);
    settings.setValue(QLatin1String(extensionCaseKey), extensionCaseSensitive);
    settings.setValue(QLatin1String(lookaheadKey), lookahead);
    settings.setValue(QLatin1String(sortKeyKey), sortKeyName(sortKey));
    settings.setValue(QLatin1String(sortOrderKey), sortOrderName(sortOrder));
    settings.endGroup();

    settings.beginGroup(QLatin1String(cacheGroup));
    settings.setValue(QLatin1String(workerThreadsKey), workerThreads);
    settings.setValue(QLatin1String(bitmapBytesKey), qlonglong(bitmapCacheBytes));
    settings.setValue(QLatin1String(imageBytesKey), qlonglong(imageCacheBytes));
    settings.setValue(QLatin1String(maxTextureSizeKey), maxTextureSize);
    settings.endGroup();

    settings.beginGroup(QLatin1String(windowGroup));
    settings.setValue(QLatin1String(geometryKey), windowGeometry);
    settings.endGroup();

    settings.beginGroup(QLatin1String(viewGroup));
    settings.setValue(QLatin1String(backgroundKey), background.name());
    settings.setValue(QLatin1String(smoothScalingKey), smoothScaling);
    settings.endGroup();

    settings.beginGroup(QLatin1String(keysGroup));
    for (auto it = keyBindings.constBegin(); it != keyBindings.constEnd(); ++it) {
        settings.setValue(it.key(), it.value());
    }
    settings.endGroup();

    settings.beginGroup(QLatin1String(logGroup));
    settings.setValue(QLatin1String(logFileKey), logFile);
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        qCWarning(lcSettings) << "failed to write settings to" << settings.fileName();
    }
}

CacheLimits BrowserSettings::cacheLimits() const
{
    CacheLimits limits;
    limits.workerThreads = workerThreads;
    limits.bitmapCapacity = bitmapCacheBytes;
    limits.imageCapacity = imageCacheBytes;
    return limits;
}

Qt::CaseSensitivity BrowserSettings::extensionCase() const
{
    return extensionCaseSensitive ? Qt::CaseSensitive : Qt::CaseInsensitive;
}

QVariantMap BrowserSettings::keyBindingMap() const
{
    QVariantMap map;
    for (auto it = keyBindings.constBegin(); it != keyBindings.constEnd(); ++it) {
        map.insert(it.key(), it.value());
    }
    return map;
}

QString BrowserSettings::sortKeyName(PathCollection::SortKey key)
{
    switch (key) {
    case PathCollection::SortKey::Modified:
        return QStringLiteral("modified");
    case PathCollection::SortKey::Size:
        return QStringLiteral("size");
    case PathCollection::SortKey::Name:
    default:
        return QStringLiteral("name");
    }
}

bool BrowserSettings::parseSortKey(const QString &name, PathCollection::SortKey *key)
{
    const QString normalized = name.trimmed().toLower();
    PathCollection::SortKey parsed = PathCollection::SortKey::Name;
    if (normalized == QLatin1String("name")) {
        parsed = PathCollection::SortKey::Name;
    } else if (normalized == QLatin1String("modified")) {
        parsed = PathCollection::SortKey::Modified;
    } else if (normalized == QLatin1String("size")) {
        parsed = PathCollection::SortKey::Size;
    } else {
        return false;
    }
    if (key) {
        *key = parsed;
    }
    return true;
}

QString BrowserSettings::sortOrderName(Qt::SortOrder order)
{
    return order == Qt::DescendingOrder ? QStringLiteral("descending") : QStringLiteral("ascending");
}

bool BrowserSettings::parseSortOrder(const QString &name, Qt::SortOrder *order)
{
    const QString normalized = name.trimmed().toLower();
    Qt::SortOrder parsed = Qt::AscendingOrder;
    if (normalized == QLatin1String("ascending")) {
        parsed = Qt::AscendingOrder;
    } else if (normalized == QLatin1String("descending")) {
        parsed = Qt::DescendingOrder;
    } else {
        return false;
    }
    if (order) {
        *order = parsed;
    }
    return true;
}

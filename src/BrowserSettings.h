#pragma once

#include <QColor>
#include <QHash>
#include <QRect>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include "ImageCacheManager.h"
#include "PathCollection.h"

class QSettings;

struct BrowserSettings {
    QStringList extensions;
    bool extensionCaseSensitive = false;
    int lookahead = 5;
    PathCollection::SortKey sortKey = PathCollection::SortKey::Name;
    Qt::SortOrder sortOrder = Qt::AscendingOrder;
    int workerThreads = 1;
    qsizetype bitmapCacheBytes = 0;
    qsizetype imageCacheBytes = 0;
    int maxTextureSize = 0;
    QRect windowGeometry;
    QColor background;
    bool smoothScaling = true;
    QHash<QString, QStringList> keyBindings;
    QString logFile;

    static BrowserSettings defaults();
    static BrowserSettings load(QSettings &settings);
    void save(QSettings &settings) const;

    CacheLimits cacheLimits() const;
    Qt::CaseSensitivity extensionCase() const;
    QVariantMap keyBindingMap() const;

    static QString sortKeyName(PathCollection::SortKey key);
    static bool parseSortKey(const QString &name, PathCollection::SortKey *key);
    static QString sortOrderName(Qt::SortOrder order);
    static bool parseSortOrder(const QString &name, Qt::SortOrder *order);
};

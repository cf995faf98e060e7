#pragma once

#include <QColor>
#include <QObject>
#include <QRect>
#include <QSharedPointer>
#include <QStringList>
#include <QVariantMap>

#include "BrowserSettings.h"
#include "PathCollection.h"

class BitmapDevice;
class ImageCacheManager;

class ImageBrowser : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString currentPath READ currentPath NOTIFY currentChanged)
    Q_PROPERTY(int currentIndex READ currentIndex NOTIFY currentChanged)
    Q_PROPERTY(int count READ count NOTIFY collectionChanged)
    Q_PROPERTY(QString directory READ directory NOTIFY collectionChanged)
    Q_PROPERTY(QString title READ title NOTIFY currentChanged)
    Q_PROPERTY(QString sortKey READ sortKey NOTIFY orderChanged)
    Q_PROPERTY(QString sortOrder READ sortOrder NOTIFY orderChanged)
    Q_PROPERTY(int revision READ revision NOTIFY revisionChanged)
    Q_PROPERTY(QString imageSource READ imageSource NOTIFY revisionChanged)
    Q_PROPERTY(QString currentError READ currentError NOTIFY revisionChanged)
    Q_PROPERTY(QString memoryText READ memoryText NOTIFY cacheChanged)
    Q_PROPERTY(bool showMemory READ showMemory WRITE setShowMemory NOTIFY showMemoryChanged)
    Q_PROPERTY(QColor background READ background CONSTANT)
    Q_PROPERTY(bool smoothScaling READ smoothScaling CONSTANT)
    Q_PROPERTY(QVariantMap keyBindings READ keyBindings CONSTANT)
    Q_PROPERTY(QStringList nameFilters READ nameFilters CONSTANT)
    Q_PROPERTY(QRect windowGeometry READ windowGeometry NOTIFY windowGeometryChanged)

public:
    ImageBrowser(ImageCacheManager *cache,
                 QSharedPointer<BitmapDevice> device,
                 const BrowserSettings &settings,
                 QObject *parent = nullptr);

    QString currentPath() const;
    int currentIndex() const;
    int count() const;
    QString directory() const;
    QString title() const;
    QString sortKey() const;
    QString sortOrder() const;
    int revision() const;
    QString imageSource() const;
    QString currentError() const;
    QString memoryText() const;

    bool showMemory() const;
    void setShowMemory(bool show);

    QColor background() const;
    bool smoothScaling() const;
    QVariantMap keyBindings() const;
    QStringList nameFilters() const;
    QRect windowGeometry() const;

    const PathCollection &collection() const;
    BrowserSettings settings() const;

    static QString imageId(int revision, const QString &path);
    static QString pathFromImageId(const QString &id);

    Q_INVOKABLE bool open(const QString &pathOrUrl);
    Q_INVOKABLE QStringList next();
    Q_INVOKABLE QStringList prev();
    Q_INVOKABLE bool reorder(const QString &sortKey, const QString &sortOrder);
    void reorder(PathCollection::SortKey sortKey, Qt::SortOrder sortOrder);
    Q_INVOKABLE void toggleMemory();
    Q_INVOKABLE void setWindowGeometry(int x, int y, int width, int height);

signals:
    void currentChanged();
    void collectionChanged();
    void orderChanged();
    void revisionChanged();
    void cacheChanged();
    void showMemoryChanged();
    void windowGeometryChanged();
    void openFailed(const QString &path);

private:
    void onImageLoaded(const QString &path);
    void warm(const QStringList &paths);

    ImageCacheManager *m_cache = nullptr;
    QSharedPointer<BitmapDevice> m_device;
    BrowserSettings m_settings;
    PathCollection m_collection;
    int m_revision = 0;
    bool m_showMemory = false;
};

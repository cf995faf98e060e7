#pragma once

#include <QQuickImageProvider>

class ImageCacheManager;

// Serves resident bitmaps to QML for ids built by ImageBrowser::imageId().
class BitmapImageProvider : public QQuickImageProvider
{
public:
    explicit BitmapImageProvider(ImageCacheManager *cache);

    QImage requestImage(const QString &id, QSize *size, const QSize &requestedSize) override;


private:
    ImageCacheManager *m_cache = nullptr;
};

#pragma once

#include <QFuture>
#include <QObject>
#include <QSharedPointer>
#include <QString>
#include <QThreadPool>

#include "ImageTypes.h"
#include "LoadPipeline.h"

class BitmapDevice;
class ImageDecoder;

struct CacheLimits {
    int workerThreads = 0;          // <= 0 selects defaultWorkerThreads()
    qsizetype bitmapCapacity = 512 * 1024 * 1024;
    qsizetype imageCapacity = 1024 * 1024 * 1024;
};

struct BitmapLookup {
    enum class State {
        Missing,
        Ready,
        Failed
    };

    State state = State::Missing;
    GpuBitmap bitmap;
    LoadError error;

    bool isReady() const { return state == State::Ready; }
    bool isFailed() const { return state == State::Failed; }
};

class ImageCacheManager : public QObject
{
    Q_OBJECT

public:
    explicit ImageCacheManager(const CacheLimits &limits,
                               QSharedPointer<ImageDecoder> decoder = QSharedPointer<ImageDecoder>(),
                               QObject *parent = nullptr);
    ~ImageCacheManager() override;

    static int defaultWorkerThreads(int lookahead);

    QFuture<void> load(const QString &path,
                       const QSharedPointer<BitmapDevice> &device,
                       LoadCallback onComplete = LoadCallback());
    BitmapLookup get(const QString &path) const;
    bool isLoading(const QString &path) const;
    void clear();

    qsizetype bitmapCacheSize() const;
    qsizetype imageCacheSize() const;
    qsizetype bitmapCacheCapacity() const;
    qsizetype imageCacheCapacity() const;
    qsizetype errorCount() const;
    int workerThreadCount() const;

    bool waitForIdle(int msecs = -1);

signals:
    void imageLoaded(const QString &path);

private:
    QSharedPointer<CacheState> m_state;
    QSharedPointer<LoadPipeline> m_pipeline;
    QThreadPool m_pool;
};

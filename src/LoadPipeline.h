#pragma once

#include <QFuture>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QSharedPointer>
#include <QString>

#include <functional>

#include "BoundedCache.h"
#include "ErrorLedger.h"
#include "FileIdentity.h"
#include "ImageTypes.h"

class BitmapDevice;
class ImageDecoder;

using LoadCallback = std::function<void(const QString &path)>;

struct PendingCallback {
    QString path;
    LoadCallback callback;
};

struct InFlightLoad {
    quint64 generation = 0;
    QList<PendingCallback> callbacks;
    QFuture<void> future;
};

/**
 * @brief Cache tiers, error ledger and in-flight set shared with worker tasks.
 *
 * `mutex` guards every member. It is never held while decoding or uploading.
 */
struct CacheState {
    CacheState(qsizetype bitmapCapacity, qsizetype imageCapacity);

    mutable QMutex mutex;
    BoundedCache<GpuBitmap> bitmaps;
    BoundedCache<RawImage> images;
    ErrorLedger errors;
    QHash<FileIdentity, InFlightLoad> inFlight;
    quint64 generation = 0;
};

class LoadPipeline
{
public:
    enum class Outcome {
        AlreadyCached,
        Cached,
        Failed,
        Discarded
    };

    using Starter = std::function<QFuture<void>()>;

    LoadPipeline(QSharedPointer<CacheState> state,
                 QSharedPointer<ImageDecoder> decoder,
                 LoadCallback onFinished = LoadCallback());

    QFuture<void> submit(const FileIdentity &id,
                         const QString &requestedPath,
                         const LoadCallback &onComplete,
                         const Starter &start);
    Outcome run(const FileIdentity &id, const QSharedPointer<BitmapDevice> &device);

private:
    bool isCurrent(const FileIdentity &id) const;
    Outcome fail(const FileIdentity &id, const LoadError &error);
    void finish(const FileIdentity &id);
    DecodeResult decode(const FileIdentity &id);
    UploadResult upload(BitmapDevice &device, const FileIdentity &id, const RawImage &image);

    QSharedPointer<CacheState> m_state;
    QSharedPointer<ImageDecoder> m_decoder;
    LoadCallback m_onFinished;
};

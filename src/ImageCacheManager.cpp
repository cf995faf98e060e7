
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

#include "ImageCacheManager.h"

#include <QThread>
#include <QtConcurrent>
#include <algorithm>

#include "BitmapDevice.h"
#include "ImageDecoder.h"
#include "Logging.h"

/**
 * @brief Creates the cache facade and its worker pool.
 * @param limits Worker count and capacities of both cache tiers.
 * @param decoder Codec used by workers. Defaults to ImageReaderDecoder.
 * @param parent Parent QObject for ownership.
 */
ImageCacheManager::ImageCacheManager(const CacheLimits &limits,
                                     QSharedPointer<ImageDecoder> decoder,
                                     QObject *parent)
    : QObject(parent)
    , m_state(QSharedPointer<CacheState>::create(limits.bitmapCapacity, limits.imageCapacity))
{
    if (!decoder) {
        decoder = QSharedPointer<ImageReaderDecoder>::create();
    }
    m_pipeline = QSharedPointer<LoadPipeline>::create(m_state, decoder, [this](const QString &path) {
        emit imageLoaded(path);
    });

    const int threads = limits.workerThreads > 0 ? limits.workerThreads : defaultWorkerThreads(0);
    m_pool.setMaxThreadCount(threads);
    qCInfo(lcCache) << "image cache ready:" << threads << "workers, bitmap capacity"
                    << limits.bitmapCapacity << "bytes, image capacity" << limits.imageCapacity << "bytes";
}

ImageCacheManager::~ImageCacheManager()
{
    // Workers emit imageLoaded() through this object.
    m_pool.waitForDone();
}

/**
 * @brief Returns the worker count used when none is configured.
 * @param lookahead Prefetch window size; 0 or less leaves the count unclamped.
 * @return Half the hardware threads, at least one and at most the lookahead.
 */
int ImageCacheManager::defaultWorkerThreads(int lookahead)
{
    int threads = std::max(1, QThread::idealThreadCount() / 2);
    if (lookahead > 0) {
        threads = std::min(threads, lookahead);
    }
    return threads;
}

/**
 * @brief Schedules the bitmap of a file to become resident.
 *
 * Never blocks on decoding. A request for a file that is already loading
 * joins the running pipeline: no second decode starts, and every requester's
 * callback runs once when that pipeline ends, on a worker thread.
 *
 * @param path File to load.
 * @param device Device used to create the bitmap.
 * @param onComplete Called with @p path when the load ends, whatever the outcome.
 * @return Future of the pipeline serving this request.
 */
QFuture<void> ImageCacheManager::load(const QString &path,
                                      const QSharedPointer<BitmapDevice> &device,
                                      LoadCallback onComplete)
{
    const FileIdentity id = FileIdentity::fromPath(path);
    if (!id.isValid()) {
        qCWarning(lcCache) << "ignoring load request without a path";
        if (onComplete) {
            onComplete(path);
        }
        return QFuture<void>();
    }

    const QSharedPointer<LoadPipeline> pipeline = m_pipeline;
    QThreadPool *pool = &m_pool;
    return pipeline->submit(id, path, onComplete, [pipeline, pool, id, device]() {
        return QtConcurrent::run(pool, [pipeline, id, device]() {
            pipeline->run(id, device);
        });
    });
}

/**
 * @brief Looks up the resident bitmap of a file without blocking on I/O.
 * @param path File to look up.
 * @return Failed with the sticky error, Ready with the bitmap, or Missing.
 */
BitmapLookup ImageCacheManager::get(const QString &path) const
{
    BitmapLookup lookup;
    const FileIdentity id = FileIdentity::fromPath(path);
    if (!id.isValid()) {
        return lookup;
    }

    QMutexLocker locker(&m_state->mutex);
    if (const LoadError *error = m_state->errors.find(id)) {
        lookup.state = BitmapLookup::State::Failed;
        lookup.error = *error;
        return lookup;
    }
    if (const GpuBitmap *bitmap = m_state->bitmaps.find(id)) {
        lookup.state = BitmapLookup::State::Ready;
        lookup.bitmap = *bitmap;
    }
    return lookup;
}

bool ImageCacheManager::isLoading(const QString &path) const
{
    const FileIdentity id = FileIdentity::fromPath(path);
    QMutexLocker locker(&m_state->mutex);
    return m_state->inFlight.contains(id);
}

/**
 * @brief Empties both cache tiers and the error ledger.
 *
 * Loads still running finish and notify their requesters, but their results
 * are dropped unless a new request joined them after this call.
 */
void ImageCacheManager::clear()
{
    QMutexLocker locker(&m_state->mutex);
    m_state->bitmaps.clear();
    m_state->images.clear();
    m_state->errors.clear();
    m_state->generation += 1;
    qCDebug(lcCache) << "cache cleared, generation" << m_state->generation
                     << "with" << m_state->inFlight.size() << "loads in flight";
}

qsizetype ImageCacheManager::bitmapCacheSize() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->bitmaps.size();
}

qsizetype ImageCacheManager::imageCacheSize() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->images.size();
}

qsizetype ImageCacheManager::bitmapCacheCapacity() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->bitmaps.capacity();
}

qsizetype ImageCacheManager::imageCacheCapacity() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->images.capacity();
}

qsizetype ImageCacheManager::errorCount() const
{
    QMutexLocker locker(&m_state->mutex);
    return m_state->errors.count();
}

int ImageCacheManager::workerThreadCount() const
{
    return m_pool.maxThreadCount();
}

bool ImageCacheManager::waitForIdle(int msecs)
{
    return m_pool.waitForDone(msecs);
}

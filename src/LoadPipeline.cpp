
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

#include "LoadPipeline.h"

#include <QElapsedTimer>

#include <utility>

#include "BitmapDevice.h"
#include "ImageDecoder.h"
#include "Logging.h"

CacheState::CacheState(qsizetype bitmapCapacity, qsizetype imageCapacity)
    : bitmaps(bitmapCapacity)
    , images(imageCapacity)
{
}

LoadPipeline::LoadPipeline(QSharedPointer<CacheState> state,
                           QSharedPointer<ImageDecoder> decoder,
                           LoadCallback onFinished)
    : m_state(std::move(state))
    , m_decoder(std::move(decoder))
    , m_onFinished(std::move(onFinished))
{
}

/**
 * @brief Admits a load request, starting a pipeline only if none is in flight.
 * @param id Identity of the file to load.
 * @param requestedPath Path as given by the caller, passed back to its callback.
 * @param onComplete Callback run once when the pipeline for this identity ends.
 * @param start Schedules run() and returns its future. Called with the state locked.
 * @return Future of the pipeline serving this request.
 */
QFuture<void> LoadPipeline::submit(const FileIdentity &id,
                                   const QString &requestedPath,
                                   const LoadCallback &onComplete,
                                   const Starter &start)
{
    QMutexLocker locker(&m_state->mutex);
    const auto existing = m_state->inFlight.find(id);
    if (existing != m_state->inFlight.end()) {
        existing->callbacks.append(PendingCallback{requestedPath, onComplete});
        if (existing->generation != m_state->generation) {
            // Joined after clear(): the running pipeline now commits for this request.
            existing->generation = m_state->generation;
        }
        qCDebug(lcCache) << "joined in-flight load" << id.path();
        return existing->future;
    }

    InFlightLoad load;
    load.generation = m_state->generation;
    load.callbacks.append(PendingCallback{requestedPath, onComplete});
    const auto inserted = m_state->inFlight.insert(id, load);
    inserted->future = start();
    return inserted->future;
}

/**
 * @brief Makes the bitmap of one file resident, decoding and uploading as needed.
 * @param id Identity of the file, registered by submit().
 * @param device Device that turns decoded pixels into a bitmap.
 * @return What the pipeline did. Callbacks have run when this returns.
 */
LoadPipeline::Outcome LoadPipeline::run(const FileIdentity &id, const QSharedPointer<BitmapDevice> &device)
{
    RawImage image;
    {
        QMutexLocker locker(&m_state->mutex);
        if (m_state->bitmaps.contains(id)) {
            locker.unlock();
            finish(id);
            return Outcome::AlreadyCached;
        }
        if (const RawImage *cached = m_state->images.find(id)) {
            image = *cached;
        }
    }

    if (image.isNull()) {
        const DecodeResult decoded = decode(id);
        if (!decoded.ok) {
            return fail(id, decoded.error);
        }
        image = decoded.image;
        QMutexLocker locker(&m_state->mutex);
        if (isCurrent(id)) {
            m_state->images.push(id, image);
        }
    }

    if (!device) {
        return fail(id, LoadError::other(QStringLiteral("No bitmap device")));
    }
    const UploadResult uploaded = upload(*device, id, image);
    if (!uploaded.ok) {
        return fail(id, uploaded.error);
    }

    bool committed = false;
    {
        QMutexLocker locker(&m_state->mutex);
        if (isCurrent(id)) {
            m_state->bitmaps.push(id, uploaded.bitmap);
            m_state->errors.remove(id);
            committed = true;
        }
    }
    finish(id);
    return committed ? Outcome::Cached : Outcome::Discarded;
}

// Caller holds the state mutex.
bool LoadPipeline::isCurrent(const FileIdentity &id) const
{
    const auto it = m_state->inFlight.constFind(id);
    return it != m_state->inFlight.constEnd() && it->generation == m_state->generation;
}

LoadPipeline::Outcome LoadPipeline::fail(const FileIdentity &id, const LoadError &error)
{
    qCWarning(lcCache).noquote() << "load failed:" << id.path() << "-" << error.toString();
    bool committed = false;
    {
        QMutexLocker locker(&m_state->mutex);
        if (isCurrent(id)) {
            m_state->errors.record(id, error);
            committed = true;
        }
    }
    finish(id);
    return committed ? Outcome::Failed : Outcome::Discarded;
}

/**
 * @brief Releases the in-flight record and notifies every requester.
 * @param id Identity whose pipeline ended.
 */
void LoadPipeline::finish(const FileIdentity &id)
{
    QList<PendingCallback> callbacks;
    {
        QMutexLocker locker(&m_state->mutex);
        callbacks = m_state->inFlight.take(id).callbacks;
    }
    for (const PendingCallback &pending : callbacks) {
        if (pending.callback) {
            pending.callback(pending.path);
        }
    }
    if (m_onFinished) {
        m_onFinished(id.path());
    }
}

DecodeResult LoadPipeline::decode(const FileIdentity &id)
{
    DecodeResult result;
    if (!m_decoder) {
        result.error = LoadError::other(QStringLiteral("No image decoder"));
        return result;
    }
    QElapsedTimer timer;
    timer.start();
    result = m_decoder->decode(id.path());
    if (result.ok) {
        qCDebug(lcCache) << "decoded" << id.path() << result.image.size() << "in" << timer.elapsed() << "ms";
    }
    return result;
}

UploadResult LoadPipeline::upload(BitmapDevice &device, const FileIdentity &id, const RawImage &image)
{
    QElapsedTimer timer;
    timer.start();
    const UploadResult result = device.upload(image);
    if (result.ok) {
        qCDebug(lcCache) << "uploaded" << id.path() << "in" << timer.elapsed() << "ms";
    }
    return result;
}

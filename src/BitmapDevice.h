#pragma once

#include <QAtomicInteger>

#include "ImageTypes.h"

class BitmapDevice
{
public:
    virtual ~BitmapDevice() = default;

    // Called from worker threads; implementations must be thread-safe.
    // Failures are returned in UploadResult::error, never thrown.
    virtual UploadResult upload(const RawImage &image) = 0;
};

/**
 * @brief Prepares decoded pixels for texture upload without touching a GPU.
 *
 * Produces premultiplied RGBA bitmaps and rejects images the target texture
 * size cannot hold. The scene graph performs the actual upload when the view
 * draws the bitmap.
 */
class RasterBitmapDevice : public BitmapDevice
{
public:
    static constexpr int defaultMaxTextureSize = 16384;

    explicit RasterBitmapDevice(int maxTextureSize = defaultMaxTextureSize);

    UploadResult upload(const RawImage &image) override;

    int maxTextureSize() const { return m_maxTextureSize; }

private:
    int m_maxTextureSize;
    QAtomicInteger<quint64> m_nextHandle{1};
};

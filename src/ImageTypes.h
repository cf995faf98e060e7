#pragma once

#include <QImage>
#include <QSize>
#include <QtGlobal>

#include "LoadError.h"

// Decoded pixels in QImage::Format_RGBA8888.
struct RawImage {
    QImage pixels;

    bool isNull() const { return pixels.isNull(); }
    QSize size() const { return pixels.size(); }
    qsizetype byteSize() const { return pixels.sizeInBytes(); }
};

// Device-ready bitmap produced by a BitmapDevice from a RawImage.
struct GpuBitmap {
    QImage pixels;
    quint64 handle = 0;

    bool isNull() const { return handle == 0 || pixels.isNull(); }
    QSize size() const { return pixels.size(); }
    qsizetype byteSize() const
    {
        return static_cast<qsizetype>(pixels.width()) * pixels.height() * 4;
    }
};

struct DecodeResult {
    bool ok = false;
    RawImage image;
    LoadError error;
};

struct UploadResult {
    bool ok = false;
    GpuBitmap bitmap;
    LoadError error;
};

#pragma once

#include <QString>

#include "ImageTypes.h"

class ImageDecoder
{
public:
    virtual ~ImageDecoder() = default;

    // Called from worker threads; implementations must be reentrant.
    // Failures are returned in DecodeResult::error, never thrown.
    virtual DecodeResult decode(const QString &path) = 0;
};

class ImageReaderDecoder : public ImageDecoder
{
public:
    DecodeResult decode(const QString &path) override;
};

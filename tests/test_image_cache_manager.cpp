
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

#include "TestSupport.h"

#include <QSharedPointer>
#include <QThread>

#include "ImageCacheManager.h"

using TestSupport::FakeDecoder;
using TestSupport::FakeDevice;

namespace {

constexpr qsizetype fakeImageBytes = FakeDecoder::imageSide * FakeDecoder::imageSide * 4;

struct CacheFixture {
    explicit CacheFixture(CacheLimits limits = defaultLimits())
        : decoder(QSharedPointer<FakeDecoder>::create())
        , device(QSharedPointer<FakeDevice>::create())
        , cache(limits, decoder)
    {
    }

    static CacheLimits defaultLimits()
    {
        CacheLimits limits;
        limits.workerThreads = 2;
        limits.bitmapCapacity = fakeImageBytes * 8;
        limits.imageCapacity = fakeImageBytes * 8;
        return limits;
    }

    void loadAndWait(const QString &path)
    {
        QFuture<void> future = cache.load(path, device);
        future.waitForFinished();
    }

    QSharedPointer<FakeDecoder> decoder;
    QSharedPointer<FakeDevice> device;
    ImageCacheManager cache;
};

const QString pathA = QStringLiteral("/glance-tests/a.png");
const QString pathB = QStringLiteral("/glance-tests/b.png");
const QString pathC = QStringLiteral("/glance-tests/c.png");

} // namespace

TEST_CASE("A loaded file becomes ready", "[facade]")
{
    CacheFixture fixture;
    CHECK(fixture.cache.get(pathA).state == BitmapLookup::State::Missing);

    QAtomicInt calls;
    QString reported;
    QFuture<void> future = fixture.cache.load(pathA, fixture.device, [&](const QString &path) {
        reported = path;
        calls.fetchAndAddRelaxed(1);
    });
    future.waitForFinished();

    const BitmapLookup lookup = fixture.cache.get(pathA);
    REQUIRE(lookup.isReady());
    CHECK(lookup.bitmap.size() == QSize(4, 4));
    CHECK(calls.loadRelaxed() == 1);
    CHECK(reported == pathA);
    CHECK(fixture.cache.bitmapCacheSize() == fakeImageBytes);
    CHECK(fixture.cache.imageCacheSize() == fakeImageBytes);
    CHECK_FALSE(fixture.cache.isLoading(pathA));
}

TEST_CASE("Lookups use the normalized path", "[facade]")
{
    CacheFixture fixture;
    fixture.loadAndWait(QStringLiteral("/glance-tests/sub/../a.png"));

    CHECK(fixture.cache.get(pathA).isReady());
}

TEST_CASE("A bitmap hit skips decode and upload", "[facade]")
{
    CacheFixture fixture;
    fixture.loadAndWait(pathA);
    fixture.loadAndWait(pathA);

    CHECK(fixture.decoder->calls() == 1);
    CHECK(fixture.device->calls() == 1);
}

TEST_CASE("A pixel hit skips decode only", "[facade]")
{
    CacheFixture fixture;
    fixture.device->setFailing(true);
    fixture.loadAndWait(pathA);

    const BitmapLookup failed = fixture.cache.get(pathA);
    REQUIRE(failed.isFailed());
    CHECK(failed.error.kind == LoadError::Kind::UploadFailed);
    CHECK(fixture.cache.imageCacheSize() == fakeImageBytes);
    CHECK(fixture.cache.bitmapCacheSize() == 0);

    fixture.device->setFailing(false);
    fixture.loadAndWait(pathA);

    CHECK(fixture.cache.get(pathA).isReady());
    CHECK(fixture.decoder->calls() == 1);
    CHECK(fixture.device->calls() == 2);
    CHECK(fixture.cache.errorCount() == 0);
}

TEST_CASE("Errors are sticky until a successful load", "[facade]")
{
    CacheFixture fixture;
    fixture.decoder->failWith(pathA, LoadError::unsupported(pathA));
    fixture.loadAndWait(pathA);

    BitmapLookup lookup = fixture.cache.get(pathA);
    REQUIRE(lookup.isFailed());
    CHECK(lookup.error.kind == LoadError::Kind::Unsupported);

    lookup = fixture.cache.get(pathA);
    CHECK(lookup.isFailed());
    CHECK(fixture.decoder->calls() == 1);

    fixture.decoder->succeed(pathA);
    fixture.loadAndWait(pathA);

    CHECK(fixture.cache.get(pathA).isReady());
    CHECK(fixture.cache.errorCount() == 0);
    CHECK(fixture.decoder->calls() == 2);
}

TEST_CASE("Concurrent loads of one file share a pipeline", "[facade]")
{
    CacheFixture fixture;
    QAtomicInt callbacks;
    auto count = [&](const QString &) { callbacks.fetchAndAddRelaxed(1); };

    fixture.decoder->hold();
    QFuture<void> first = fixture.cache.load(pathA, fixture.device, count);
    REQUIRE(fixture.decoder->waitForEntry());
    QFuture<void> second = fixture.cache.load(pathA, fixture.device, count);
    CHECK(fixture.cache.isLoading(pathA));
    fixture.decoder->release();

    first.waitForFinished();
    second.waitForFinished();

    CHECK(fixture.decoder->calls() == 1);
    CHECK(fixture.device->calls() == 1);
    CHECK(callbacks.loadRelaxed() == 2);
    CHECK(fixture.cache.get(pathA).isReady());
}

TEST_CASE("The bitmap tier evicts the oldest file", "[facade]")
{
    CacheLimits limits = CacheFixture::defaultLimits();
    limits.bitmapCapacity = fakeImageBytes * 2;
    CacheFixture fixture(limits);

    fixture.loadAndWait(pathA);
    fixture.loadAndWait(pathB);
    fixture.loadAndWait(pathC);

    CHECK(fixture.cache.bitmapCacheSize() == fakeImageBytes * 2);
    CHECK(fixture.cache.get(pathA).state == BitmapLookup::State::Missing);
    CHECK(fixture.cache.get(pathB).isReady());
    CHECK(fixture.cache.get(pathC).isReady());

    SECTION("reloading an evicted file reuses its pixels")
    {
        fixture.loadAndWait(pathA);
        CHECK(fixture.cache.get(pathA).isReady());
        CHECK(fixture.decoder->calls() == 3);
    }
}

TEST_CASE("clear empties both tiers and the ledger", "[facade]")
{
    CacheFixture fixture;
    fixture.decoder->failWith(pathB, LoadError::notFound(pathB));
    fixture.loadAndWait(pathA);
    fixture.loadAndWait(pathB);
    REQUIRE(fixture.cache.errorCount() == 1);

    fixture.cache.clear();

    CHECK(fixture.cache.bitmapCacheSize() == 0);
    CHECK(fixture.cache.imageCacheSize() == 0);
    CHECK(fixture.cache.errorCount() == 0);
    CHECK(fixture.cache.get(pathA).state == BitmapLookup::State::Missing);
    CHECK(fixture.cache.get(pathB).state == BitmapLookup::State::Missing);
}

TEST_CASE("clear discards loads already in flight", "[facade]")
{
    CacheFixture fixture;
    QAtomicInt callbacks;

    fixture.decoder->hold();
    QFuture<void> future = fixture.cache.load(pathA, fixture.device, [&](const QString &) {
        callbacks.fetchAndAddRelaxed(1);
    });
    REQUIRE(fixture.decoder->waitForEntry());

    SECTION("without a new request")
    {
        fixture.cache.clear();
        fixture.decoder->release();
        future.waitForFinished();

        CHECK(callbacks.loadRelaxed() == 1);
        CHECK(fixture.cache.get(pathA).state == BitmapLookup::State::Missing);
        CHECK(fixture.cache.bitmapCacheSize() == 0);
        CHECK(fixture.cache.imageCacheSize() == 0);
    }

    SECTION("with a request joining after clear")
    {
        fixture.cache.clear();
        QFuture<void> joined = fixture.cache.load(pathA, fixture.device, [&](const QString &) {
            callbacks.fetchAndAddRelaxed(1);
        });
        fixture.decoder->release();
        future.waitForFinished();
        joined.waitForFinished();

        CHECK(callbacks.loadRelaxed() == 2);
        CHECK(fixture.decoder->calls() == 1);
        CHECK(fixture.cache.get(pathA).isReady());
    }
}

TEST_CASE("A load without a path reports completion at once", "[facade]")
{
    CacheFixture fixture;
    bool called = false;
    fixture.cache.load(QString(), fixture.device, [&](const QString &) { called = true; });

    CHECK(called);
    CHECK(fixture.decoder->calls() == 0);
}

TEST_CASE("A load without a device fails", "[facade]")
{
    CacheFixture fixture;
    fixture.cache.load(pathA, QSharedPointer<BitmapDevice>()).waitForFinished();

    const BitmapLookup lookup = fixture.cache.get(pathA);
    REQUIRE(lookup.isFailed());
    CHECK(lookup.error.kind == LoadError::Kind::Other);
}

TEST_CASE("Worker count defaults follow the hardware and lookahead", "[facade]")
{
    CHECK(ImageCacheManager::defaultWorkerThreads(1) == 1);
    CHECK(ImageCacheManager::defaultWorkerThreads(0) >= 1);
    CHECK(ImageCacheManager::defaultWorkerThreads(64) <= qMax(1, QThread::idealThreadCount() / 2));

    CacheFixture fixture;
    CHECK(fixture.cache.workerThreadCount() == 2);
    CHECK(fixture.cache.bitmapCacheCapacity() == fakeImageBytes * 8);
    CHECK(fixture.cache.imageCacheCapacity() == fakeImageBytes * 8);
}

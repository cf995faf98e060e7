
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

#include <QCoreApplication>
#include <QTemporaryDir>
#include <QUrl>

#include <limits>

#include "BrowserSettings.h"
#include "ImageBrowser.h"
#include "ImageCacheManager.h"

namespace {

struct BrowserFixture {
    explicit BrowserFixture(int lookahead = 1)
        : cache(limits())
        , device(QSharedPointer<RasterBitmapDevice>::create())
        , browser(&cache, device, settings(lookahead))
    {
        REQUIRE(temp.isValid());
        dir = QDir(temp.path());
        for (const QString &name : {QStringLiteral("a.png"), QStringLiteral("b.png"), QStringLiteral("c.png")}) {
            REQUIRE(TestSupport::writeImage(dir, name));
        }
        REQUIRE(TestSupport::writeBytes(dir.filePath(QStringLiteral("readme.txt")), QByteArray("x")));
    }

    static CacheLimits limits()
    {
        CacheLimits limits;
        limits.workerThreads = 2;
        return limits;
    }

    static BrowserSettings settings(int lookahead = 1)
    {
        BrowserSettings settings = BrowserSettings::defaults();
        settings.lookahead = lookahead;
        return settings;
    }

    QString file(const char *name) const { return dir.filePath(QLatin1String(name)); }

    QTemporaryDir temp;
    QDir dir;
    ImageCacheManager cache;
    QSharedPointer<BitmapDevice> device;
    ImageBrowser browser;
};

} // namespace

TEST_CASE("Opening a folder warms the start of the collection", "[browser]")
{
    BrowserFixture fixture;
    int collectionChanges = 0;
    QObject::connect(&fixture.browser, &ImageBrowser::collectionChanged, [&]() { ++collectionChanges; });

    REQUIRE(fixture.browser.open(fixture.dir.path()));
    REQUIRE(fixture.cache.waitForIdle(10000));

    CHECK(collectionChanges == 1);
    CHECK(fixture.browser.count() == 3);
    CHECK(fixture.browser.currentIndex() == 0);
    CHECK(fixture.browser.currentPath() == fixture.file("a.png"));
    CHECK(fixture.cache.get(fixture.file("a.png")).isReady());
    CHECK(fixture.cache.get(fixture.file("b.png")).isReady());
    CHECK(fixture.cache.get(fixture.file("c.png")).state == BitmapLookup::State::Missing);
    CHECK(fixture.browser.title().startsWith(QStringLiteral("glance 1/3 ")));
    CHECK(fixture.browser.currentError().isEmpty());
}

TEST_CASE("Opening with the largest lookahead warms the whole folder", "[browser]")
{
    BrowserFixture fixture(std::numeric_limits<int>::max());

    REQUIRE(fixture.browser.open(fixture.file("b.png")));
    REQUIRE(fixture.cache.waitForIdle(10000));

    CHECK(fixture.cache.get(fixture.file("a.png")).state == BitmapLookup::State::Missing);
    CHECK(fixture.cache.get(fixture.file("b.png")).isReady());
    CHECK(fixture.cache.get(fixture.file("c.png")).isReady());
}

TEST_CASE("Only loads of the current file refresh the image", "[browser]")
{
    BrowserFixture fixture;
    int cacheChanges = 0;
    QObject::connect(&fixture.browser, &ImageBrowser::cacheChanged, [&]() { ++cacheChanges; });

    REQUIRE(fixture.browser.open(fixture.dir.path()));
    REQUIRE(fixture.cache.waitForIdle(10000));
    cacheChanges = 0;
    QCoreApplication::processEvents();

    CHECK(fixture.browser.revision() == 1);
    CHECK(cacheChanges == 2);

    const QString shown = fixture.browser.imageSource();
    emit fixture.cache.imageLoaded(fixture.file("b.png"));
    CHECK(fixture.browser.revision() == 1);
    CHECK(fixture.browser.imageSource() == shown);
    CHECK(cacheChanges == 3);

    emit fixture.cache.imageLoaded(fixture.dir.path() + QStringLiteral("/./a.png"));
    CHECK(fixture.browser.revision() == 2);
    CHECK(fixture.browser.imageSource() != shown);
}

TEST_CASE("Opening a file positions the cursor on it", "[browser]")
{
    BrowserFixture fixture;

    SECTION("plain path")
    {
        REQUIRE(fixture.browser.open(fixture.file("b.png")));
    }

    SECTION("file URL")
    {
        REQUIRE(fixture.browser.open(QUrl::fromLocalFile(fixture.file("b.png")).toString()));
    }

    CHECK(fixture.browser.currentIndex() == 1);
    CHECK(fixture.browser.directory() == QDir(fixture.dir.path()).absolutePath());
    REQUIRE(fixture.cache.waitForIdle(10000));
}

TEST_CASE("Opening a missing path is rejected", "[browser]")
{
    BrowserFixture fixture;
    QString failedPath;
    QObject::connect(&fixture.browser, &ImageBrowser::openFailed, [&](const QString &path) { failedPath = path; });

    const QString missing = fixture.file("nowhere");
    CHECK_FALSE(fixture.browser.open(missing));
    CHECK(failedPath == missing);
    CHECK(fixture.browser.count() == 0);
    CHECK(fixture.browser.title() == QStringLiteral("glance"));
    CHECK(fixture.browser.imageSource().isEmpty());
}

TEST_CASE("Stepping moves the cursor and returns the warmed window", "[browser]")
{
    BrowserFixture fixture;
    REQUIRE(fixture.browser.open(fixture.dir.path()));

    const QStringList forward = fixture.browser.next();
    CHECK(forward == QStringList{fixture.file("b.png"), fixture.file("c.png")});
    CHECK(fixture.browser.currentIndex() == 1);

    const QStringList backward = fixture.browser.prev();
    CHECK(backward == QStringList{fixture.file("a.png")});
    CHECK(fixture.browser.currentIndex() == 0);

    REQUIRE(fixture.cache.waitForIdle(10000));
    CHECK(fixture.cache.get(fixture.file("c.png")).isReady());
}

TEST_CASE("Reordering keeps the current file", "[browser]")
{
    BrowserFixture fixture;
    REQUIRE(fixture.browser.open(fixture.file("a.png")));

    REQUIRE(fixture.browser.reorder(QStringLiteral("name"), QStringLiteral("descending")));
    CHECK(fixture.browser.currentPath() == fixture.file("a.png"));
    CHECK(fixture.browser.currentIndex() == 2);
    CHECK(fixture.browser.sortOrder() == QStringLiteral("descending"));
    CHECK(fixture.browser.settings().sortOrder == Qt::DescendingOrder);

    CHECK_FALSE(fixture.browser.reorder(QStringLiteral("colour"), QStringLiteral("ascending")));
    CHECK(fixture.browser.sortKey() == QStringLiteral("name"));
    REQUIRE(fixture.cache.waitForIdle(10000));
}

TEST_CASE("Image ids carry the file path", "[browser]")
{
    const QString path = QStringLiteral("/photos/été 2024/#1 a+b.png");
    const QString id = ImageBrowser::imageId(7, path);

    CHECK(id.startsWith(QStringLiteral("7/")));
    CHECK_FALSE(id.mid(2).contains(QLatin1Char('/')));
    CHECK(ImageBrowser::pathFromImageId(id) == path);
    CHECK(ImageBrowser::pathFromImageId(QStringLiteral("no-separator")).isEmpty());
}

TEST_CASE("Browser view state", "[browser]")
{
    BrowserFixture fixture;

    CHECK(fixture.browser.memoryText().startsWith(QStringLiteral("bmp: 0.0/512.0(MB)\nimage: 0.0/1024.0(MB)")));
    CHECK(fixture.browser.nameFilters().first().contains(QStringLiteral("*.png")));

    CHECK_FALSE(fixture.browser.showMemory());
    fixture.browser.toggleMemory();
    CHECK(fixture.browser.showMemory());

    fixture.browser.setWindowGeometry(5, 6, 300, 200);
    CHECK(fixture.browser.settings().windowGeometry == QRect(5, 6, 300, 200));
    fixture.browser.setWindowGeometry(5, 6, 0, 0);
    CHECK(fixture.browser.windowGeometry() == QRect(5, 6, 300, 200));
}

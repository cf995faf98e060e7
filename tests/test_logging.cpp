
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

#include <QTemporaryDir>

#include "Logging.h"

namespace {

QString readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}

} // namespace

TEST_CASE("The file sink appends messages at or above its level", "[logging]")
{
    QTemporaryDir temp;
    REQUIRE(temp.isValid());
    const QString path = QDir(temp.path()).filePath(QStringLiteral("logs/glance.log"));

    REQUIRE(Logging::installFileSink(path, QtInfoMsg));
    qCInfo(lcApp) << "sink info line";
    qCWarning(lcCache) << "sink warning line";
    qCDebug(lcNavigation) << "sink debug line";
    Logging::removeFileSink();
    qCWarning(lcApp) << "after removal";

    const QString contents = readAll(path);
    CHECK(contents.contains(QStringLiteral("sink info line")));
    CHECK(contents.contains(QStringLiteral("sink warning line")));
    CHECK_FALSE(contents.contains(QStringLiteral("sink debug line")));
    CHECK_FALSE(contents.contains(QStringLiteral("after removal")));
}

TEST_CASE("The file sink rejects an unusable path", "[logging]")
{
    CHECK_FALSE(Logging::installFileSink(QString()));

    QTemporaryDir temp;
    REQUIRE(temp.isValid());
    CHECK_FALSE(Logging::installFileSink(temp.path()));
}

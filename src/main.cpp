
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

#include <QCommandLineParser>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QSettings>
#include <QSharedPointer>

#include "BitmapDevice.h"
#include "BitmapImageProvider.h"
#include "BrowserSettings.h"
#include "ImageBrowser.h"
#include "ImageCacheManager.h"
#include "Logging.h"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Glance"));
    QCoreApplication::setApplicationName(QStringLiteral("Glance"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Prefetching image viewer"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("path"),
                                 QCoreApplication::translate("main", "Image file or folder to open."),
                                 QStringLiteral("[path]"));
    parser.process(app);

    QSettings store(QSettings::IniFormat, QSettings::UserScope, QStringLiteral("Glance"), QStringLiteral("Glance"));
    const BrowserSettings settings = BrowserSettings::load(store);
    if (!settings.logFile.isEmpty() && !Logging::installFileSink(settings.logFile)) {
        qCWarning(lcApp) << "logging to terminal only";
    }
    qCInfo(lcApp) << "settings read from" << store.fileName();

    ImageCacheManager cache(settings.cacheLimits());
    const QSharedPointer<BitmapDevice> device = QSharedPointer<RasterBitmapDevice>::create(settings.maxTextureSize);
    ImageBrowser browser(&cache, device, settings);

    QQmlApplicationEngine engine;
    // The engine takes ownership of the provider.
    engine.addImageProvider(QStringLiteral("bitmaps"), new BitmapImageProvider(&cache));
    engine.rootContext()->setContextProperty("browser", &browser);
    const QUrl url(u"qrc:/Glance/qml/Main.qml"_qs);
    QObject::connect(
        &engine,
        &QQmlApplicationEngine::objectCreated,
        &app,
        [url](QObject *obj, const QUrl &objUrl) {
            if (!obj && url == objUrl) {
                QCoreApplication::exit(-1);
            }
        },
        Qt::QueuedConnection);

    engine.load(url);

    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty()) {
        browser.open(positional.first());
    }

    const int status = app.exec();

    browser.settings().save(store);
    Logging::removeFileSink();
    return status;
}

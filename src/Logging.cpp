
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

#include "Logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QTextStream>

#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(lcCache, "glance.cache")
Q_LOGGING_CATEGORY(lcNavigation, "glance.navigation")
Q_LOGGING_CATEGORY(lcSettings, "glance.settings")
Q_LOGGING_CATEGORY(lcApp, "glance.app")

namespace {

struct FileSink {
    QMutex mutex;
    std::unique_ptr<QFile> file;
    QtMsgType minimumType = QtInfoMsg;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

FileSink &fileSink()
{
    static FileSink sink;
    return sink;
}

// QtMsgType values are not ordered by severity.
int severity(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return 0;
    case QtInfoMsg:
        return 1;
    case QtWarningMsg:
        return 2;
    case QtCriticalMsg:
        return 3;
    case QtFatalMsg:
    default:
        return 4;
    }
}

void fileSinkHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    FileSink &sink = fileSink();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker locker(&sink.mutex);
        previous = sink.previous;
        if (sink.file && severity(type) >= severity(sink.minimumType)) {
            QTextStream stream(sink.file.get());
            stream << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << ' '
                   << qFormatLogMessage(type, context, message) << '\n';
            stream.flush();
        }
    }

    if (previous) {
        previous(type, context, message);
        return;
    }
    const QByteArray formatted = qFormatLogMessage(type, context, message).toLocal8Bit();
    std::fprintf(stderr, "%s\n", formatted.constData());
    std::fflush(stderr);
}

} // namespace

namespace Logging {

/**
 * @brief Mirrors log messages into a file in addition to the current handler.
 * @param path Log file to append to. Missing parent folders are created.
 * @param minimumType Least severe message type written to the file.
 * @return True when the file is open and the handler is installed.
 */
bool installFileSink(const QString &path, QtMsgType minimumType)
{
    if (path.isEmpty()) {
        return false;
    }
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return false;
    }
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }

    FileSink &sink = fileSink();
    QMutexLocker locker(&sink.mutex);
    sink.file = std::move(file);
    sink.minimumType = minimumType;
    if (!sink.installed) {
        sink.previous = qInstallMessageHandler(fileSinkHandler);
        sink.installed = true;
    }
    return true;
}

/**
 * @brief Restores the handler that was active before installFileSink().
 */
void removeFileSink()
{
    FileSink &sink = fileSink();
    QMutexLocker locker(&sink.mutex);
    if (sink.installed) {
        qInstallMessageHandler(sink.previous);
        sink.installed = false;
        sink.previous = nullptr;
    }
    sink.file.reset();
}

} // namespace Logging

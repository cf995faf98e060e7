#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcCache)
Q_DECLARE_LOGGING_CATEGORY(lcNavigation)
Q_DECLARE_LOGGING_CATEGORY(lcSettings)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace Logging {

bool installFileSink(const QString &path, QtMsgType minimumType = QtInfoMsg);
void removeFileSink();

} // namespace Logging

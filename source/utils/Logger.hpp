#ifndef TODOBACKEND_UTILS_LOGGER_HPP
#define TODOBACKEND_UTILS_LOGGER_HPP

#include <QtHttpServer/QHttpServerRequest>
#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appHttp)
Q_DECLARE_LOGGING_CATEGORY(appSql)

// Installs the message handler (stderr + optional log file) and the
// category filter rules. Debug output stays off unless verbose is set.
void initLogging(const QString &filePath = QString(), bool verbose = false);

const char *toString(QHttpServerRequest::Method method);

#endif // TODOBACKEND_UTILS_LOGGER_HPP

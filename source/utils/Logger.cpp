#include <QtCore/QDebug>
#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QTextStream>

#include <cstdio>

#include "Logger.hpp"

Q_LOGGING_CATEGORY(appCore, "todobackend.core")
Q_LOGGING_CATEGORY(appHttp, "todobackend.http")
Q_LOGGING_CATEGORY(appSql,  "todobackend.sql")

static QFile *g_logFile = nullptr;
static QMutex g_logMutex;

static void messageHandler(QtMsgType type, const QMessageLogContext &ctx,
                           const QString &msg) {
    const QString line = qFormatLogMessage(type, ctx, msg) + '\n';

    QMutexLocker lock(&g_logMutex);
    std::fprintf(stderr, "%s", line.toLocal8Bit().constData());

    if (g_logFile && g_logFile->isOpen()) {
        QTextStream ts(g_logFile);
        ts << line;
        ts.flush();
    }
}

void initLogging(const QString &filePath, bool verbose) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category} "
                       "(%{if-debug}%{function}:%{line}%{endif}): %{message}");

    QLoggingCategory::setFilterRules(
        verbose ? QStringLiteral("todobackend.*=true\n")
                : QStringLiteral("todobackend.*=true\n"
                                 "todobackend.*.debug=false\n"));

    if (!filePath.isEmpty()) {
        g_logFile = new QFile(filePath);
        if (!g_logFile->open(QIODevice::WriteOnly | QIODevice::Append |
                             QIODevice::Text)) {
            delete g_logFile;
            g_logFile = nullptr;
            qWarning(appCore) << "Failed to open log file:" << filePath;
        }
    }

    qInstallMessageHandler(messageHandler);

    qInfo(appCore) << "Logging initialized"
                   << (g_logFile ? QString("-> %1").arg(filePath)
                                 : QStringLiteral("(stderr only)"));
}

const char *toString(QHttpServerRequest::Method method) {
    using M = QHttpServerRequest::Method;
    switch (method) {
    case M::Get: return "GET";
    case M::Post: return "POST";
    case M::Put: return "PUT";
    case M::Delete: return "DELETE";
    case M::Patch: return "PATCH";
    case M::Head: return "HEAD";
    case M::Options: return "OPTIONS";
    case M::Trace: return "TRACE";
    case M::Connect: return "CONNECT";
    default: return "UNKNOWN";
    }
}

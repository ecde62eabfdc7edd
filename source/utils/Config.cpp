#include "Config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QtGlobal>

#include "Logger.hpp"

namespace {

QString pick(const QCommandLineParser &parser, const QCommandLineOption &option,
             const char *envName, const QString &fallback) {
    if (parser.isSet(option)) {
        return parser.value(option);
    }
    if (qEnvironmentVariableIsSet(envName)) {
        return qEnvironmentVariable(envName);
    }
    return fallback;
}

} // END NAMESPACE

std::optional<AppConfig> loadConfig(const QStringList &arguments) {
    AppConfig config;

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("To-do backend: task CRUD over HTTP, stored in SQLite"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbOption(
        QStringLiteral("db"),
        QStringLiteral("SQLite database file (env SQLITE_DB, default todo.db)."),
        QStringLiteral("path"));
    const QCommandLineOption hostOption(
        QStringLiteral("host"),
        QStringLiteral("Listen address (env HOST, default 0.0.0.0)."),
        QStringLiteral("address"));
    const QCommandLineOption portOption(
        QStringLiteral("port"),
        QStringLiteral("Listen port (env PORT, default 8000)."),
        QStringLiteral("port"));
    const QCommandLineOption logFileOption(
        QStringLiteral("log-file"),
        QStringLiteral("Append log output to this file (env TODO_LOG_FILE)."),
        QStringLiteral("path"));
    const QCommandLineOption verboseOption(
        QStringLiteral("verbose"), QStringLiteral("Enable debug logging."));

    parser.addOptions({dbOption, hostOption, portOption, logFileOption,
                       verboseOption});
    parser.process(arguments);

    config.databasePath = pick(parser, dbOption, "SQLITE_DB", config.databasePath);
    config.logFile = pick(parser, logFileOption, "TODO_LOG_FILE", QString());
    config.verbose = parser.isSet(verboseOption);

    const QString hostText = pick(parser, hostOption, "HOST", QStringLiteral("0.0.0.0"));
    if (!config.host.setAddress(hostText)) {
        qCritical(appCore) << "Invalid listen address:" << hostText;
        return std::nullopt;
    }

    const QString portText =
        pick(parser, portOption, "PORT", QString::number(config.port));
    bool ok = false;
    const uint port = portText.toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        qCritical(appCore) << "Invalid port:" << portText;
        return std::nullopt;
    }
    config.port = static_cast<quint16>(port);

    if (config.databasePath.isEmpty()) {
        qCritical(appCore) << "Database path must not be empty";
        return std::nullopt;
    }

    return config;
}

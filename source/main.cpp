#include <QCoreApplication>
#include <QHostAddress>
#include <QTcpServer>
#include <QtHttpServer/QHttpServer>

#include "Config.hpp"
#include "CorsPolicy.hpp"
#include "HealthRouter.hpp"
#include "Logger.hpp"
#include "SQLiteStorage.hpp"
#include "TaskRouter.hpp"
#include "TaskServiceImpl.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setApplicationName(QStringLiteral("todo-backend"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCoreApplication app(argc, argv);

    const auto config = loadConfig(app.arguments());
    if (!config) {
        return 1;
    }

    initLogging(config->logFile, config->verbose);

    // ──────────────────────────────
    // 1. Storage and schema
    // ──────────────────────────────
    auto storage = std::make_shared<SQLiteStorage>(config->databasePath);
    if (!storage->initialize()) {
        qCritical(appCore) << "Database initialization failed:" << config->databasePath;
        return 1;
    }

    // ──────────────────────────────
    // 2. Task service
    // ──────────────────────────────
    auto service = std::make_shared<TaskServiceImpl>(storage);

    // ──────────────────────────────
    // 3. HTTP server and routes
    // ──────────────────────────────
    QHttpServer server;

    HealthRouter health;
    health.registerRoutes(server);

    TaskRouter router(service);
    router.registerRoutes(server);

    installCorsPolicy(server);

    // ──────────────────────────────
    // 4. Bind and run
    // ──────────────────────────────
    auto tcp = new QTcpServer(&app);
    if (!tcp->listen(config->host, config->port) || !server.bind(tcp)) {
        qCritical(appCore) << "Server failed to start on"
                           << config->host.toString() << config->port;
        return 1;
    }

    qInfo(appCore) << "Server running on" << config->host.toString()
                   << "port" << tcp->serverPort()
                   << "db" << config->databasePath;
    return app.exec();
}

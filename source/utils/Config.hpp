#ifndef TODOBACKEND_UTILS_CONFIG_HPP
#define TODOBACKEND_UTILS_CONFIG_HPP

#include <QHostAddress>
#include <QString>
#include <QStringList>
#include <optional>

struct AppConfig {
    QString databasePath = QStringLiteral("todo.db");
    QHostAddress host = QHostAddress::Any;
    quint16 port = 8000;
    QString logFile;
    bool verbose = false;
};

// Command line first, then SQLITE_DB / HOST / PORT / TODO_LOG_FILE, then the
// defaults above. Returns nullopt (after printing the reason) on a bad value.
// arguments[0] is the program name, as in QCoreApplication::arguments().
std::optional<AppConfig> loadConfig(const QStringList &arguments);

#endif // TODOBACKEND_UTILS_CONFIG_HPP

#include <QtTest/QtTest>

#include "Config.hpp"

class ConfigTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void defaultsWithoutEnvironment();
    void environmentOverridesDefaults();
    void commandLineOverridesEnvironment();
    void invalidPortIsRejected_data();
    void invalidPortIsRejected();
    void invalidHostIsRejected();
    void emptyDatabasePathIsRejected();

private:
    static QStringList args(const QStringList &options = {})
    {
        return QStringList{QStringLiteral("todo-backend")} + options;
    }

    static void clearEnvironment()
    {
        for (const char *name : {"SQLITE_DB", "HOST", "PORT", "TODO_LOG_FILE"}) {
            qunsetenv(name);
        }
    }
};

void ConfigTest::init()
{
    clearEnvironment();
}

void ConfigTest::cleanup()
{
    clearEnvironment();
}

void ConfigTest::defaultsWithoutEnvironment()
{
    const auto config = loadConfig(args());
    QVERIFY(config.has_value());
    QCOMPARE(config->databasePath, QStringLiteral("todo.db"));
    QCOMPARE(config->host, QHostAddress(QStringLiteral("0.0.0.0")));
    QCOMPARE(config->port, quint16(8000));
    QVERIFY(config->logFile.isEmpty());
    QVERIFY(!config->verbose);
}

void ConfigTest::environmentOverridesDefaults()
{
    qputenv("SQLITE_DB", "/tmp/env.db");
    qputenv("HOST", "127.0.0.1");
    qputenv("PORT", "9001");
    qputenv("TODO_LOG_FILE", "/tmp/env.log");

    const auto config = loadConfig(args());
    QVERIFY(config.has_value());
    QCOMPARE(config->databasePath, QStringLiteral("/tmp/env.db"));
    QCOMPARE(config->host, QHostAddress(QHostAddress::LocalHost));
    QCOMPARE(config->port, quint16(9001));
    QCOMPARE(config->logFile, QStringLiteral("/tmp/env.log"));
}

void ConfigTest::commandLineOverridesEnvironment()
{
    qputenv("SQLITE_DB", "/tmp/env.db");
    qputenv("PORT", "9001");

    const auto config = loadConfig(args({"--db", "/tmp/cli.db", "--port", "9100",
                                         "--host", "::1", "--verbose"}));
    QVERIFY(config.has_value());
    QCOMPARE(config->databasePath, QStringLiteral("/tmp/cli.db"));
    QCOMPARE(config->port, quint16(9100));
    QCOMPARE(config->host, QHostAddress(QHostAddress::LocalHostIPv6));
    QVERIFY(config->verbose);
}

void ConfigTest::invalidPortIsRejected_data()
{
    QTest::addColumn<QString>("port");

    QTest::newRow("zero") << QStringLiteral("0");
    QTest::newRow("too large") << QStringLiteral("65536");
    QTest::newRow("not a number") << QStringLiteral("http");
    QTest::newRow("negative") << QStringLiteral("-1");
}

void ConfigTest::invalidPortIsRejected()
{
    QFETCH(QString, port);

    QVERIFY(!loadConfig(args({QStringLiteral("--port=") + port})).has_value());

    // The environment goes through the same check.
    qputenv("PORT", port.toUtf8());
    QVERIFY(!loadConfig(args()).has_value());
}

void ConfigTest::invalidHostIsRejected()
{
    QVERIFY(!loadConfig(args({"--host", "not-an-address"})).has_value());
}

void ConfigTest::emptyDatabasePathIsRejected()
{
    qputenv("SQLITE_DB", "");
    QVERIFY(!loadConfig(args()).has_value());
}

QTEST_GUILESS_MAIN(ConfigTest)
#include "ConfigTest.moc"

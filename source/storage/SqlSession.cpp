#include "SqlSession.hpp"

#include <QUuid>
#include <QtSql/QSqlError>

#include "Errors.hpp"
#include "Logger.hpp"

SqlSession::SqlSession(const QString &dbPath, int busyTimeoutMs)
    : m_connectionName(QStringLiteral("todobackend-") +
                       QUuid::createUuid().toString(QUuid::WithoutBraces)) {
    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    m_db.setDatabaseName(dbPath);
    m_db.setConnectOptions(
        QStringLiteral("QSQLITE_BUSY_TIMEOUT=%1").arg(busyTimeoutMs));

    if (!m_db.open()) {
        const QString reason = m_db.lastError().text();
        qCritical(appSql) << "Failed to open database" << dbPath << ":" << reason;
        release();
        throw StorageError(QStringLiteral("open %1: %2").arg(dbPath, reason));
    }

    qDebug(appSql) << "Session opened" << m_connectionName;
}

SqlSession::~SqlSession() {
    release();
}

void SqlSession::release() {
    if (m_db.isOpen()) {
        m_db.close();
    }
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
    qDebug(appSql) << "Session released" << m_connectionName;
}

QSqlQuery SqlSession::prepare(const QString &sql) {
    QSqlQuery query(m_db);
    if (!query.prepare(sql)) {
        const QString reason = query.lastError().text();
        qCritical(appSql) << "prepare failed:" << sql << ":" << reason;
        throw StorageError(QStringLiteral("prepare: %1").arg(reason));
    }
    return query;
}

void SqlSession::exec(QSqlQuery &query, const char *what) {
    if (!query.exec()) {
        const QString reason = query.lastError().text();
        qCritical(appSql) << what << ":" << reason;
        throw StorageError(QStringLiteral("%1: %2").arg(QLatin1String(what), reason));
    }
}

void SqlSession::execDirect(const QString &sql, const char *what) {
    QSqlQuery query(m_db);
    if (!query.exec(sql)) {
        const QString reason = query.lastError().text();
        qCritical(appSql) << what << ":" << reason;
        throw StorageError(QStringLiteral("%1: %2").arg(QLatin1String(what), reason));
    }
}

SqlTransaction::SqlTransaction(SqlSession &session) : m_session(session) {
    m_session.execDirect(QStringLiteral("BEGIN IMMEDIATE"), "tx begin");
    m_active = true;
}

SqlTransaction::~SqlTransaction() {
    if (!m_active) {
        return;
    }

    QSqlQuery rollback(m_session.database());
    if (!rollback.exec(QStringLiteral("ROLLBACK"))) {
        qWarning(appSql) << "tx rollback:" << rollback.lastError().text();
    } else {
        qDebug(appSql) << "tx rolled back";
    }
}

void SqlTransaction::commit() {
    m_session.execDirect(QStringLiteral("COMMIT"), "tx commit");
    m_active = false;
}

#ifndef TODOBACKEND_STORAGE_SQLSESSION_HPP
#define TODOBACKEND_STORAGE_SQLSESSION_HPP

#include <QString>
#include <QtSql/QSqlDatabase>
#include <QtSql/QSqlQuery>

// One named QSqlDatabase connection per operation. The connection is opened
// in the constructor and closed and unregistered in the destructor, so it is
// released on every exit path. Any QSqlQuery built on it must be destroyed
// first (declare the session before the queries).
class SqlSession {
public:
    SqlSession(const QString &dbPath, int busyTimeoutMs);
    ~SqlSession();

    SqlSession(const SqlSession &) = delete;
    SqlSession &operator=(const SqlSession &) = delete;

    QSqlDatabase &database() { return m_db; }

    // Both throw StorageError with the driver message.
    QSqlQuery prepare(const QString &sql);
    void exec(QSqlQuery &query, const char *what);
    void execDirect(const QString &sql, const char *what);

private:
    void release();

    QString m_connectionName;
    QSqlDatabase m_db;
};

// BEGIN IMMEDIATE ... COMMIT. Takes SQLite's write lock up front so the
// existence check and the write that follows cannot interleave with another
// writer, in this process or another one. Rolls back in the destructor unless
// commit() succeeded.
class SqlTransaction {
public:
    explicit SqlTransaction(SqlSession &session);
    ~SqlTransaction();

    SqlTransaction(const SqlTransaction &) = delete;
    SqlTransaction &operator=(const SqlTransaction &) = delete;

    void commit();

private:
    SqlSession &m_session;
    bool m_active = false;
};

#endif // TODOBACKEND_STORAGE_SQLSESSION_HPP

#include "SQLiteStorage.hpp"

#include <QVariant>
#include <algorithm>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QtSql/QSqlRecord>

#include "Errors.hpp"
#include "Logger.hpp"
#include "SqlSession.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// helpers
// ─────────────────────────────────────────────────────────────────────────────
namespace {

const QString kSelectColumns = QStringLiteral(
    "SELECT id, title, description, completed, created_at, updated_at "
    "FROM tasks");

QVariant nullableText(const std::optional<QString> &text) {
    return text ? QVariant(*text) : QVariant(QMetaType::fromType<QString>());
}

Task rowToTask(const QSqlRecord &record) {
    Task task;
    task.id = record.value("id").toLongLong();
    task.title = record.value("title").toString();

    const QVariant description = record.value("description");
    if (!description.isNull()) {
        task.description = description.toString();
    }

    task.completed = record.value("completed").toInt() != 0;
    task.createdAt = record.value("created_at").toString();
    task.updatedAt = record.value("updated_at").toString();

    return task;
}

std::optional<Task> fetchTask(SqlSession &session, qint64 id) {
    QSqlQuery query = session.prepare(kSelectColumns + QStringLiteral(" WHERE id = ?"));
    query.addBindValue(id);
    session.exec(query, "fetchTask");

    if (!query.next()) {
        return std::nullopt;
    }

    Task task = rowToTask(query.record());
    query.finish();
    return task;
}

} // END NAMESPACE

// ─────────────────────────────────────────────────────────────────────────────
// ctor / schema
// ─────────────────────────────────────────────────────────────────────────────
SQLiteStorage::SQLiteStorage(const QString &dbPath, Clock clock)
    : m_dbPath(dbPath), m_clock(std::move(clock)) {}

bool SQLiteStorage::initialize() {
    qInfo(appSql) << "Ensuring DB schema at" << m_dbPath;

    try {
        SqlSession session(m_dbPath, kBusyTimeoutMs);

        // WAL lets readers proceed while a writer holds the lock.
        QSqlQuery pragma(session.database());
        if (!pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL"))) {
            qWarning(appSql) << "journal_mode:" << pragma.lastError().text();
        }
        pragma.finish();

        session.execDirect(
            QStringLiteral(
                "CREATE TABLE IF NOT EXISTS tasks ("
                "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                "  title TEXT NOT NULL"
                "    CHECK (title <> ''),"
                "  description TEXT,"
                "  completed INTEGER NOT NULL DEFAULT 0"
                "    CHECK (completed IN (0, 1)),"
                "  created_at TEXT NOT NULL,"
                "  updated_at TEXT NOT NULL"
                "    CHECK (updated_at >= created_at)"
                ");"),
            "schema tasks");
    } catch (const StorageError &e) {
        qCritical(appSql) << "Failed to init schema:" << e.what();
        return false;
    }

    qInfo(appSql) << "Schema OK";
    return true;
}

QString SQLiteStorage::now() const {
    return toIsoTimestamp(m_clock());
}

// ─────────────────────────────────────────────────────────────────────────────
// tasks
// ─────────────────────────────────────────────────────────────────────────────
std::vector<Task> SQLiteStorage::getAllTasks() const {
    qDebug(appSql) << "Query: getAllTasks()";
    std::vector<Task> out;

    SqlSession session(m_dbPath, kBusyTimeoutMs);
    QSqlQuery query = session.prepare(kSelectColumns + QStringLiteral(" ORDER BY id DESC"));
    session.exec(query, "getAllTasks");

    while (query.next()) {
        out.push_back(rowToTask(query.record()));
    }
    query.finish();

    qDebug(appSql) << "→" << out.size() << "tasks fetched";
    return out;
}

std::optional<Task> SQLiteStorage::getTaskById(qint64 id) const {
    qDebug(appSql) << "Query: getTaskById id=" << id;

    SqlSession session(m_dbPath, kBusyTimeoutMs);
    return fetchTask(session, id);
}

Task SQLiteStorage::addTask(const TaskCreate &task) {
    const QString timestamp = now();
    qInfo(appSql) << "Insert task title=" << task.title;

    SqlSession session(m_dbPath, kBusyTimeoutMs);
    SqlTransaction tx(session);

    QSqlQuery insert = session.prepare(
        QStringLiteral("INSERT INTO tasks(title, description, completed, "
                       "created_at, updated_at) VALUES(?, ?, ?, ?, ?)"));
    insert.addBindValue(task.title);
    insert.addBindValue(nullableText(task.description));
    insert.addBindValue(task.completed ? 1 : 0);
    insert.addBindValue(timestamp);
    insert.addBindValue(timestamp);
    session.exec(insert, "addTask");

    const qint64 newId = insert.lastInsertId().toLongLong();
    insert.finish();

    std::optional<Task> stored = fetchTask(session, newId);
    if (!stored) {
        throw StorageError(QStringLiteral("addTask: row %1 vanished after insert")
                               .arg(newId));
    }

    tx.commit();
    qInfo(appSql) << "Task inserted id=" << newId;
    return *stored;
}

std::optional<Task> SQLiteStorage::replaceTask(qint64 id, const TaskUpdate &task) {
    qInfo(appSql) << "Replace task id=" << id;

    SqlSession session(m_dbPath, kBusyTimeoutMs);
    SqlTransaction tx(session);

    const std::optional<Task> existing = fetchTask(session, id);
    if (!existing) {
        qInfo(appSql) << "Task not found id=" << id;
        return std::nullopt;
    }

    // A clock that steps backwards must not break updated_at >= created_at.
    const QString timestamp = std::max(now(), existing->createdAt);

    QSqlQuery update = session.prepare(
        QStringLiteral("UPDATE tasks SET title = ?, description = ?, "
                       "completed = ?, updated_at = ? WHERE id = ?"));
    update.addBindValue(task.title);
    update.addBindValue(nullableText(task.description));
    update.addBindValue(task.completed ? 1 : 0);
    update.addBindValue(timestamp);
    update.addBindValue(id);
    session.exec(update, "replaceTask");
    update.finish();

    std::optional<Task> updated = fetchTask(session, id);
    tx.commit();

    qInfo(appSql) << "Task replaced id=" << id;
    return updated;
}

std::optional<Task> SQLiteStorage::setTaskCompleted(qint64 id, bool completed) {
    qInfo(appSql) << "Set completed id=" << id << "completed=" << completed;

    SqlSession session(m_dbPath, kBusyTimeoutMs);
    SqlTransaction tx(session);

    const std::optional<Task> existing = fetchTask(session, id);
    if (!existing) {
        qInfo(appSql) << "Task not found id=" << id;
        return std::nullopt;
    }

    const QString timestamp = std::max(now(), existing->createdAt);

    QSqlQuery update = session.prepare(
        QStringLiteral("UPDATE tasks SET completed = ?, updated_at = ? WHERE id = ?"));
    update.addBindValue(completed ? 1 : 0);
    update.addBindValue(timestamp);
    update.addBindValue(id);
    session.exec(update, "setTaskCompleted");
    update.finish();

    std::optional<Task> updated = fetchTask(session, id);
    tx.commit();

    qInfo(appSql) << "Task completion updated id=" << id;
    return updated;
}

bool SQLiteStorage::deleteTask(qint64 id) {
    qInfo(appSql) << "Delete task id=" << id;

    SqlSession session(m_dbPath, kBusyTimeoutMs);
    SqlTransaction tx(session);

    QSqlQuery query = session.prepare(QStringLiteral("DELETE FROM tasks WHERE id = ?"));
    query.addBindValue(id);
    session.exec(query, "deleteTask");

    const bool ok = query.numRowsAffected() > 0;
    query.finish();
    tx.commit();

    qInfo(appSql) << (ok ? "Deleted" : "Not found") << "id=" << id;
    return ok;
}

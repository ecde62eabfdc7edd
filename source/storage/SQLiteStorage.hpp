#ifndef TODOBACKEND_STORAGE_SQLITESTORAGE_HPP
#define TODOBACKEND_STORAGE_SQLITESTORAGE_HPP

#include <QString>

#include "IStorage.hpp"
#include "Timestamp.hpp"

class SQLiteStorage : public IStorage {
public:
    static constexpr int kBusyTimeoutMs = 5000;

    explicit SQLiteStorage(const QString &dbPath, Clock clock = systemUtcNow);

    // Creates the tasks table if absent. Call once before serving requests.
    bool initialize();

    std::vector<Task> getAllTasks() const override;

    // Single-row read outside any transaction. No route serves it; it lets
    // callers inspect stored state without listing the whole table.
    std::optional<Task> getTaskById(qint64 id) const;

    Task addTask(const TaskCreate &task) override;
    std::optional<Task> replaceTask(qint64 id, const TaskUpdate &task) override;
    std::optional<Task> setTaskCompleted(qint64 id, bool completed) override;
    bool deleteTask(qint64 id) override;

private:
    QString now() const;

    QString m_dbPath;
    Clock m_clock;
};

#endif // TODOBACKEND_STORAGE_SQLITESTORAGE_HPP

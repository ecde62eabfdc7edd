#ifndef TODOBACKEND_STORAGE_ISTORAGE_HPP
#define TODOBACKEND_STORAGE_ISTORAGE_HPP

#include <optional>
#include <vector>

#include "Task.hpp"
#include "TaskPayload.hpp"

// Absent rows are reported through std::optional / bool; driver failures
// throw StorageError.
class IStorage {
public:
    virtual ~IStorage() = default;

    virtual std::vector<Task> getAllTasks() const = 0;

    virtual Task addTask(const TaskCreate &task) = 0;
    virtual std::optional<Task> replaceTask(qint64 id, const TaskUpdate &task) = 0;
    virtual std::optional<Task> setTaskCompleted(qint64 id, bool completed) = 0;
    virtual bool deleteTask(qint64 id) = 0;
};

#endif // TODOBACKEND_STORAGE_ISTORAGE_HPP

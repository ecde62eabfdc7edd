#ifndef TODOBACKEND_MODEL_TASKRESPONSES_HPP
#define TODOBACKEND_MODEL_TASKRESPONSES_HPP

#include <QJsonArray>
#include <QJsonObject>
#include <vector>

#include "Task.hpp"

// GET /tasks -> {"tasks": [...]}
struct TaskListResponse {
    std::vector<Task> tasks;

    QJsonObject toJson() const {
        QJsonArray items;
        for (const Task &task : tasks) {
            items.append(task.toJson());
        }
        return QJsonObject{{"tasks", items}};
    }
};

// PATCH /tasks/{id}/complete -> {"task": {...}}
// PUT returns the bare task; the two shapes must stay distinct on the wire.
struct TaskCompleteResponse {
    Task task;

    QJsonObject toJson() const {
        return QJsonObject{{"task", task.toJson()}};
    }
};

#endif // TODOBACKEND_MODEL_TASKRESPONSES_HPP

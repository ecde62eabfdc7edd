#ifndef TODOBACKEND_MODEL_TASKPAYLOAD_HPP
#define TODOBACKEND_MODEL_TASKPAYLOAD_HPP

#include <QString>
#include <optional>

constexpr int kTitleMinLength = 1;
constexpr int kTitleMaxLength = 200;
constexpr int kDescriptionMaxLength = 2000;

// POST /tasks
struct TaskCreate {
    QString title;
    std::optional<QString> description;
    bool completed = false;
};

// PUT /tasks/{id}: every field is written, completed is mandatory.
struct TaskUpdate {
    QString title;
    std::optional<QString> description;
    bool completed = false;
};

// PATCH /tasks/{id}/complete
struct TaskCompletion {
    bool completed = false;
};

#endif // TODOBACKEND_MODEL_TASKPAYLOAD_HPP

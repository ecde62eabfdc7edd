#include "Logger.hpp"
#include "TaskServiceImpl.hpp"

#include "Errors.hpp"
#include "Validation.hpp"

namespace {

void requireValidId(qint64 taskId) {
    if (taskId < 1) {
        throw ValidationError({FieldError{
            QStringLiteral("greater_than_equal"),
            {QStringLiteral("path"), QStringLiteral("id")},
            QStringLiteral("Input should be greater than or equal to 1"),
            QJsonValue(taskId), QJsonObject{{"ge", 1}}}});
    }
}

template <typename Payload>
void requireValidPayload(const Payload &payload, const char *operation) {
    QList<FieldError> errors = validate(payload);
    if (!errors.isEmpty()) {
        qWarning(appCore) << "[Server]" << operation << "rejected:"
                          << errors.size() << "invalid field(s)";
        throw ValidationError(std::move(errors));
    }
}

} // END NAMESPACE

TaskServiceImpl::TaskServiceImpl(std::shared_ptr<IStorage> storage)
    : m_storage(std::move(storage)) {}

TaskListResponse TaskServiceImpl::listTasks() const {
    TaskListResponse response{m_storage->getAllTasks()};
    qInfo(appCore) << "[Server] Retrieved" << response.tasks.size() << "tasks";
    return response;
}

Task TaskServiceImpl::createTask(const TaskCreate &payload) {
    requireValidPayload(payload, "createTask");

    Task created = m_storage->addTask(payload);
    qInfo(appCore) << "[Server] Task added:" << created.title
                   << "(id=" << created.id << ")";
    return created;
}

std::optional<Task> TaskServiceImpl::replaceTask(qint64 taskId,
                                                 const TaskUpdate &payload) {
    requireValidId(taskId);
    requireValidPayload(payload, "replaceTask");

    std::optional<Task> updated = m_storage->replaceTask(taskId, payload);
    if (updated) {
        qInfo(appCore) << "[Server] Task replaced:" << updated->title
                       << "(id=" << taskId << ")";
    } else {
        qWarning(appCore) << "[Server] Task with id" << taskId << "not found";
    }
    return updated;
}

std::optional<TaskCompleteResponse>
TaskServiceImpl::setTaskCompletion(qint64 taskId, const TaskCompletion &payload) {
    requireValidId(taskId);

    std::optional<Task> updated =
        m_storage->setTaskCompleted(taskId, payload.completed);
    if (!updated) {
        qWarning(appCore) << "[Server] Task with id" << taskId << "not found";
        return std::nullopt;
    }

    qInfo(appCore) << "[Server] Task" << taskId << "marked"
                   << (payload.completed ? "completed" : "not completed");
    return TaskCompleteResponse{*updated};
}

bool TaskServiceImpl::deleteTask(qint64 taskId) {
    requireValidId(taskId);

    const bool ok = m_storage->deleteTask(taskId);
    if (ok) {
        qInfo(appCore) << "[Server] Task deleted (id=" << taskId << ")";
    } else {
        qWarning(appCore) << "[Server] Task with id" << taskId << "not found";
    }
    return ok;
}

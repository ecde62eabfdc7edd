#ifndef TODOBACKEND_SERVICE_ITASKSERVICE_HPP
#define TODOBACKEND_SERVICE_ITASKSERVICE_HPP

#include <optional>

#include "Task.hpp"
#include "TaskPayload.hpp"
#include "TaskResponses.hpp"

// std::nullopt / false mean "no task with that id". Invalid input throws
// ValidationError before the store is touched; store failures throw
// StorageError.
class ITaskService {
public:
    virtual ~ITaskService() = default;

    virtual TaskListResponse listTasks() const = 0;

    virtual Task createTask(const TaskCreate &payload) = 0;
    virtual std::optional<Task> replaceTask(qint64 taskId,
                                            const TaskUpdate &payload) = 0;
    virtual std::optional<TaskCompleteResponse>
    setTaskCompletion(qint64 taskId, const TaskCompletion &payload) = 0;
    virtual bool deleteTask(qint64 taskId) = 0;
};

#endif // TODOBACKEND_SERVICE_ITASKSERVICE_HPP

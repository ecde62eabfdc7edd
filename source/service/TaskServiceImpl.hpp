#ifndef TODOBACKEND_SERVICE_TASKSERVICEIMPL_HPP
#define TODOBACKEND_SERVICE_TASKSERVICEIMPL_HPP

#include <memory>
#include <optional>

#include "IStorage.hpp"
#include "ITaskService.hpp"

class TaskServiceImpl : public ITaskService {
public:
    explicit TaskServiceImpl(std::shared_ptr<IStorage> storage);

    TaskListResponse listTasks() const override;

    Task createTask(const TaskCreate &payload) override;
    std::optional<Task> replaceTask(qint64 taskId,
                                    const TaskUpdate &payload) override;
    std::optional<TaskCompleteResponse>
    setTaskCompletion(qint64 taskId, const TaskCompletion &payload) override;
    bool deleteTask(qint64 taskId) override;

private:
    std::shared_ptr<IStorage> m_storage;
};

#endif // TODOBACKEND_SERVICE_TASKSERVICEIMPL_HPP

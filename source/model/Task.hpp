#ifndef TODOBACKEND_MODEL_TASK_HPP
#define TODOBACKEND_MODEL_TASK_HPP

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>

struct Task {
    qint64 id = 0;
    QString title;
    std::optional<QString> description;
    bool completed = false;

    // ISO-8601 UTC, second precision: 2024-01-15T10:30:00+00:00
    QString createdAt;
    QString updatedAt;

    QJsonObject toJson() const {
        return QJsonObject{
            {"id", id},
            {"title", title},
            {"description", description ? QJsonValue(*description)
                                        : QJsonValue(QJsonValue::Null)},
            {"completed", completed},
            {"created_at", createdAt},
            {"updated_at", updatedAt}};
    }
};

#endif // TODOBACKEND_MODEL_TASK_HPP

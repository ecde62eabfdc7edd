#ifndef TODOBACKEND_UTILS_TASKPAYLOADPARSER_HPP
#define TODOBACKEND_UTILS_TASKPAYLOADPARSER_HPP

#include <QByteArray>
#include <QString>

#include <utility>

#include "TaskPayload.hpp"

// Each parser collects every field problem of the request and throws a
// single ValidationError; nothing here touches the store.
//
// Accepted shapes:
//  - create:     {"title": string, "description"?: string|null, "completed"?: bool}
//  - update:     {"title": string, "description"?: string|null, "completed": bool}
//  - completion: {"completed": bool}
TaskCreate parseTaskCreate(const QByteArray &body);
TaskUpdate parseTaskUpdate(const QByteArray &body);
TaskCompletion parseTaskCompletion(const QByteArray &body);

// Path segment {id}: an integer >= 1.
qint64 parseTaskId(const QString &pathArg);

// Routes with both a path id and a body: problems in the two parts are
// reported together, path errors first.
std::pair<qint64, TaskUpdate> parseTaskUpdateRequest(const QString &pathArg,
                                                     const QByteArray &body);
std::pair<qint64, TaskCompletion>
parseTaskCompletionRequest(const QString &pathArg, const QByteArray &body);

#endif // TODOBACKEND_UTILS_TASKPAYLOADPARSER_HPP

#ifndef TODOBACKEND_UTILS_VALIDATION_HPP
#define TODOBACKEND_UTILS_VALIDATION_HPP

#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

#include "Errors.hpp"
#include "TaskPayload.hpp"

// Length in Unicode code points, the unit the length bounds are expressed in.
qsizetype codePointLength(const QString &text);

QList<FieldError> validateTitle(const QString &title, const QStringList &loc);
QList<FieldError> validateDescription(const std::optional<QString> &description,
                                      const QStringList &loc);

QList<FieldError> validate(const TaskCreate &payload);
QList<FieldError> validate(const TaskUpdate &payload);

// Lenient boolean: true/false, 0/1 and the usual yes/no spellings.
std::optional<bool> coerceBool(const QJsonValue &value);

#endif // TODOBACKEND_UTILS_VALIDATION_HPP

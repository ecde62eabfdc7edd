#include "TaskPayloadParser.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include "Errors.hpp"
#include "Validation.hpp"

namespace {

QStringList bodyLoc(const QString &field) {
    return {QStringLiteral("body"), field};
}

QJsonObject parseBodyObject(const QByteArray &body) {
    if (body.trimmed().isEmpty()) {
        throw ValidationError({FieldError{QStringLiteral("missing"),
                                          {QStringLiteral("body")},
                                          QStringLiteral("Field required"),
                                          QJsonValue(QJsonValue::Null)}});
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw ValidationError({FieldError{
            QStringLiteral("json_invalid"),
            {QStringLiteral("body"), QString::number(parseError.offset)},
            QStringLiteral("JSON decode error"), QJsonObject{},
            QJsonObject{{"error", parseError.errorString()}}}});
    }

    if (!doc.isObject()) {
        throw ValidationError({FieldError{
            QStringLiteral("model_attributes_type"),
            {QStringLiteral("body")},
            QStringLiteral("Input should be a valid dictionary or object to "
                           "extract fields from"),
            doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(QJsonValue::Null)}});
    }

    return doc.object();
}

FieldError missing(const QString &field, const QJsonObject &body) {
    return FieldError{QStringLiteral("missing"), bodyLoc(field),
                      QStringLiteral("Field required"), QJsonValue(body)};
}

void readTitle(const QJsonObject &body, QString &out, QList<FieldError> &errors) {
    if (!body.contains("title")) {
        errors << missing(QStringLiteral("title"), body);
        return;
    }

    const QJsonValue value = body.value("title");
    if (!value.isString()) {
        errors << FieldError{QStringLiteral("string_type"), bodyLoc("title"),
                             QStringLiteral("Input should be a valid string"),
                             value};
        return;
    }

    out = value.toString();
    errors << validateTitle(out, bodyLoc("title"));
}

void readDescription(const QJsonObject &body, std::optional<QString> &out,
                     QList<FieldError> &errors) {
    const QJsonValue value = body.value("description");
    if (value.isUndefined() || value.isNull()) {
        out.reset();
        return;
    }

    if (!value.isString()) {
        errors << FieldError{QStringLiteral("string_type"), bodyLoc("description"),
                             QStringLiteral("Input should be a valid string"),
                             value};
        return;
    }

    out = value.toString();
    errors << validateDescription(out, bodyLoc("description"));
}

// A missing key is an error only when required; otherwise out keeps its
// default.
void readCompleted(const QJsonObject &body, bool required, bool &out,
                   QList<FieldError> &errors) {
    if (!body.contains("completed")) {
        if (required) {
            errors << missing(QStringLiteral("completed"), body);
        }
        return;
    }

    const QJsonValue value = body.value("completed");
    const std::optional<bool> parsed = coerceBool(value);
    if (!parsed) {
        const bool interpretable = value.isString() || value.isDouble();
        errors << FieldError{
            interpretable ? QStringLiteral("bool_parsing")
                          : QStringLiteral("bool_type"),
            bodyLoc("completed"),
            interpretable
                ? QStringLiteral("Input should be a valid boolean, unable to "
                                 "interpret input")
                : QStringLiteral("Input should be a valid boolean"),
            value};
        return;
    }

    out = *parsed;
}

template <typename Payload, typename ParseBody>
std::pair<qint64, Payload> parseIdAndBody(const QString &pathArg,
                                          const QByteArray &body,
                                          ParseBody parseBody) {
    std::pair<qint64, Payload> request{0, Payload{}};
    QList<FieldError> errors;

    try {
        request.first = parseTaskId(pathArg);
    } catch (const ValidationError &e) {
        errors << e.errors();
    }

    try {
        request.second = parseBody(body);
    } catch (const ValidationError &e) {
        errors << e.errors();
    }

    if (!errors.isEmpty()) {
        throw ValidationError(std::move(errors));
    }
    return request;
}

} // END NAMESPACE

TaskCreate parseTaskCreate(const QByteArray &body) {
    const QJsonObject payload = parseBodyObject(body);

    TaskCreate task;
    QList<FieldError> errors;
    readTitle(payload, task.title, errors);
    readDescription(payload, task.description, errors);
    readCompleted(payload, false, task.completed, errors);

    if (!errors.isEmpty()) {
        throw ValidationError(std::move(errors));
    }
    return task;
}

TaskUpdate parseTaskUpdate(const QByteArray &body) {
    const QJsonObject payload = parseBodyObject(body);

    TaskUpdate task;
    QList<FieldError> errors;
    readTitle(payload, task.title, errors);
    readDescription(payload, task.description, errors);
    readCompleted(payload, true, task.completed, errors);

    if (!errors.isEmpty()) {
        throw ValidationError(std::move(errors));
    }
    return task;
}

TaskCompletion parseTaskCompletion(const QByteArray &body) {
    const QJsonObject payload = parseBodyObject(body);

    TaskCompletion completion;
    QList<FieldError> errors;
    readCompleted(payload, true, completion.completed, errors);

    if (!errors.isEmpty()) {
        throw ValidationError(std::move(errors));
    }
    return completion;
}

qint64 parseTaskId(const QString &pathArg) {
    const QStringList loc{QStringLiteral("path"), QStringLiteral("id")};

    bool ok = false;
    const qint64 id = pathArg.trimmed().toLongLong(&ok);
    if (!ok) {
        throw ValidationError({FieldError{
            QStringLiteral("int_parsing"), loc,
            QStringLiteral("Input should be a valid integer, unable to parse "
                           "string as an integer"),
            QJsonValue(pathArg)}});
    }

    if (id < 1) {
        throw ValidationError({FieldError{
            QStringLiteral("greater_than_equal"), loc,
            QStringLiteral("Input should be greater than or equal to 1"),
            QJsonValue(pathArg), QJsonObject{{"ge", 1}}}});
    }

    return id;
}

std::pair<qint64, TaskUpdate> parseTaskUpdateRequest(const QString &pathArg,
                                                     const QByteArray &body) {
    return parseIdAndBody<TaskUpdate>(pathArg, body, parseTaskUpdate);
}

std::pair<qint64, TaskCompletion>
parseTaskCompletionRequest(const QString &pathArg, const QByteArray &body) {
    return parseIdAndBody<TaskCompletion>(pathArg, body, parseTaskCompletion);
}

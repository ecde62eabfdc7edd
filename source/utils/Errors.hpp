#ifndef TODOBACKEND_UTILS_ERRORS_HPP
#define TODOBACKEND_UTILS_ERRORS_HPP

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>
#include <stdexcept>

// Raised by the storage layer for any driver failure (open, prepare, exec,
// commit). Never raised for a missing row.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

// One entry of a 422 response: {"type", "loc", "msg", "input"[, "ctx"]}.
struct FieldError {
    QString type;
    QStringList loc;
    QString msg;
    QJsonValue input = QJsonValue(QJsonValue::Undefined);
    QJsonObject ctx;

    QJsonObject toJson() const {
        QJsonObject json{{"type", type},
                         {"loc", QJsonArray::fromStringList(loc)},
                         {"msg", msg}};
        if (!input.isUndefined()) {
            json.insert("input", input);
        }
        if (!ctx.isEmpty()) {
            json.insert("ctx", ctx);
        }
        return json;
    }
};

class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(QList<FieldError> errors)
        : std::invalid_argument(summarize(errors)),
          m_errors(std::move(errors)) {}

    const QList<FieldError> &errors() const { return m_errors; }

    QJsonArray toJson() const {
        QJsonArray out;
        for (const FieldError &error : m_errors) {
            out.append(error.toJson());
        }
        return out;
    }

private:
    static std::string summarize(const QList<FieldError> &errors) {
        QStringList parts;
        for (const FieldError &error : errors) {
            parts << error.loc.join('.') + ": " + error.msg;
        }
        return parts.join("; ").toStdString();
    }

    QList<FieldError> m_errors;
};

#endif // TODOBACKEND_UTILS_ERRORS_HPP

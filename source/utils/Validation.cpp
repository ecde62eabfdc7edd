#include "Validation.hpp"

#include <QJsonObject>

namespace {

FieldError tooShort(const QStringList &loc, const QString &value, int minLength) {
    return FieldError{
        QStringLiteral("string_too_short"), loc,
        QStringLiteral("String should have at least %1 character%2")
            .arg(minLength)
            .arg(minLength == 1 ? QString() : QStringLiteral("s")),
        QJsonValue(value), QJsonObject{{"min_length", minLength}}};
}

FieldError tooLong(const QStringList &loc, const QString &value, int maxLength) {
    return FieldError{
        QStringLiteral("string_too_long"), loc,
        QStringLiteral("String should have at most %1 characters").arg(maxLength),
        QJsonValue(value), QJsonObject{{"max_length", maxLength}}};
}

template <typename Payload>
QList<FieldError> validateFields(const Payload &payload) {
    QList<FieldError> errors;
    errors << validateTitle(payload.title, {"body", "title"});
    errors << validateDescription(payload.description, {"body", "description"});
    return errors;
}

} // END NAMESPACE

qsizetype codePointLength(const QString &text) {
    return text.toUcs4().size();
}

QList<FieldError> validateTitle(const QString &title, const QStringList &loc) {
    const qsizetype length = codePointLength(title);
    if (length < kTitleMinLength) {
        return {tooShort(loc, title, kTitleMinLength)};
    }
    if (length > kTitleMaxLength) {
        return {tooLong(loc, title, kTitleMaxLength)};
    }
    return {};
}

QList<FieldError> validateDescription(const std::optional<QString> &description,
                                      const QStringList &loc) {
    if (description && codePointLength(*description) > kDescriptionMaxLength) {
        return {tooLong(loc, *description, kDescriptionMaxLength)};
    }
    return {};
}

QList<FieldError> validate(const TaskCreate &payload) {
    return validateFields(payload);
}

QList<FieldError> validate(const TaskUpdate &payload) {
    return validateFields(payload);
}

std::optional<bool> coerceBool(const QJsonValue &value) {
    if (value.isBool()) {
        return value.toBool();
    }

    if (value.isDouble()) {
        const double number = value.toDouble();
        if (number == 0.0) {
            return false;
        }
        if (number == 1.0) {
            return true;
        }
        return std::nullopt;
    }

    if (value.isString()) {
        const QString text = value.toString().trimmed().toLower();
        if (text == "true" || text == "1" || text == "yes" || text == "on" ||
            text == "t" || text == "y") {
            return true;
        }
        if (text == "false" || text == "0" || text == "no" || text == "off" ||
            text == "f" || text == "n") {
            return false;
        }
    }

    return std::nullopt;
}

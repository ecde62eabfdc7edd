#ifndef TODOBACKEND_UTILS_TIMESTAMP_HPP
#define TODOBACKEND_UTILS_TIMESTAMP_HPP

#include <QDateTime>
#include <QString>
#include <functional>

using Clock = std::function<QDateTime()>;

inline QDateTime systemUtcNow() {
    return QDateTime::currentDateTimeUtc();
}

// 2024-01-15T10:30:00+00:00, milliseconds dropped.
inline QString toIsoTimestamp(const QDateTime &moment) {
    return moment.toUTC().toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss")) +
           QStringLiteral("+00:00");
}

#endif // TODOBACKEND_UTILS_TIMESTAMP_HPP

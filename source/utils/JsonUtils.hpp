#ifndef TODOBACKEND_UTILS_JSONUTILS_HPP
#define TODOBACKEND_UTILS_JSONUTILS_HPP

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QtHttpServer/QHttpServerResponse>

inline QHttpServerResponse makeJson(const QJsonObject &obj,
                                    QHttpServerResponse::StatusCode status =
                                    QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json", QJsonDocument(obj).toJson(QJsonDocument::Compact),
        status);
}

// 204: status line and headers only.
inline QHttpServerResponse makeNoContent() {
    return QHttpServerResponse(QHttpServerResponse::StatusCode::NoContent);
}

#endif // TODOBACKEND_UTILS_JSONUTILS_HPP

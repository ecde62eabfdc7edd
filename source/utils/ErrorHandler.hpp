#ifndef TODOBACKEND_UTILS_ERRORHANDLER_HPP
#define TODOBACKEND_UTILS_ERRORHANDLER_HPP

#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QUuid>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>
#include <QtNetwork/QHttpHeaders>
#include <functional>

#include "Errors.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"

// Error bodies keep the {"detail": ...} shape existing clients parse.
inline QHttpServerResponse makeApiError(QHttpServerResponse::StatusCode status,
                                        const QJsonValue &detail) {
    return makeJson(QJsonObject{{"detail", detail}}, status);
}

inline QHttpServerResponse makeTaskNotFound() {
    return makeApiError(QHttpServerResponse::StatusCode::NotFound,
                        QStringLiteral("Task not found"));
}

inline QHttpServerResponse makeValidationError(const ValidationError &error) {
    return makeApiError(QHttpServerResponse::StatusCode::UnprocessableEntity,
                        error.toJson());
}

// Runs one handler: tags it with a request id, maps ValidationError to 422
// and any other exception to 500, and logs the outcome with its duration.
template <typename Fn>
inline QHttpServerResponse runSafe(const char *routeName, Fn &&fn) {
    const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const qint64 started = QDateTime::currentMSecsSinceEpoch();

    QHttpServerResponse resp = [&]() -> QHttpServerResponse {
        try {
            return fn(requestId);
        } catch (const ValidationError &e) {
            qWarning(appHttp) << "[422]" << routeName
                              << "| requestId=" << requestId
                              << "| what=" << e.what();
            return makeValidationError(e);
        } catch (const std::exception &e) {
            qCritical(appHttp) << "[EXC]" << routeName
                               << "| requestId=" << requestId
                               << "| what=" << e.what();
            return makeApiError(QHttpServerResponse::StatusCode::InternalServerError,
                                QStringLiteral("Internal Server Error"));
        }
    }();

    QHttpHeaders headers = resp.headers();
    headers.append(QByteArrayLiteral("X-Request-Id"), requestId);
    resp.setHeaders(std::move(headers));

    qInfo(appHttp) << "[DONE]" << routeName
                   << "| status=" << static_cast<int>(resp.statusCode())
                   << "| requestId=" << requestId
                   << "| ms=" << (QDateTime::currentMSecsSinceEpoch() - started);
    return resp;
}

// ─────────────────────────────────────────────────────────────────────────────
// Safe wrapper overloads with fixed signatures
// ─────────────────────────────────────────────────────────────────────────────

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QString &requestId)> fn) {
    return [routeName, fn]() -> QHttpServerResponse {
        return runSafe(routeName, fn);
    };
}

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QHttpServerRequest &request,
                                                       const QString &requestId)> fn) {
    return [routeName, fn](const QHttpServerRequest &request) -> QHttpServerResponse {
        return runSafe(routeName, [&](const QString &requestId) {
            return fn(request, requestId);
        });
    };
}

inline auto wrapSafe(const char *routeName,
                     std::function<QHttpServerResponse(const QString &pathArg,
                                                       const QHttpServerRequest &request,
                                                       const QString &requestId)> fn) {
    return [routeName, fn](const QString &pathArg,
                           const QHttpServerRequest &request) -> QHttpServerResponse {
        return runSafe(routeName, [&](const QString &requestId) {
            return fn(pathArg, request, requestId);
        });
    };
}

inline QHttpServerResponse makeRouteNotFound(const QHttpServerRequest &request) {
    qWarning(appHttp) << "404 no route for" << toString(request.method())
                      << request.url().toString();
    return makeApiError(QHttpServerResponse::StatusCode::NotFound,
                        QStringLiteral("Not Found"));
}

#endif // TODOBACKEND_UTILS_ERRORHANDLER_HPP

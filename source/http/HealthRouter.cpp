#include "HealthRouter.hpp"

#include <QJsonObject>

#include "ErrorHandler.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"

void HealthRouter::registerRoutes(QHttpServer &server) {
    server.route(
        "/", QHttpServerRequest::Method::Get,
        wrapSafe("GET /",
                 std::function<QHttpServerResponse(const QString &)>(
                     [](const QString &requestId) {
                         qDebug(appHttp) << "[GET] / | requestId=" << requestId;
                         return makeJson(QJsonObject{{"message", "Healthy"}});
                     })));
}

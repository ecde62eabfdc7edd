#include <QJsonObject>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>

#include "ErrorHandler.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"
#include "TaskPayloadParser.hpp"
#include "TaskRouter.hpp"

TaskRouter::TaskRouter(std::shared_ptr<ITaskService> service)
    : m_service(std::move(service)) {}

void TaskRouter::registerRoutes(QHttpServer &server) {
    using RequestHandler = std::function<QHttpServerResponse(
        const QHttpServerRequest &, const QString &)>;
    using PathHandler = std::function<QHttpServerResponse(
        const QString &, const QHttpServerRequest &, const QString &)>;

    const auto mirrorRoute = [&server](const char *path,
                                       QHttpServerRequest::Method method,
                                       auto handler) {
        server.route(path, method, handler);
        QString withSlash = QString::fromLatin1(path);
        if (!withSlash.endsWith('/')) {
            withSlash.append('/');
        }

        server.route(withSlash, method, handler);
    };

    // ─────────────────────────────────────────────────────────────────────────────
    // GET /tasks
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/tasks", QHttpServerRequest::Method::Get,
        wrapSafe("GET /tasks",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     qInfo(appHttp) << "[GET] /tasks"
                                    << "url:" << request.url().toString()
                                    << "| requestId=" << requestId;

                     return makeJson(m_service->listTasks().toJson());
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // POST /tasks
    // ─────────────────────────────────────────────────────────────────────────────
    mirrorRoute(
        "/tasks", QHttpServerRequest::Method::Post,
        wrapSafe("POST /tasks",
                 RequestHandler([this](const QHttpServerRequest &request,
                                       const QString &requestId) {
                     qInfo(appHttp) << "[POST] /tasks"
                                    << "bytes=" << request.body().size()
                                    << "| requestId=" << requestId;

                     const TaskCreate payload = parseTaskCreate(request.body());
                     const Task created = m_service->createTask(payload);

                     return makeJson(created.toJson(),
                                     QHttpServerResponse::StatusCode::Created);
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // PUT /tasks/<id>
    // ─────────────────────────────────────────────────────────────────────────────
    server.route(
        "/tasks/<arg>", QHttpServerRequest::Method::Put,
        wrapSafe("PUT /tasks/{id}",
                 PathHandler([this](const QString &idArg,
                                    const QHttpServerRequest &request,
                                    const QString &requestId) {
                     qInfo(appHttp) << "[PUT] /tasks/" << idArg
                                    << "bytes=" << request.body().size()
                                    << "| requestId=" << requestId;

                     const auto [taskId, payload] =
                         parseTaskUpdateRequest(idArg, request.body());

                     const auto updated = m_service->replaceTask(taskId, payload);
                     if (!updated) {
                         return makeTaskNotFound();
                     }

                     return makeJson(updated->toJson());
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // PATCH /tasks/<id>/complete
    // ─────────────────────────────────────────────────────────────────────────────
    server.route(
        "/tasks/<arg>/complete", QHttpServerRequest::Method::Patch,
        wrapSafe("PATCH /tasks/{id}/complete",
                 PathHandler([this](const QString &idArg,
                                    const QHttpServerRequest &request,
                                    const QString &requestId) {
                     qInfo(appHttp) << "[PATCH] /tasks/" << idArg << "/complete"
                                    << "bytes=" << request.body().size()
                                    << "| requestId=" << requestId;

                     const auto [taskId, payload] =
                         parseTaskCompletionRequest(idArg, request.body());

                     const auto response =
                         m_service->setTaskCompletion(taskId, payload);
                     if (!response) {
                         return makeTaskNotFound();
                     }

                     return makeJson(response->toJson());
                 })));

    // ─────────────────────────────────────────────────────────────────────────────
    // DELETE /tasks/<id>
    // ─────────────────────────────────────────────────────────────────────────────
    server.route(
        "/tasks/<arg>", QHttpServerRequest::Method::Delete,
        wrapSafe("DELETE /tasks/{id}",
                 PathHandler([this](const QString &idArg,
                                    const QHttpServerRequest &request,
                                    const QString &requestId) {
                     qInfo(appHttp) << "[DELETE] /tasks/" << idArg
                                    << "url:" << request.url().toString()
                                    << "| requestId=" << requestId;

                     const qint64 taskId = parseTaskId(idArg);
                     if (!m_service->deleteTask(taskId)) {
                         return makeTaskNotFound();
                     }

                     return makeNoContent();
                 })));
}

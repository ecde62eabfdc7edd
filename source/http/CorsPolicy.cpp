#include "CorsPolicy.hpp"

#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponder>
#include <QtHttpServer/QHttpServerResponse>

#include "ErrorHandler.hpp"
#include "Logger.hpp"

namespace {

constexpr auto kAllowedMethods = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";
constexpr auto kPreflightMaxAge = "600";

QByteArray headerValue(const QHttpServerRequest &request, const char *name) {
    return request.headers().value(name).toByteArray();
}

} // END NAMESPACE

void applyCorsHeaders(const QHttpServerRequest &request, QHttpHeaders &headers) {
    const QByteArray origin = headerValue(request, "Origin");
    if (origin.isEmpty()) {
        return;
    }

    // Credentialed requests cannot use the wildcard, so echo the origin back.
    const bool credentialed = !headerValue(request, "Cookie").isEmpty();
    headers.replaceOrAppend(QHttpHeaders::WellKnownHeader::AccessControlAllowOrigin,
                            credentialed ? origin : QByteArrayLiteral("*"));
    headers.replaceOrAppend(
        QHttpHeaders::WellKnownHeader::AccessControlAllowCredentials, "true");
    if (credentialed) {
        headers.append(QHttpHeaders::WellKnownHeader::Vary, "Origin");
    }
}

QHttpServerResponse makePreflightResponse(const QHttpServerRequest &request) {
    QHttpServerResponse response(QByteArrayLiteral("text/plain"),
                                 QByteArrayLiteral("OK"),
                                 QHttpServerResponse::StatusCode::Ok);

    QHttpHeaders headers = response.headers();
    const QByteArray origin = headerValue(request, "Origin");
    if (!origin.isEmpty()) {
        headers.replaceOrAppend(
            QHttpHeaders::WellKnownHeader::AccessControlAllowOrigin, origin);
        headers.replaceOrAppend(
            QHttpHeaders::WellKnownHeader::AccessControlAllowCredentials, "true");
        headers.append(QHttpHeaders::WellKnownHeader::Vary, "Origin");
    }

    headers.replaceOrAppend(QHttpHeaders::WellKnownHeader::AccessControlAllowMethods,
                            kAllowedMethods);

    const QByteArray requested = headerValue(request, "Access-Control-Request-Headers");
    if (!requested.isEmpty()) {
        headers.replaceOrAppend(
            QHttpHeaders::WellKnownHeader::AccessControlAllowHeaders, requested);
    }
    headers.replaceOrAppend(QHttpHeaders::WellKnownHeader::AccessControlMaxAge,
                            kPreflightMaxAge);

    response.setHeaders(std::move(headers));
    return response;
}

void installCorsPolicy(QHttpServer &server) {
    server.addAfterRequestHandler(
        &server, [](const QHttpServerRequest &request, QHttpServerResponse &response) {
            QHttpHeaders headers = response.headers();
            applyCorsHeaders(request, headers);
            response.setHeaders(std::move(headers));
        });

    server.setMissingHandler(&server, [](const QHttpServerRequest &request,
                                         QHttpServerResponder &responder) {
        if (request.method() == QHttpServerRequest::Method::Options) {
            qDebug(appHttp) << "[OPTIONS] preflight" << request.url().path();
            responder.sendResponse(makePreflightResponse(request));
            return;
        }

        QHttpServerResponse response = makeRouteNotFound(request);
        QHttpHeaders headers = response.headers();
        applyCorsHeaders(request, headers);
        response.setHeaders(std::move(headers));
        responder.sendResponse(response);
    });

    qInfo(appHttp) << "CORS: all origins, methods and headers allowed";
}

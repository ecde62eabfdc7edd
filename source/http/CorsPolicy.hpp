#ifndef TODOBACKEND_HTTP_CORSPOLICY_HPP
#define TODOBACKEND_HTTP_CORSPOLICY_HPP

#include <QtHttpServer/QHttpServer>
#include <QtNetwork/QHttpHeaders>

// Every origin, method and header is allowed; the deployment boundary is
// enforced elsewhere. Headers are only added to requests that carry Origin.
void applyCorsHeaders(const QHttpServerRequest &request, QHttpHeaders &headers);

// 200 answer to an OPTIONS preflight on any path.
QHttpServerResponse makePreflightResponse(const QHttpServerRequest &request);

// Adds CORS headers to every routed response and installs the fallback
// handler: preflight for OPTIONS, {"detail": "Not Found"} otherwise.
void installCorsPolicy(QHttpServer &server);

#endif // TODOBACKEND_HTTP_CORSPOLICY_HPP

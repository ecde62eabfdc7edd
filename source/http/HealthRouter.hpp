#ifndef TODOBACKEND_HTTP_HEALTHROUTER_HPP
#define TODOBACKEND_HTTP_HEALTHROUTER_HPP

#include "IRouter.hpp"

// GET / -> {"message": "Healthy"}
class HealthRouter : public IRouter {
public:
    void registerRoutes(QHttpServer &server) override;
};

#endif // TODOBACKEND_HTTP_HEALTHROUTER_HPP

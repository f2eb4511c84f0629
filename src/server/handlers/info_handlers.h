#pragma once

/// @file info_handlers.h
/// @brief Read-only service endpoints

#include "server/handlers/handler_base.h"

namespace promptguard::server::handlers {

/// @brief Liveness probe: GET /health
class HealthHandler : public Handler {
public:
    HttpResponse Handle(const HttpRequest& request,
                        const HandlerContext& context) override;

    std::string GetRoute() const override { return "/health"; }
    std::vector<HttpMethod> GetMethods() const override {
        return {HttpMethod::kGet};
    }
};

/// @brief Rule catalog: GET /v1/patterns
class PatternsHandler : public Handler {
public:
    HttpResponse Handle(const HttpRequest& request,
                        const HandlerContext& context) override;

    std::string GetRoute() const override { return "/v1/patterns"; }
    std::vector<HttpMethod> GetMethods() const override {
        return {HttpMethod::kGet};
    }
};

/// @brief Prometheus exposition: GET /metrics
class MetricsHandler : public Handler {
public:
    HttpResponse Handle(const HttpRequest& request,
                        const HandlerContext& context) override;

    std::string GetRoute() const override { return "/metrics"; }
    std::vector<HttpMethod> GetMethods() const override {
        return {HttpMethod::kGet};
    }
};

}  // namespace promptguard::server::handlers

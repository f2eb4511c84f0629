#pragma once

/// @file classify_handler.h
/// @brief Classification handlers

#include "server/handlers/handler_base.h"

namespace promptguard::server::handlers {

/// @brief Classify one text: POST /v1/classify
///
/// Body: {"input": string, "threshold"?: number, "include_features"?: bool}
class ClassifyHandler : public Handler {
public:
    HttpResponse Handle(const HttpRequest& request,
                        const HandlerContext& context) override;

    std::string GetRoute() const override { return "/v1/classify"; }
    std::vector<HttpMethod> GetMethods() const override {
        return {HttpMethod::kPost};
    }
};

/// @brief Classify up to max_batch_inputs texts: POST /v1/batch
///
/// Body: {"inputs": [string, ...], "threshold"?: number}. Each result echoes a
/// truncated copy of its input and never carries features.
class BatchClassifyHandler : public Handler {
public:
    HttpResponse Handle(const HttpRequest& request,
                        const HandlerContext& context) override;

    std::string GetRoute() const override { return "/v1/batch"; }
    std::vector<HttpMethod> GetMethods() const override {
        return {HttpMethod::kPost};
    }
};

}  // namespace promptguard::server::handlers

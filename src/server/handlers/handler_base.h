#pragma once

/// @file handler_base.h
/// @brief Base handler interface for the classification API
///
/// Handlers see plain request/response structs rather than the socket
/// library's types, so every route can be driven directly from tests.

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "classifier/risk_classifier.h"
#include "common/thread_pool.h"
#include "server/server_config.h"

namespace promptguard::server::handlers {

/// @brief HTTP method enum
enum class HttpMethod {
    kGet,
    kPost,
    kOptions
};

/// @brief "GET", "POST" or "OPTIONS"
const char* HttpMethodName(HttpMethod method);

/// @brief HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::kGet;
    std::string path;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    /// @brief Header lookup ignoring case; empty when absent
    std::string GetHeader(const std::string& name) const;
};

/// @brief HTTP response
struct HttpResponse {
    int status_code = 200;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
    std::string content_type = "application/json";

    static HttpResponse Ok(const nlohmann::json& body);
    static HttpResponse Text(std::string body, std::string content_type);
    static HttpResponse Error(int status_code, const std::string& message);

    static HttpResponse BadRequest(const std::string& message) {
        return Error(400, message);
    }

    static HttpResponse NotFound(const std::string& message = "Endpoint not found") {
        return Error(404, message);
    }

    static HttpResponse MethodNotAllowed() {
        return Error(405, "Method not allowed");
    }

    static HttpResponse PayloadTooLarge();

    /// @brief Generic 500; internal detail is logged, never returned
    static HttpResponse InternalError() {
        return Error(500, "Internal server error");
    }

    /// @brief Status to HTTP error response (see HttpStatusFromStatus)
    static HttpResponse FromStatus(const absl::Status& status);
};

/// @brief Serialize JSON for the wire; invalid UTF-8 is replaced, not thrown
std::string DumpJson(const nlohmann::json& value);

/// @brief Handler context with shared resources
struct HandlerContext {
    std::shared_ptr<const classifier::RiskClassifier> classifier;
    ThreadPool* pool = nullptr;  ///< Batch fan-out; inline when null
    ServerConfig config;
};

/// @brief Base handler interface
class Handler {
public:
    virtual ~Handler() = default;

    /// @brief Handle the request
    virtual HttpResponse Handle(const HttpRequest& request,
                                const HandlerContext& context) = 0;

    /// @brief Get the route path (e.g., "/v1/classify")
    virtual std::string GetRoute() const = 0;

    /// @brief Get supported HTTP methods
    virtual std::vector<HttpMethod> GetMethods() const = 0;

protected:
    /// @brief Require a JSON media type (application/json or */*+json)
    absl::Status RequireJsonContentType(const HttpRequest& request) const;

    /// @brief Parse the body, requiring a JSON object
    absl::StatusOr<nlohmann::json> ParseJsonBody(const HttpRequest& request) const;

    /// @brief Read the optional "threshold" field
    /// @return default_value when absent, InvalidArgument when it is not a
    ///         number in [0, 1] (booleans are rejected)
    absl::StatusOr<double> ExtractThreshold(const nlohmann::json& body,
                                            double default_value) const;
};

/// @brief Register all handlers with the router
class HandlerRegistry {
public:
    void Register(std::unique_ptr<Handler> handler) {
        handlers_.push_back(std::move(handler));
    }

    const std::vector<std::unique_ptr<Handler>>& GetHandlers() const {
        return handlers_;
    }

    /// @brief Handler serving path, regardless of method
    Handler* FindByRoute(const std::string& path) const;

    /// @brief Route a request: 404 for an unknown path, 405 for a method the
    ///        route does not accept
    HttpResponse Dispatch(const HttpRequest& request, const HandlerContext& context) const;

private:
    std::vector<std::unique_ptr<Handler>> handlers_;
};

/// @brief Register the health, classify, batch, patterns and metrics handlers
void RegisterDefaultHandlers(HandlerRegistry& registry);

}  // namespace promptguard::server::handlers

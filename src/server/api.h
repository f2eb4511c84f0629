#pragma once

/// @file api.h
/// @brief promptguard classification API server

#include <memory>
#include <string>

#include <absl/status/status.h>

#include "classifier/risk_classifier.h"
#include "server/handlers/handler_base.h"
#include "server/server_config.h"

namespace promptguard::server {

/// @brief HTTP front end of the classifier
///
/// Routes every request through a HandlerRegistry, applies the body size
/// limit and CORS headers, and records request metrics. Serving happens on a
/// background thread between Start() and Stop().
class ClassifierAPI {
public:
    /// @brief Create the API with given configuration and classifier
    ClassifierAPI(ServerConfig config,
                  std::shared_ptr<const classifier::RiskClassifier> classifier);

    ~ClassifierAPI();

    // Non-copyable
    ClassifierAPI(const ClassifierAPI&) = delete;
    ClassifierAPI& operator=(const ClassifierAPI&) = delete;

    /// @brief Bind the listening socket and start serving
    /// @return Unavailable if the address cannot be bound,
    ///         FailedPrecondition if already running
    absl::Status Start();

    /// @brief Stop serving and join the server thread
    absl::Status Stop();

    /// @brief Check if the server is running
    bool IsRunning() const;

    /// @brief Bound port (the ephemeral one when configured with port 0)
    int GetPort() const;

    /// @brief Get the server address
    std::string GetAddress() const;

    /// @brief Route a request without a socket (used by tests and the
    ///        server's own callbacks)
    handlers::HttpResponse HandleRequest(const handlers::HttpRequest& request) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace promptguard::server

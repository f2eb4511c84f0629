#include "server/api.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

#include <absl/strings/str_cat.h>
#include <httplib.h>

#include "common/logging.h"
#include "common/metrics.h"
#include "common/thread_pool.h"

namespace promptguard::server {

using handlers::HttpMethod;
using handlers::HttpRequest;
using handlers::HttpResponse;

// =============================================================================
// ClassifierAPI Implementation
// =============================================================================

class ClassifierAPI::Impl {
public:
    Impl(ServerConfig config,
         std::shared_ptr<const classifier::RiskClassifier> classifier)
        : pool_(std::make_unique<ThreadPool>(config.batch_workers)) {
        context_.classifier = std::move(classifier);
        context_.pool = pool_.get();
        context_.config = std::move(config);
        handlers::RegisterDefaultHandlers(registry_);
    }

    ~Impl() {
        auto status = Stop();
        if (!status.ok()) {
            PROMPTGUARD_LOG_ERROR("Error stopping API server: {}", status.message());
        }
    }

    absl::Status Start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_.load()) {
            return absl::FailedPreconditionError("Server already running");
        }
        // A listen loop that ended on its own leaves its thread to be joined
        ReleaseServer();

        const auto& config = context_.config;
        http_server_ = std::make_unique<httplib::Server>();
        http_server_->set_read_timeout(config.read_timeout_seconds, 0);
        http_server_->set_write_timeout(config.write_timeout_seconds, 0);
        http_server_->set_payload_max_length(config.max_request_body_bytes);

        auto route = [this](HttpMethod method) {
            return [this, method](const httplib::Request& req, httplib::Response& res) {
                HttpRequest request;
                request.method = method;
                request.path = req.path;
                request.body = req.body;
                for (const auto& [name, value] : req.headers) {
                    request.headers.emplace(name, value);
                }
                WriteResponse(HandleRequest(request), res);
            };
        };
        http_server_->Get(".*", route(HttpMethod::kGet));
        http_server_->Post(".*", route(HttpMethod::kPost));
        http_server_->Options(".*", route(HttpMethod::kOptions));

        // Fills in bodies for errors raised inside httplib (oversized payload,
        // malformed request line)
        http_server_->set_error_handler([this](const httplib::Request& req,
                                               httplib::Response& res) {
            if (!res.body.empty()) {
                return;
            }
            PROMPTGUARD_COUNTER("promptguard_http_errors_total").Increment();
            HttpResponse response = res.status == 413
                ? HttpResponse::PayloadTooLarge()
                : HttpResponse::Error(res.status, "Bad request");
            ApplyCors(req.get_header_value("Origin"), response);
            WriteResponse(response, res);
        });

        if (config.port == 0) {
            const int port = http_server_->bind_to_any_port(config.host);
            if (port < 0) {
                http_server_.reset();
                return absl::UnavailableError(
                    absl::StrCat("Failed to bind ", config.host, " to an ephemeral port"));
            }
            bound_port_ = port;
        } else {
            if (!http_server_->bind_to_port(config.host, config.port)) {
                http_server_.reset();
                return absl::UnavailableError(
                    absl::StrCat("Failed to bind ", config.host, ":", config.port));
            }
            bound_port_ = config.port;
        }

        running_ = true;
        http_thread_ = std::thread([this]() {
            if (!http_server_->listen_after_bind()) {
                PROMPTGUARD_LOG_ERROR("HTTP server on {} stopped unexpectedly", GetAddress());
                PROMPTGUARD_GAUGE("promptguard_up").Set(0.0);
            }
            running_ = false;
        });

        PROMPTGUARD_GAUGE("promptguard_up").Set(1.0);
        PROMPTGUARD_GAUGE("promptguard_detection_rules")
            .Set(static_cast<double>(context_.classifier->Rules().Size()));
        PROMPTGUARD_LOG_INFO("Classification API listening on {} ({} batch workers)",
                             GetAddress(), pool_->Size());
        return absl::OkStatus();
    }

    absl::Status Stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!http_server_) {
            return absl::OkStatus();
        }

        PROMPTGUARD_LOG_INFO("Stopping classification API");
        ReleaseServer();
        running_ = false;
        PROMPTGUARD_GAUGE("promptguard_up").Set(0.0);
        return absl::OkStatus();
    }

    bool IsRunning() const { return running_.load(); }

    int GetPort() const { return bound_port_.load(); }

    std::string GetAddress() const {
        return absl::StrCat(context_.config.host, ":", bound_port_.load());
    }

    HttpResponse HandleRequest(const HttpRequest& request) const {
        PROMPTGUARD_COUNTER("promptguard_http_requests_total").Increment();
        auto& in_flight = PROMPTGUARD_GAUGE("promptguard_http_requests_in_flight");
        in_flight.Increment();

        HttpResponse response;
        if (request.method == HttpMethod::kOptions) {
            response.status_code = 204;
            response.content_type.clear();
            ApplyPreflight(request.GetHeader("Origin"), response);
        } else if (request.body.size() > context_.config.max_request_body_bytes) {
            response = HttpResponse::PayloadTooLarge();
        } else {
            response = registry_.Dispatch(request, context_);
        }

        if (response.status_code >= 400) {
            PROMPTGUARD_COUNTER("promptguard_http_errors_total").Increment();
        }
        ApplyCors(request.GetHeader("Origin"), response);
        in_flight.Decrement();
        return response;
    }

private:
    /// Echo an allowed origin ("*" when every origin is allowed)
    std::string AllowedOrigin(const std::string& origin) const {
        const auto& allowed = context_.config.allowed_origins;
        if (std::find(allowed.begin(), allowed.end(), "*") != allowed.end()) {
            return "*";
        }
        if (!origin.empty() && context_.config.IsOriginAllowed(origin)) {
            return origin;
        }
        return "";
    }

    void ApplyCors(const std::string& origin, HttpResponse& response) const {
        const std::string allowed = AllowedOrigin(origin);
        if (allowed.empty()) {
            return;
        }
        response.headers["Access-Control-Allow-Origin"] = allowed;
        if (allowed != "*") {
            response.headers["Vary"] = "Origin";
        }
    }

    void ApplyPreflight(const std::string& origin, HttpResponse& response) const {
        if (AllowedOrigin(origin).empty()) {
            return;
        }
        response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
        response.headers["Access-Control-Allow-Headers"] = "Content-Type";
        response.headers["Access-Control-Max-Age"] = "86400";
    }

    void ReleaseServer() {
        if (http_server_) {
            http_server_->stop();
        }
        if (http_thread_.joinable()) {
            http_thread_.join();
        }
        http_server_.reset();
    }

    static void WriteResponse(const HttpResponse& response, httplib::Response& res) {
        res.status = response.status_code;
        for (const auto& [name, value] : response.headers) {
            res.set_header(name, value);
        }
        if (!response.content_type.empty()) {
            res.set_content(response.body, response.content_type);
        }
    }

    std::unique_ptr<ThreadPool> pool_;
    handlers::HandlerContext context_;
    handlers::HandlerRegistry registry_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<httplib::Server> http_server_;
    std::thread http_thread_;
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{0};
};

ClassifierAPI::ClassifierAPI(
    ServerConfig config,
    std::shared_ptr<const classifier::RiskClassifier> classifier)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(classifier))) {}

ClassifierAPI::~ClassifierAPI() = default;

absl::Status ClassifierAPI::Start() {
    return impl_->Start();
}

absl::Status ClassifierAPI::Stop() {
    return impl_->Stop();
}

bool ClassifierAPI::IsRunning() const {
    return impl_->IsRunning();
}

int ClassifierAPI::GetPort() const {
    return impl_->GetPort();
}

std::string ClassifierAPI::GetAddress() const {
    return impl_->GetAddress();
}

handlers::HttpResponse ClassifierAPI::HandleRequest(
    const handlers::HttpRequest& request) const {
    return impl_->HandleRequest(request);
}

}  // namespace promptguard::server

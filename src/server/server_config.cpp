/// @file server_config.cpp
/// @brief Service configuration loading and validation

#include "server/server_config.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace promptguard::server {

absl::StatusOr<ServerConfig> ServerConfig::FromConfig(const Config& config) {
    ServerConfig result;

    result.host = config.GetString("server.host", result.host);

    const int64_t port = config.GetInt("server.port", result.port);
    if (port < 0 || port > 65535) {
        return ConfigurationError(absl::StrCat("server.port out of range: ", port));
    }
    result.port = static_cast<int>(port);

    const int64_t max_body = config.GetInt(
        "server.max_request_body_bytes", static_cast<int64_t>(result.max_request_body_bytes));
    if (max_body <= 0) {
        return ConfigurationError("server.max_request_body_bytes must be positive");
    }
    result.max_request_body_bytes = static_cast<size_t>(max_body);

    result.read_timeout_seconds = static_cast<int>(
        config.GetInt("server.read_timeout_seconds", result.read_timeout_seconds));
    result.write_timeout_seconds = static_cast<int>(
        config.GetInt("server.write_timeout_seconds", result.write_timeout_seconds));

    if (config.HasKey("server.cors.allowed_origins")) {
        result.allowed_origins = config.GetStringList("server.cors.allowed_origins");
    }

    result.default_threshold =
        config.GetDouble("classifier.default_threshold", result.default_threshold);

    const int64_t max_inputs = config.GetInt(
        "batch.max_inputs", static_cast<int64_t>(result.max_batch_inputs));
    const int64_t echo_length = config.GetInt(
        "batch.echo_length", static_cast<int64_t>(result.batch_echo_length));
    const int64_t workers = config.GetInt("batch.workers", 0);
    if (max_inputs <= 0) {
        return ConfigurationError("batch.max_inputs must be positive");
    }
    if (echo_length < 0) {
        return ConfigurationError("batch.echo_length must not be negative");
    }
    if (workers < 0) {
        return ConfigurationError("batch.workers must not be negative");
    }
    result.max_batch_inputs = static_cast<size_t>(max_inputs);
    result.batch_echo_length = static_cast<size_t>(echo_length);
    result.batch_workers = static_cast<size_t>(workers);

    result.logging.level = ParseLogLevel(config.GetString("logging.level", "info"));
    result.logging.enable_file = config.GetBool("logging.file.enabled", false);
    result.logging.file_path = config.GetString("logging.file.path", result.logging.file_path);

    PROMPTGUARD_RETURN_IF_ERROR(result.Validate());
    return result;
}

absl::Status ServerConfig::Validate() const {
    if (host.empty()) {
        return ConfigurationError("server.host must not be empty");
    }
    if (port < 0 || port > 65535) {
        return ConfigurationError(absl::StrCat("server.port out of range: ", port));
    }
    if (!(default_threshold >= 0.0 && default_threshold <= 1.0)) {
        return ConfigurationError(absl::StrCat(
            "classifier.default_threshold must be between 0 and 1, got ", default_threshold));
    }
    if (max_batch_inputs == 0) {
        return ConfigurationError("batch.max_inputs must be positive");
    }
    if (max_request_body_bytes == 0) {
        return ConfigurationError("server.max_request_body_bytes must be positive");
    }
    if (read_timeout_seconds <= 0 || write_timeout_seconds <= 0) {
        return ConfigurationError("server timeouts must be positive");
    }
    return absl::OkStatus();
}

bool ServerConfig::IsOriginAllowed(const std::string& origin) const {
    for (const auto& allowed : allowed_origins) {
        if (allowed == "*" || allowed == origin) {
            return true;
        }
    }
    return false;
}

}  // namespace promptguard::server

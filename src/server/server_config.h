#pragma once

/// @file server_config.h
/// @brief Typed configuration of the classification service

#include <cstdint>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "common/logging.h"

namespace promptguard::server {

/// @brief Service configuration
///
/// Built from a Config tree by FromConfig(); every field has the default the
/// service uses when the key is absent.
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 5000;  ///< 0 binds an ephemeral port

    size_t max_request_body_bytes = 1024 * 1024;
    int read_timeout_seconds = 30;
    int write_timeout_seconds = 30;

    /// Origins answered with Access-Control-Allow-Origin ("*" = any)
    std::vector<std::string> allowed_origins = {"*"};

    double default_threshold = 0.7;

    size_t max_batch_inputs = 100;
    size_t batch_echo_length = 100;  ///< Code points of each input echoed back
    size_t batch_workers = 0;        ///< 0 = hardware concurrency

    LogConfig logging;

    /// @brief Read and validate the "server", "classifier", "batch" and
    ///        "logging" sections
    /// @return kConfigurationError on an out-of-range value
    static absl::StatusOr<ServerConfig> FromConfig(const Config& config);

    /// @brief Check ranges (port, threshold, limits)
    absl::Status Validate() const;

    /// @brief Whether a request Origin may be echoed in CORS headers
    bool IsOriginAllowed(const std::string& origin) const;
};

}  // namespace promptguard::server

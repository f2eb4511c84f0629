/// @file main.cpp
/// @brief promptguard classification server entry point

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>
#include <absl/strings/str_join.h>

#include "classifier/risk_classifier.h"
#include "common/config.h"
#include "common/logging.h"
#include "server/api.h"
#include "server/server_config.h"

namespace {

constexpr char kVersion[] = "1.0.0";

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int /*signal*/) {
    g_shutdown_requested.store(true);
}

void PrintBanner() {
    std::cout << R"(
  ____                            _    ____                     _
 |  _ \ _ __ ___  _ __ ___  _ __ | |_ / ___|_   _  __ _ _ __ __| |
 | |_) | '__/ _ \| '_ ` _ \| '_ \| __| |  _| | | |/ _` | '__/ _` |
 |  __/| | | (_) | | | | | | |_) | |_| |_| | |_| | (_| | | | (_| |
 |_|   |_|  \___/|_| |_| |_| .__/ \__|\____|\__,_|\__,_|_|  \__,_|
                           |_|
  Prompt Injection Risk Classifier

  GET  /health        Health check
  POST /v1/classify   Classify a single input
  POST /v1/batch      Classify multiple inputs
  GET  /v1/patterns   List detection patterns
  GET  /metrics       Prometheus metrics
)" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"promptguard server - HTTP prompt injection risk classifier"};

    std::string config_path;
    std::string host;
    int port = 0;
    std::string log_level;
    double threshold = 0.0;
    size_t workers = 0;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file")
        ->check(CLI::ExistingFile);
    auto* host_opt = app.add_option("--host", host, "Listen address");
    auto* port_opt = app.add_option("--port", port, "Listen port (0 = ephemeral)")
        ->check(CLI::Range(0, 65535));
    auto* level_opt = app.add_option("--log-level", log_level,
                                     "Log level (trace, debug, info, warn, error, critical, off)");
    auto* threshold_opt = app.add_option("--threshold", threshold,
                                         "Default decision threshold (0.0-1.0)")
        ->check(CLI::Range(0.0, 1.0));
    auto* workers_opt = app.add_option("--workers", workers,
                                       "Batch worker threads (0 = hardware concurrency)");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "promptguard server v" << kVersion << std::endl;
        return 0;
    }

    // Defaults < YAML file < environment < command line
    promptguard::Config config;
    if (!config_path.empty()) {
        auto loaded = promptguard::Config::LoadFromFile(config_path);
        if (!loaded.ok()) {
            std::cerr << "Failed to load config: " << loaded.status().message() << std::endl;
            return 1;
        }
        config = std::move(*loaded);
    }
    config.Merge(promptguard::Config::LoadFromEnvironment("PROMPTGUARD_"));

    if (host_opt->count() > 0) {
        config.Set("server.host", host);
    }
    if (port_opt->count() > 0) {
        config.Set("server.port", static_cast<int64_t>(port));
    }
    if (level_opt->count() > 0) {
        config.Set("logging.level", log_level);
    }
    if (threshold_opt->count() > 0) {
        config.Set("classifier.default_threshold", threshold);
    }
    if (workers_opt->count() > 0) {
        config.Set("batch.workers", static_cast<int64_t>(workers));
    }

    auto server_config = promptguard::server::ServerConfig::FromConfig(config);
    if (!server_config.ok()) {
        std::cerr << "Invalid configuration: " << server_config.status().message() << std::endl;
        return 1;
    }

    promptguard::LogConfig log_config = server_config->logging;
    log_config.name = "promptguard-server";
    promptguard::InitLogging(log_config);

    PrintBanner();
    PROMPTGUARD_LOG_INFO("promptguard server v{} starting...", kVersion);
    if (!config_path.empty()) {
        PROMPTGUARD_LOG_INFO("Loaded configuration from {}", config_path);
    }

    // Log configuration summary
    PROMPTGUARD_LOG_INFO("Configuration:");
    PROMPTGUARD_LOG_INFO("  Listen: {}:{}", server_config->host, server_config->port);
    PROMPTGUARD_LOG_INFO("  Default threshold: {:.2f}", server_config->default_threshold);
    PROMPTGUARD_LOG_INFO("  Max batch inputs: {}", server_config->max_batch_inputs);
    PROMPTGUARD_LOG_INFO("  Batch workers: {}", server_config->batch_workers == 0
                         ? std::string("auto") : std::to_string(server_config->batch_workers));
    PROMPTGUARD_LOG_INFO("  CORS origins: {}", absl::StrJoin(server_config->allowed_origins, ", "));
    PROMPTGUARD_LOG_INFO("  Log level: {}", promptguard::LogLevelToString(log_config.level));
    PROMPTGUARD_LOG_DEBUG("Effective configuration: {}", config.ToJson().dump());

    auto classifier = promptguard::classifier::RiskClassifier::Create();
    if (!classifier.ok()) {
        PROMPTGUARD_LOG_ERROR("Failed to build classifier: {}", classifier.status().message());
        return 1;
    }

    promptguard::server::ClassifierAPI api(
        std::move(*server_config),
        std::shared_ptr<const promptguard::classifier::RiskClassifier>(std::move(*classifier)));

    // Set up signal handlers
#ifdef _WIN32
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
#else
    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif

    auto status = api.Start();
    if (!status.ok()) {
        PROMPTGUARD_LOG_ERROR("Failed to start server: {}", status.message());
        return 1;
    }

    PROMPTGUARD_LOG_INFO("Server is running on {}. Press Ctrl+C to stop.", api.GetAddress());

    // Wait for shutdown signal
    while (!g_shutdown_requested.load() && api.IsRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    PROMPTGUARD_LOG_INFO("Shutdown requested");

    status = api.Stop();
    if (!status.ok()) {
        PROMPTGUARD_LOG_ERROR("Error during shutdown: {}", status.message());
    }

    PROMPTGUARD_LOG_INFO("Server stopped successfully");
    promptguard::ShutdownLogging();

    return 0;
}

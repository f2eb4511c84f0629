/// @file main.cpp
/// @brief promptguard-classify: classify texts from the command line
///
/// Each positional argument is classified; with none, each line of standard
/// input is. One verdict JSON object is printed per text.

#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "classifier/risk_classifier.h"
#include "common/logging.h"

int main(int argc, char* argv[]) {
    CLI::App app{"promptguard-classify - score texts for prompt injection risk"};

    std::vector<std::string> texts;
    double threshold = promptguard::classifier::kDefaultThreshold;
    bool include_features = false;
    bool pretty = false;
    std::string log_level = "warn";

    app.add_option("texts", texts, "Texts to classify (default: one per line of stdin)");
    app.add_option("--threshold", threshold, "Decision threshold (0.0-1.0)")
        ->check(CLI::Range(0.0, 1.0));
    app.add_flag("--features", include_features, "Include the feature vector in the output");
    app.add_flag("--pretty", pretty, "Indent JSON output");
    app.add_option("--log-level", log_level, "Log level for diagnostics on stderr");

    CLI11_PARSE(app, argc, argv);

    promptguard::LogConfig log_config;
    log_config.name = "promptguard-classify";
    log_config.level = promptguard::ParseLogLevel(log_level);
    log_config.console_stderr = true;
    promptguard::InitLogging(log_config);

    auto classifier = promptguard::classifier::RiskClassifier::Create();
    if (!classifier.ok()) {
        PROMPTGUARD_LOG_ERROR("Failed to build classifier: {}", classifier.status().message());
        return 1;
    }

    if (texts.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            texts.push_back(line);
        }
    }

    const int indent = pretty ? 2 : -1;
    for (const auto& text : texts) {
        auto verdict = (*classifier)->Classify(text, threshold);
        nlohmann::json output = promptguard::classifier::ToJson(verdict, include_features);
        std::cout << output.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace)
                  << '\n';
    }
    std::cout.flush();

    promptguard::ShutdownLogging();
    return 0;
}

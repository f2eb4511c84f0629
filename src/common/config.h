#pragma once

/// @file config.h
/// @brief Layered YAML configuration for the promptguard service
///
/// A Config is a YAML tree addressed with dotted keys ("server.port",
/// "batch.max_inputs"). The server stacks three layers with Merge(): the
/// YAML file, then PROMPTGUARD_* environment variables, then command-line
/// flags written with Set(). Getters never fail; a missing key or a value of
/// the wrong type yields the caller's default.

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace promptguard {

/// @brief Value accepted by Config::Set
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Dotted-key view over a YAML document
class Config {
public:
    Config() = default;

    /// @brief Parse a YAML file
    /// @return NotFound if the file does not exist, InvalidArgument if it is
    ///         not valid YAML
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Parse YAML text
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Collect overrides from the environment
    ///
    /// Recognised suffixes: SERVER_HOST, SERVER_PORT, LOG_LEVEL,
    /// DEFAULT_THRESHOLD, BATCH_WORKERS, CORS_ORIGINS (comma separated).
    /// Values that do not parse are skipped with a warning.
    static Config LoadFromEnvironment(std::string_view prefix = "PROMPTGUARD_");

    /// @brief Overlay other onto this config; maps merge recursively and
    ///        every other leaf replaces ours
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Scalar items of a sequence; empty when the key is absent
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief True when the key resolves to a non-null node
    bool HasKey(std::string_view key) const;

    /// @brief Write a value, creating intermediate maps as needed
    void Set(std::string_view key, ConfigValue value);

    /// @brief The whole tree as JSON (scalars typed best-effort), for logging
    nlohmann::json ToJson() const;

private:
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;

    YAML::Node root_;
};

}  // namespace promptguard

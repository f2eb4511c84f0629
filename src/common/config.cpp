#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "logging.h"

namespace promptguard {

namespace {

nlohmann::json ScalarToJson(const std::string& scalar) {
    int64_t as_int = 0;
    if (absl::SimpleAtoi(scalar, &as_int)) {
        return as_int;
    }
    double as_double = 0.0;
    if (absl::SimpleAtod(scalar, &as_double)) {
        return as_double;
    }
    if (scalar == "true" || scalar == "false") {
        return scalar == "true";
    }
    return scalar;
}

nlohmann::json YamlToJson(const YAML::Node& node) {
    if (node.IsMap()) {
        nlohmann::json object = nlohmann::json::object();
        for (const auto& kv : node) {
            object[kv.first.as<std::string>()] = YamlToJson(kv.second);
        }
        return object;
    }
    if (node.IsSequence()) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : node) {
            array.push_back(YamlToJson(item));
        }
        return array;
    }
    if (node.IsScalar()) {
        return ScalarToJson(node.Scalar());
    }
    return nullptr;
}

/// Typed scalar read; the fallback covers both absence and a bad conversion
template <typename T>
T ReadScalar(const std::optional<YAML::Node>& node, T fallback) {
    if (!node || !node->IsScalar()) {
        return fallback;
    }
    try {
        return node->as<T>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

std::optional<std::string> GetEnv(std::string_view prefix, std::string_view suffix) {
    const std::string name = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), absl::string_view(suffix.data(), suffix.size()));
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    Config config;
    try {
        config.root_ = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse ", path.string(), ": ", e.what()));
    }
    return config;
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    Config config;
    try {
        config.root_ = YAML::Load(std::string(yaml_content));
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
    return config;
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    // Plain string settings
    const std::pair<const char*, const char*> strings[] = {
        {"SERVER_HOST", "server.host"},
        {"LOG_LEVEL", "logging.level"},
    };
    for (const auto& [suffix, key] : strings) {
        if (auto value = GetEnv(prefix, suffix)) {
            config.Set(key, *value);
        }
    }

    // Integer settings
    const std::pair<const char*, const char*> integers[] = {
        {"SERVER_PORT", "server.port"},
        {"BATCH_WORKERS", "batch.workers"},
    };
    for (const auto& [suffix, key] : integers) {
        auto value = GetEnv(prefix, suffix);
        if (!value) {
            continue;
        }
        int64_t parsed = 0;
        if (absl::SimpleAtoi(*value, &parsed)) {
            config.Set(key, parsed);
        } else {
            PROMPTGUARD_LOG_WARN("Ignoring {}{}: '{}' is not an integer", prefix, suffix, *value);
        }
    }

    if (auto value = GetEnv(prefix, "DEFAULT_THRESHOLD")) {
        double threshold = 0.0;
        if (absl::SimpleAtod(*value, &threshold)) {
            config.Set("classifier.default_threshold", threshold);
        } else {
            PROMPTGUARD_LOG_WARN("Ignoring {}DEFAULT_THRESHOLD: '{}' is not a number",
                                 prefix, *value);
        }
    }

    if (auto value = GetEnv(prefix, "CORS_ORIGINS")) {
        std::vector<std::string> origins;
        for (absl::string_view origin : absl::StrSplit(*value, ',', absl::SkipWhitespace())) {
            origins.emplace_back(absl::StripAsciiWhitespace(origin));
        }
        config.Set("server.cors.allowed_origins", origins);
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node, const YAML::Node&)> overlay;
    overlay = [&overlay](YAML::Node base, const YAML::Node& top) {
        for (const auto& kv : top) {
            const std::string key = kv.first.as<std::string>();
            YAML::Node existing = base[key];
            if (existing.IsMap() && kv.second.IsMap()) {
                overlay(existing, kv.second);
            } else {
                base[key] = kv.second;
            }
        }
    };

    if (!other.root_.IsMap()) {
        return;
    }
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    overlay(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    // Node::operator= writes through to the referenced node, so walk with
    // reset() to keep root_ untouched.
    YAML::Node current;
    current.reset(root_);

    for (absl::string_view part : absl::StrSplit(absl::string_view(key.data(), key.size()), '.')) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& view = current;
        YAML::Node child = view[std::string(part)];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    return ReadScalar<std::string>(GetNestedNode(key), std::string(default_value));
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    return ReadScalar<int64_t>(GetNestedNode(key), default_value);
}

double Config::GetDouble(std::string_view key, double default_value) const {
    return ReadScalar<double>(GetNestedNode(key), default_value);
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    return ReadScalar<bool>(GetNestedNode(key), default_value);
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (!node || !node->IsSequence()) {
        return result;
    }
    for (const auto& item : *node) {
        if (item.IsScalar()) {
            result.push_back(item.Scalar());
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // Descend through maps, replacing any scalar that is in the way
    YAML::Node parent = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!parent[parts[i]].IsMap()) {
            parent[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node next = parent[parts[i]];
        parent.reset(next);
    }

    std::visit([&](const auto& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            parent[parts.back()] = seq;
        } else {
            parent[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return YamlToJson(root_);
}

}  // namespace promptguard

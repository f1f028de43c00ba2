#pragma once

#include <weft/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace weft {

//=============================================================================
// Config
//
// Read-only settings tree for a surface and the tools around it. Layers are
// applied once, at creation, lowest first:
//
//   built-in defaults
//   the file at configPath, or $XDG_CONFIG_HOME/weft/config.yaml if present
//   WEFT_<KEY> environment variables (existing leaves only)
//   overrides (command line flags)
//
// Keys are dotted paths into the tree: "surface.width" is surface: width:.
//=============================================================================
class Config {
public:
    using Ptr = std::shared_ptr<const Config>;

    static constexpr const char* KEY_SURFACE_WIDTH = "surface.width";
    static constexpr const char* KEY_SURFACE_HEIGHT = "surface.height";
    static constexpr const char* KEY_OPS_RESERVE_BYTES = "ops.reserve-bytes";
    static constexpr const char* KEY_OPS_RESERVE_REFS = "ops.reserve-refs";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

    static constexpr const char* ENV_PREFIX = "WEFT_";

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& overrides = YAML::Node()) noexcept;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // nullopt when the key is absent or its value doesn't convert to T
    template<typename T>
    std::optional<T> get(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& fallback) const {
        return get<T>(key).value_or(fallback);
    }

    bool has(const std::string& key) const;

    const YAML::Node& root() const { return _tree; }

    // File the tree was loaded from; empty when only defaults apply
    const std::filesystem::path& source() const { return _source; }

    // Effective settings as YAML text
    std::string dump() const;

    static std::filesystem::path getXDGConfigPath();

private:
    Config() : _tree(YAML::NodeType::Map) {}

    Result<void> readFile(const std::filesystem::path& path);
    YAML::Node lookup(const std::string& key) const;

    static YAML::Node defaults();
    static void overlay(YAML::Node into, const YAML::Node& from);
    static void overlayEnvironment(YAML::Node node, const std::string& key);
    static std::string envName(const std::string& key);

    YAML::Node _tree;
    std::filesystem::path _source;
};

template<typename T>
std::optional<T> Config::get(const std::string& key) const {
    YAML::Node node = lookup(key);
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

} // namespace weft

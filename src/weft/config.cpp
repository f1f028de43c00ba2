#include <weft/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace weft {

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& overrides) noexcept {
    std::shared_ptr<Config> config(new Config());
    try {
        overlay(config->_tree, defaults());

        std::error_code ec;
        if (!configPath.empty()) {
            if (auto res = config->readFile(configPath); !res) {
                return Err<Ptr>("Failed to load config " + configPath, res);
            }
        } else if (auto xdg = getXDGConfigPath(); std::filesystem::exists(xdg, ec)) {
            // a broken user file shouldn't keep the tools from starting
            if (auto res = config->readFile(xdg); !res) {
                ywarn("Ignoring {}: {}", xdg.string(), error_msg(res));
            }
        }
        if (!config->_source.empty()) {
            yinfo("Config loaded from {}", config->_source.string());
        }

        overlayEnvironment(config->_tree, "");

        if (overrides && overrides.IsMap()) {
            overlay(config->_tree, overrides);
        }
    } catch (const YAML::Exception& e) {
        // non-scalar keys and the like
        yerror("Config: {}", e.what());
        return Err<Ptr>(std::string("invalid config: ") + e.what());
    }
    return Ok<Ptr>(std::move(config));
}

YAML::Node Config::defaults() {
    YAML::Node node(YAML::NodeType::Map);
    node["surface"]["width"] = 800;
    node["surface"]["height"] = 600;
    node["ops"]["reserve-bytes"] = 4096;
    node["ops"]["reserve-refs"] = 64;
    node["log"]["level"] = "info";
    return node;
}

Result<void> Config::readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<void>("cannot open " + path.string());
    }
    YAML::Node doc;
    try {
        doc = YAML::Load(in);
    } catch (const YAML::Exception& e) {
        return Err<void>(std::string("YAML parse error: ") + e.what());
    }
    if (doc.IsNull()) {
        // empty file, nothing to apply
        _source = path;
        return Ok();
    }
    if (!doc.IsMap()) {
        return Err<void>(path.string() + " is not a mapping");
    }
    overlay(_tree, doc);
    _source = path;
    return Ok();
}

void Config::overlay(YAML::Node into, const YAML::Node& from) {
    for (const auto& entry : from) {
        auto name = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;
        YAML::Node slot = into[name];
        if (value.IsMap() && slot.IsMap()) {
            overlay(slot, value);
        } else {
            into[name] = YAML::Clone(value);
        }
    }
}

void Config::overlayEnvironment(YAML::Node node, const std::string& key) {
    for (auto entry : node) {
        auto name = entry.first.as<std::string>();
        auto path = key.empty() ? name : key + "." + name;
        if (entry.second.IsMap()) {
            overlayEnvironment(entry.second, path);
            continue;
        }
        if (const char* value = std::getenv(envName(path).c_str())) {
            ydebug("Config {} = '{}' from {}", path, value, envName(path));
            node[name] = std::string(value);
        }
    }
}

std::string Config::envName(const std::string& key) {
    std::string name = ENV_PREFIX;
    for (char c : key) {
        if (c == '.' || c == '-') {
            name += '_';
        } else {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return name;
}

YAML::Node Config::lookup(const std::string& key) const {
    if (key.empty()) return YAML::Node();
    // walk through a const node so missing keys are not inserted
    YAML::Node node = _tree;
    size_t begin = 0;
    while (begin <= key.size()) {
        size_t dot = key.find('.', begin);
        if (dot == std::string::npos) dot = key.size();
        if (dot == begin) return YAML::Node();
        if (!node.IsMap()) return YAML::Node();
        const YAML::Node& current = node;
        YAML::Node next = current[key.substr(begin, dot - begin)];
        if (!next) return YAML::Node();
        node.reset(next);
        begin = dot + 1;
    }
    return node;
}

bool Config::has(const std::string& key) const {
    YAML::Node node = lookup(key);
    return node && !node.IsNull();
}

std::string Config::dump() const {
    YAML::Emitter out;
    out << _tree;
    return out.c_str();
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = "/tmp";
    }
    return base / "weft" / "config.yaml";
}

} // namespace weft

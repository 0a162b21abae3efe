#include "config_loader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>

#include <yaml-cpp/yaml.h>

namespace scribe {

namespace {

template <typename T>
void read_value(const YAML::Node& node, const char* key, T& out) {
    if (const YAML::Node value = node[key]) {
        out = value.as<T>();
    }
}

YAML::Node section(const YAML::Node& root, const char* key) {
    YAML::Node node = root[key];
    if (node && !node.IsNull() && !node.IsMap()) {
        throw std::runtime_error(std::string("'") + key + "' must be a mapping");
    }
    return node;
}

} // namespace

std::string ConfigLoader::get_default_config_path() {
    return expand_home("~/.config/scribe/config.yaml");
}

std::string ConfigLoader::expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~user is not supported

    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::string ConfigLoader::find_legacy_config(const std::string& path) {
    if (path.empty()) return "";

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) return "";

    std::filesystem::path legacy = std::filesystem::path(path).parent_path() / "config.toml";
    if (!std::filesystem::is_regular_file(legacy, ec)) return "";
    return legacy.string();
}

Config ConfigLoader::load_user_config() {
    return load_from_file(get_default_config_path());
}

Config ConfigLoader::load_from_file(const std::string& path) {
    std::string expanded = expand_home(path);

    std::error_code ec;
    if (expanded.empty() || !std::filesystem::exists(expanded, ec)) {
        // No config file - that's OK, defaults apply
        std::string legacy = find_legacy_config(expanded);
        if (!legacy.empty()) {
            std::cerr << "Warning: " << legacy << " is no longer read; move its settings to "
                      << expanded << " (YAML), using defaults" << std::endl;
        }
        return Config{};
    }

    std::ifstream file(expanded);
    if (!file.is_open()) {
        std::cerr << "Warning: cannot read config file " << expanded << ", using defaults" << std::endl;
        return Config{};
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    try {
        return parse(contents.str());
    } catch (const std::exception& e) {
        std::cerr << "Warning: invalid config file " << expanded << " (" << e.what()
                  << "), using defaults" << std::endl;
        return Config{};
    }
}

Config ConfigLoader::parse(const std::string& yaml_text) {
    Config config;

    const YAML::Node root = YAML::Load(yaml_text);
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("top level must be a mapping");
    }

    read_value(root, "device", config.device);
    read_value(root, "duration", config.duration_seconds);
    read_value(root, "volume", config.volume);
    read_value(root, "output_dir", config.output_dir);
    read_value(root, "keep_recording", config.keep_recording);

    if (const YAML::Node recorder = section(root, "recorder")) {
        read_value(recorder, "program", config.recorder.program);
    }

    if (const YAML::Node transcriber = section(root, "transcriber")) {
        read_value(transcriber, "program", config.transcriber.program);
        read_value(transcriber, "model", config.transcriber.model);
        read_value(transcriber, "device", config.transcriber.device);
        read_value(transcriber, "language", config.transcriber.language);
    }

    if (const YAML::Node clipboard = section(root, "clipboard")) {
        read_value(clipboard, "program", config.clipboard.program);
        read_value(clipboard, "args", config.clipboard.args);
    }

    if (config.volume < 0.0f) {
        throw std::runtime_error("'volume' must not be negative");
    }

    return config;
}

Config ConfigLoader::merge(Config config, const ConfigOverrides& overrides) {
    if (overrides.device) config.device = *overrides.device;
    if (overrides.duration_seconds) config.duration_seconds = *overrides.duration_seconds;
    if (overrides.volume) config.volume = *overrides.volume;
    if (overrides.output_dir) config.output_dir = *overrides.output_dir;
    return config;
}

} // namespace scribe

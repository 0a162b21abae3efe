#pragma once

#include "config.hpp"

#include <optional>
#include <string>

namespace scribe {

// Values given on the command line. Unset fields keep the file/default value.
struct ConfigOverrides {
    std::optional<std::string> device;
    std::optional<uint64_t> duration_seconds;
    std::optional<float> volume;
    std::optional<std::string> output_dir;
};

class ConfigLoader {
public:
    // Load ~/.config/scribe/config.yaml
    static Config load_user_config();

    // Load from `path` ('~' is expanded). A missing file yields the defaults;
    // a malformed one is reported on stderr and also yields the defaults.
    static Config load_from_file(const std::string& path);

    // Parse YAML text on top of the defaults. Throws std::runtime_error on
    // malformed input or a key of the wrong type.
    static Config parse(const std::string& yaml_text);

    // CLI takes precedence over the file
    static Config merge(Config config, const ConfigOverrides& overrides);

    static std::string get_default_config_path();

    // A config.toml from earlier releases next to a missing `path`, or "".
    // Its settings are not read; load_from_file warns about it.
    static std::string find_legacy_config(const std::string& path);

    // Replace a leading '~' with $HOME
    static std::string expand_home(const std::string& path);
};

} // namespace scribe

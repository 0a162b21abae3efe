#include "config.hpp"

#include <filesystem>

namespace scribe {

std::string Config::make_output_path(int64_t unix_seconds) const {
    std::filesystem::path dir = output_dir.empty() ? std::filesystem::path(".") : std::filesystem::path(output_dir);
    return (dir / ("output_" + std::to_string(unix_seconds) + ".wav")).string();
}

} // namespace scribe

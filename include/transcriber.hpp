#pragma once

#include "config.hpp"

#include <string>
#include <vector>

namespace scribe {

class Transcriber {
public:
    explicit Transcriber(const TranscriberSettings& settings);

    // Run the transcriber on `input_path` and return its stdout unchanged.
    // Throws SpawnError if it cannot be started, TranscriptionError on a
    // non-zero exit, unreadable output or an empty transcript.
    std::string transcribe(const std::string& input_path) const;

    std::vector<std::string> build_args(const std::string& input_path) const;

private:
    TranscriberSettings settings_;
};

} // namespace scribe

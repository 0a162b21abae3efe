#include "transcriber.hpp"
#include "process.hpp"
#include <iostream>
#include <filesystem>

namespace scribe {

Transcriber::Transcriber(const TranscriberSettings& settings)
    : settings_(settings) {
}

std::vector<std::string> Transcriber::build_args(const std::string& input_path) const {
    return {
        "--model", settings_.model,
        "--device", settings_.device,
        "--language", settings_.language,
        input_path
    };
}

std::string Transcriber::transcribe(const std::string& input_path) const {
    // Best-effort check; the transcriber gets the final say
    std::error_code ec;
    if (!std::filesystem::exists(input_path, ec)) {
        std::cerr << "Warning: recording " << input_path << " does not exist" << std::endl;
    } else if (std::filesystem::file_size(input_path, ec) == 0 && !ec) {
        std::cerr << "Warning: recording " << input_path << " is empty" << std::endl;
    }

    CommandResult result;
    try {
        result = run_capture(settings_.program, build_args(input_path), Stage::Transcribing);
    } catch (const ProcessError& e) {
        throw TranscriptionError(std::string("unreadable transcriber output: ") + e.what());
    }

    if (!result.status.success()) {
        throw TranscriptionError("'" + settings_.program + "' failed with " + result.status.describe());
    }

    if (result.output.empty()) {
        throw TranscriptionError("'" + settings_.program + "' produced no transcript");
    }

    return result.output;
}

} // namespace scribe

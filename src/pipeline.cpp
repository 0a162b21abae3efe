#include "pipeline.hpp"
#include <iostream>
#include <chrono>
#include <filesystem>

namespace scribe {

const char* state_name(PipelineState state) {
    switch (state) {
        case PipelineState::Idle: return "idle";
        case PipelineState::Recording: return "recording";
        case PipelineState::Stopping: return "stopping";
        case PipelineState::Transcribing: return "transcribing";
        case PipelineState::Copying: return "copying";
        case PipelineState::Done: return "done";
        case PipelineState::Failed: return "failed";
        default: return "unknown";
    }
}

Pipeline::Pipeline(const Config& config, KeyReader& keys, Console& console)
    : config_(config)
    , keys_(keys)
    , console_(console)
    , audio_(config.recorder, config.duration_seconds, config.volume)
    , transcriber_(config.transcriber)
    , clipboard_(config.clipboard) {
}

std::string Pipeline::run() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return run(static_cast<int64_t>(seconds));
}

std::string Pipeline::run(int64_t unix_seconds) {
    recording_path_ = config_.make_output_path(unix_seconds);

    try {
        console_.step("Starting audio recording...");
        Process recorder = start_recording(config_.device, recording_path_);

        console_.step("Recording in progress... Press any key to stop.");
        await_stop_signal();

        console_.step("Stopping recording...");
        stop_recording(recorder);
        console_.step("Recording stopped.");

        console_.step("Transcribing audio...");
        std::string transcript = transcribe(recording_path_);
        console_.step("Transcription complete.");

        console_.step("Copying transcription to clipboard...");
        copy_to_clipboard(transcript);
        console_.step("Copied transcription to clipboard.");

        state_ = PipelineState::Done;
        if (!config_.keep_recording) {
            remove_recording();
        }

        console_.step("Process completed successfully.");
        return transcript;
    } catch (const PipelineError&) {
        // The recording, if any, stays on disk
        state_ = PipelineState::Failed;
        throw;
    }
}

Process Pipeline::start_recording(const std::string& device, const std::string& output_path) {
    state_ = PipelineState::Recording;
    return audio_.start_recording(device, output_path);
}

void Pipeline::await_stop_signal() {
    keys_.wait_for_key();
}

void Pipeline::stop_recording(Process& recorder) {
    state_ = PipelineState::Stopping;
    audio_.stop_recording(recorder);
}

std::string Pipeline::transcribe(const std::string& input_path) {
    state_ = PipelineState::Transcribing;
    return transcriber_.transcribe(input_path);
}

void Pipeline::copy_to_clipboard(const std::string& text) {
    state_ = PipelineState::Copying;
    if (text.empty()) {
        throw TranscriptionError("nothing to copy, the transcript is empty");
    }
    clipboard_.set_text(text);
}

void Pipeline::remove_recording() {
    std::error_code ec;
    std::filesystem::remove(recording_path_, ec);
    if (ec) {
        std::cerr << "Warning: could not remove " << recording_path_ << ": " << ec.message() << std::endl;
    }
}

} // namespace scribe

#pragma once

#include "config.hpp"
#include "audio_capture.hpp"
#include "transcriber.hpp"
#include "clipboard.hpp"
#include "key_reader.hpp"
#include "console.hpp"
#include "process.hpp"

#include <cstdint>
#include <string>

namespace scribe {

enum class PipelineState {
    Idle,
    Recording,
    Stopping,
    Transcribing,
    Copying,
    Done,
    Failed
};

const char* state_name(PipelineState state);

// Record until a key is pressed, transcribe the recording, copy the
// transcript to the clipboard. Strictly sequential; the first failing stage
// ends the run and its error propagates as a PipelineError.
class Pipeline {
public:
    Pipeline(const Config& config, KeyReader& keys, Console& console);

    // Run every stage, recording to output_<unix_seconds>.wav.
    // Returns the transcript that was copied.
    std::string run(int64_t unix_seconds);

    // Run using the current time for the recording name
    std::string run();

    // Individual stages
    Process start_recording(const std::string& device, const std::string& output_path);
    void await_stop_signal();
    void stop_recording(Process& recorder);
    std::string transcribe(const std::string& input_path);
    void copy_to_clipboard(const std::string& text);

    PipelineState state() const { return state_; }

    // Path of the current or last recording
    const std::string& recording_path() const { return recording_path_; }

private:
    void remove_recording();

    Config config_;
    KeyReader& keys_;
    Console& console_;

    AudioCapture audio_;
    Transcriber transcriber_;
    Clipboard clipboard_;

    PipelineState state_ = PipelineState::Idle;
    std::string recording_path_;
};

} // namespace scribe

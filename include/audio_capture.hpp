#pragma once

#include "config.hpp"
#include "process.hpp"

#include <string>
#include <vector>

namespace scribe {

// Drives the external recorder process
class AudioCapture {
public:
    AudioCapture(const RecorderSettings& settings, uint64_t duration_seconds, float volume);

    // Launch the recorder on `device`, writing to `output_path`.
    // Throws SpawnError if the recorder cannot be started.
    Process start_recording(const std::string& device, const std::string& output_path) const;

    // SIGINT the recorder and wait for it to exit.
    // Throws ProcessError on delivery/wait failure or an abnormal exit.
    void stop_recording(Process& recorder) const;

    std::vector<std::string> build_args(const std::string& device, const std::string& output_path) const;

    // Exit codes ffmpeg reports after a SIGINT-initiated shutdown
    static bool is_graceful_exit(const ExitStatus& status);

private:
    RecorderSettings settings_;
    uint64_t duration_seconds_;
    float volume_;
};

} // namespace scribe

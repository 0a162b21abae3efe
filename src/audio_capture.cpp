#include "audio_capture.hpp"
#include <csignal>
#include <sstream>

namespace scribe {

AudioCapture::AudioCapture(const RecorderSettings& settings, uint64_t duration_seconds, float volume)
    : settings_(settings)
    , duration_seconds_(duration_seconds)
    , volume_(volume) {
}

std::vector<std::string> AudioCapture::build_args(const std::string& device,
                                                  const std::string& output_path) const {
    std::ostringstream volume;
    volume << "volume=" << volume_;

    return {
        "-y",               // Overwrite output file without prompting
        "-f", "alsa",
        "-i", device,
        "-filter:a", volume.str(),
        "-t", std::to_string(duration_seconds_),
        output_path
    };
}

Process AudioCapture::start_recording(const std::string& device, const std::string& output_path) const {
    SpawnOptions options;
    // Keep the recorder off the terminal so it cannot eat the stop key
    options.stdin_mode = StreamMode::Null;
    options.stderr_mode = StreamMode::Null;

    return Process::spawn(settings_.program, build_args(device, output_path), options, Stage::Recording);
}

void AudioCapture::stop_recording(Process& recorder) const {
    recorder.set_stage(Stage::Stopping);
    recorder.interrupt();

    ExitStatus status = recorder.wait();
    if (!is_graceful_exit(status)) {
        throw ProcessError(Stage::Stopping,
                           "failed to record audio, '" + settings_.program + "' ended with " + status.describe());
    }
}

bool AudioCapture::is_graceful_exit(const ExitStatus& status) {
    if (status.exited) {
        return status.code == 0 || status.code == 130 || status.code == 255;
    }
    return status.signal == SIGINT;
}

} // namespace scribe

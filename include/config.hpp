#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace scribe {

// Default ALSA capture device
inline const char* const DEFAULT_DEVICE = "front:CARD=BRIO";

// Recorder: `<program> -y -f alsa -i <device> -filter:a volume=<v> -t <secs> <output>`
struct RecorderSettings {
    std::string program = "ffmpeg";
};

// Transcriber: `<program> --model <m> --device <d> --language <l> <input>`
struct TranscriberSettings {
    std::string program = "whisper";
    std::string model = "turbo";
    std::string device = "cuda";    // Compute device, not the audio device
    std::string language = "en";
};

// Clipboard writer: `<program> <args...>`, text on stdin
struct ClipboardSettings {
    std::string program = "cb";
    std::vector<std::string> args = {"copy"};
};

struct Config {
    // Audio settings
    std::string device = DEFAULT_DEVICE;
    uint64_t duration_seconds = 3600;   // Recorder's own hard limit
    float volume = 2.0f;

    // Recording file
    std::string output_dir = ".";
    bool keep_recording = true;         // Leave the audio file after a successful run

    RecorderSettings recorder;
    TranscriberSettings transcriber;
    ClipboardSettings clipboard;

    // output_<unix-seconds>.wav inside output_dir
    std::string make_output_path(int64_t unix_seconds) const;
};

} // namespace scribe

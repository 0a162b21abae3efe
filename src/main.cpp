#include "config_loader.hpp"
#include "console.hpp"
#include "key_reader.hpp"
#include "pipeline.hpp"
#include <iostream>
#include <cstring>
#include <filesystem>
#include <string>

#ifndef SCRIBE_VERSION
#define SCRIBE_VERSION "0.0.0"
#endif

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nRecord from the microphone until a key is pressed, transcribe the\n"
              << "recording and copy the transcript to the clipboard.\n"
              << "\nOptions:\n"
              << "  -c, --config PATH     Configuration file (default: ~/.config/scribe/config.yaml)\n"
              << "      --device DEV      Audio input device (default: " << scribe::DEFAULT_DEVICE << ")\n"
              << "      --duration SECS   Maximum recording length in seconds (default: 3600)\n"
              << "      --volume X        Volume multiplier applied while recording (default: 2.0)\n"
              << "  -o, --output-dir DIR  Directory for the recording (default: .)\n"
              << "  -v, --version         Show version\n"
              << "  -h, --help            Show this help\n"
              << "\nExternal tools (configurable in the config file):\n"
              << "  recorder     ffmpeg\n"
              << "  transcriber  whisper\n"
              << "  clipboard    cb copy\n"
              << std::endl;
}

static bool parse_seconds(const char* s, uint64_t& out) {
    if (*s == '-') return false;
    try {
        size_t pos = 0;
        out = std::stoull(s, &pos);
        return pos == std::strlen(s);
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_volume(const char* s, float& out) {
    try {
        size_t pos = 0;
        out = std::stof(s, &pos);
        return pos == std::strlen(s) && out >= 0.0f;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    std::string config_path = scribe::ConfigLoader::get_default_config_path();
    scribe::ConfigOverrides overrides;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "scribe " << SCRIBE_VERSION << std::endl;
            return 0;
        }
        else if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (strcmp(argv[i], "--device") == 0 && i + 1 < argc) {
            overrides.device = argv[++i];
        }
        else if (strcmp(argv[i], "--duration") == 0 && i + 1 < argc) {
            uint64_t seconds = 0;
            if (!parse_seconds(argv[++i], seconds)) {
                std::cerr << "Invalid duration: " << argv[i] << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            overrides.duration_seconds = seconds;
        }
        else if (strcmp(argv[i], "--volume") == 0 && i + 1 < argc) {
            float volume = 0.0f;
            if (!parse_volume(argv[++i], volume)) {
                std::cerr << "Invalid volume: " << argv[i] << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            overrides.volume = volume;
        }
        else if ((strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output-dir") == 0) && i + 1 < argc) {
            overrides.output_dir = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    scribe::Config config = scribe::ConfigLoader::merge(
        scribe::ConfigLoader::load_from_file(config_path), overrides);

    scribe::Console console(std::cout, scribe::Console::stdout_is_terminal());
    scribe::TerminalKeyReader keys;
    scribe::Pipeline pipeline(config, keys, console);

    try {
        pipeline.run();
    } catch (const scribe::PipelineError& e) {
        std::cerr << "Error (" << scribe::stage_name(e.stage()) << "): " << e.what() << std::endl;
        std::error_code ec;
        if (std::filesystem::exists(pipeline.recording_path(), ec)) {
            std::cerr << "Recording left at " << pipeline.recording_path() << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

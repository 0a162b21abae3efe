#pragma once

#include <stdexcept>
#include <string>

namespace scribe {

enum class Stage {
    Recording,
    Stopping,
    Transcribing,
    Copying
};

inline const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Recording: return "recording";
        case Stage::Stopping: return "stopping";
        case Stage::Transcribing: return "transcribing";
        case Stage::Copying: return "copying";
        default: return "unknown";
    }
}

// Base for every error that ends a run. Carries the stage that failed.
class PipelineError : public std::runtime_error {
public:
    PipelineError(Stage stage, const std::string& message)
        : std::runtime_error(message), stage_(stage) {}

    Stage stage() const { return stage_; }

private:
    Stage stage_;
};

// External binary missing or could not be started
class SpawnError : public PipelineError {
public:
    SpawnError(Stage stage, const std::string& message)
        : PipelineError(stage, message) {}
};

// Signal delivery, wait or abnormal exit failure
class ProcessError : public PipelineError {
public:
    ProcessError(Stage stage, const std::string& message)
        : PipelineError(stage, message) {}
};

class TranscriptionError : public PipelineError {
public:
    explicit TranscriptionError(const std::string& message)
        : PipelineError(Stage::Transcribing, message) {}
};

class ClipboardError : public PipelineError {
public:
    explicit ClipboardError(const std::string& message)
        : PipelineError(Stage::Copying, message) {}
};

} // namespace scribe

#pragma once

#include "errors.hpp"

#include <string>
#include <vector>
#include <sys/types.h>

namespace scribe {

// How a child's standard stream is wired
enum class StreamMode {
    Inherit,    // Share the controller's stream
    Null,       // /dev/null
    Pipe        // Pipe back to the controller
};

struct SpawnOptions {
    StreamMode stdin_mode = StreamMode::Inherit;
    StreamMode stdout_mode = StreamMode::Inherit;
    StreamMode stderr_mode = StreamMode::Inherit;   // Inherit or Null only
};

struct ExitStatus {
    bool exited = false;    // Normal exit, `code` is valid
    int code = 0;
    int signal = 0;         // Terminating signal when !exited

    bool success() const { return exited && code == 0; }
    std::string describe() const;
};

// Owned handle to a child process. Move-only.
// Destroying a handle whose child still runs terminates and reaps the child.
class Process {
public:
    // Start `program` (looked up on PATH) with `args`.
    // Throws SpawnError tagged with `stage` if it cannot be executed.
    static Process spawn(const std::string& program,
                         const std::vector<std::string>& args,
                         const SpawnOptions& options,
                         Stage stage);

    Process() = default;
    ~Process();

    Process(Process&& other) noexcept;
    Process& operator=(Process&& other) noexcept;
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0; }
    const std::string& program() const { return program_; }

    // Stage reported by errors raised through this handle
    void set_stage(Stage stage) { stage_ = stage; }

    // Write all of `data` to the child's stdin. Returns false if the child
    // stopped reading (EPIPE); SIGPIPE is suppressed for the duration.
    bool write_stdin(const std::string& data);
    void close_stdin();

    // Read the child's stdout until EOF.
    // Throws ProcessError if the pipe cannot be read.
    std::string read_stdout();

    // Deliver SIGINT. Throws ProcessError if the signal cannot be sent.
    void interrupt();

    // Block until the child exits. Throws ProcessError if waiting fails.
    ExitStatus wait();

private:
    void release();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    Stage stage_ = Stage::Recording;
    std::string program_;
};

struct CommandResult {
    ExitStatus status;
    std::string output;
};

// Run to completion, capturing stdout. stdin is /dev/null.
CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          Stage stage);

// Run to completion, feeding `input` on stdin.
// `delivered` is cleared if the child closed stdin before taking all input.
ExitStatus run_with_input(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& input,
                          Stage stage,
                          bool* delivered = nullptr);

} // namespace scribe

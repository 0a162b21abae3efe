#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scribe {

namespace {

std::string errno_text(int err) {
    return std::strerror(err);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int read_end = -1;
    int write_end = -1;

    ~PipePair() {
        close_fd(read_end);
        close_fd(write_end);
    }

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) return false;
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }
};

// Runs in the forked child only: async-signal-safe calls until exec
void wire_stream(StreamMode mode, int pipe_fd, int target_fd, int open_flags) {
    switch (mode) {
        case StreamMode::Pipe:
            ::dup2(pipe_fd, target_fd);
            break;
        case StreamMode::Null: {
            int fd = ::open("/dev/null", open_flags);
            if (fd >= 0) {
                ::dup2(fd, target_fd);
                if (fd != target_fd) ::close(fd);
            }
            break;
        }
        case StreamMode::Inherit:
            break;
    }
}

} // namespace

std::string ExitStatus::describe() const {
    if (exited) {
        return "exit code " + std::to_string(code);
    }
    const char* name = ::strsignal(signal);
    return "signal " + std::to_string(signal) + (name ? std::string(" (") + name + ")" : "");
}

Process Process::spawn(const std::string& program,
                       const std::vector<std::string>& args,
                       const SpawnOptions& options,
                       Stage stage) {
    if (program.empty()) {
        throw SpawnError(stage, "no program configured");
    }

    PipePair exec_status;
    PipePair in_pipe;
    PipePair out_pipe;

    if (options.stderr_mode == StreamMode::Pipe) {
        throw SpawnError(stage, "stderr of '" + program + "' cannot be piped");
    }

    if (!exec_status.open() ||
        (options.stdin_mode == StreamMode::Pipe && !in_pipe.open()) ||
        (options.stdout_mode == StreamMode::Pipe && !out_pipe.open())) {
        throw SpawnError(stage, "failed to create pipes for '" + program + "': " + errno_text(errno));
    }

    // Build argv before forking; the child must not allocate
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(program);
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw SpawnError(stage, "failed to fork for '" + program + "': " + errno_text(errno));
    }

    if (pid == 0) {
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGPIPE, SIG_DFL);

        wire_stream(options.stdin_mode, in_pipe.read_end, STDIN_FILENO, O_RDONLY);
        wire_stream(options.stdout_mode, out_pipe.write_end, STDOUT_FILENO, O_WRONLY);
        wire_stream(options.stderr_mode, -1, STDERR_FILENO, O_WRONLY);

        ::execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = ::write(exec_status.write_end, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(exec_status.write_end);

    // exec_status is close-on-exec: EOF means exec succeeded
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read_end, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw SpawnError(stage, "failed to start '" + program + "': " + errno_text(child_errno));
    }

    Process process;
    process.pid_ = pid;
    process.stage_ = stage;
    process.program_ = program;
    std::swap(process.stdin_fd_, in_pipe.write_end);
    std::swap(process.stdout_fd_, out_pipe.read_end);
    return process;
}

Process::~Process() {
    release();
}

Process::Process(Process&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , stdin_fd_(std::exchange(other.stdin_fd_, -1))
    , stdout_fd_(std::exchange(other.stdout_fd_, -1))
    , stage_(other.stage_)
    , program_(std::move(other.program_)) {
}

Process& Process::operator=(Process&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = std::exchange(other.pid_, -1);
        stdin_fd_ = std::exchange(other.stdin_fd_, -1);
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        stage_ = other.stage_;
        program_ = std::move(other.program_);
    }
    return *this;
}

void Process::release() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);

    if (pid_ > 0) {
        // Abandoned while running: terminate and reap so nothing is orphaned
        ::kill(pid_, SIGTERM);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        pid_ = -1;
    }
}

bool Process::write_stdin(const std::string& data) {
    if (stdin_fd_ < 0) {
        throw ProcessError(stage_, "stdin of '" + program_ + "' is not a pipe");
    }

    struct sigaction ignore {};
    struct sigaction previous {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGPIPE, &ignore, &previous);

    bool delivered = true;
    int write_errno = 0;
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno != EPIPE) write_errno = errno;
            delivered = false;
            break;
        }
        offset += static_cast<size_t>(n);
    }

    ::sigaction(SIGPIPE, &previous, nullptr);

    if (write_errno != 0) {
        throw ProcessError(stage_, "failed to write to '" + program_ + "': " + errno_text(write_errno));
    }
    return delivered;
}

void Process::close_stdin() {
    close_fd(stdin_fd_);
}

std::string Process::read_stdout() {
    if (stdout_fd_ < 0) {
        throw ProcessError(stage_, "stdout of '" + program_ + "' is not a pipe");
    }

    std::string output;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(stdout_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close_fd(stdout_fd_);
            throw ProcessError(stage_, "failed to read output of '" + program_ + "': " + errno_text(err));
        }
        if (n == 0) break;
        output.append(buffer, static_cast<size_t>(n));
    }

    close_fd(stdout_fd_);
    return output;
}

void Process::interrupt() {
    if (pid_ <= 0) {
        throw ProcessError(stage_, "'" + program_ + "' is not running");
    }
    if (::kill(pid_, SIGINT) != 0) {
        throw ProcessError(stage_, "failed to interrupt '" + program_ + "': " + errno_text(errno));
    }
}

ExitStatus Process::wait() {
    if (pid_ <= 0) {
        throw ProcessError(stage_, "'" + program_ + "' is not running");
    }

    close_stdin();

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        throw ProcessError(stage_, "failed to wait for '" + program_ + "': " + errno_text(errno));
    }

    pid_ = -1;
    close_fd(stdout_fd_);

    ExitStatus exit_status;
    if (WIFEXITED(status)) {
        exit_status.exited = true;
        exit_status.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status.signal = WTERMSIG(status);
    }
    return exit_status;
}

CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          Stage stage) {
    SpawnOptions options;
    options.stdin_mode = StreamMode::Null;
    options.stdout_mode = StreamMode::Pipe;

    Process process = Process::spawn(program, args, options, stage);

    CommandResult result;
    result.output = process.read_stdout();
    result.status = process.wait();
    return result;
}

ExitStatus run_with_input(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& input,
                          Stage stage,
                          bool* delivered) {
    SpawnOptions options;
    options.stdin_mode = StreamMode::Pipe;
    options.stdout_mode = StreamMode::Null;

    Process process = Process::spawn(program, args, options, stage);

    bool all_written = process.write_stdin(input);
    if (delivered) *delivered = all_written;

    return process.wait();
}

} // namespace scribe

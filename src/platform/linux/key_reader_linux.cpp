#include "key_reader.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <termios.h>
#include <unistd.h>

namespace scribe {

namespace {

// Puts a terminal in single-key mode for its lifetime. ISIG is cleared so
// Ctrl+C arrives as a key instead of killing the controller mid-read.
class RawModeGuard {
public:
    explicit RawModeGuard(int fd) : fd_(fd) {
        if (!isatty(fd_) || tcgetattr(fd_, &saved_) != 0) return;

        struct termios raw = saved_;
        raw.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
        raw.c_iflag &= ~(IXON | ICRNL);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        active_ = tcsetattr(fd_, TCSANOW, &raw) == 0;
    }

    ~RawModeGuard() {
        if (active_) {
            // Drop the tail of multi-byte keys (arrows, UTF-8) so it does
            // not reach the shell after exit
            tcflush(fd_, TCIFLUSH);
            tcsetattr(fd_, TCSANOW, &saved_);
        }
    }

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    int fd_;
    struct termios saved_ {};
    bool active_ = false;
};

} // namespace

TerminalKeyReader::TerminalKeyReader(int fd)
    : fd_(fd) {
}

void TerminalKeyReader::wait_for_key() {
    RawModeGuard guard(fd_);

    char key;
    while (true) {
        ssize_t n = read(fd_, &key, 1);
        if (n >= 0) return;  // 0 is end of input
        if (errno == EINTR) continue;

        throw ProcessError(Stage::Recording, std::string("failed to read from terminal: ") + std::strerror(errno));
    }
}

} // namespace scribe

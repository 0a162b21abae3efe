#include "console.hpp"
#include <ostream>
#include <unistd.h>

namespace scribe {

static constexpr const char* CLEAR_LINE = "\r\033[2K";
static constexpr const char* BOLD_CYAN = "\033[1;36m";
static constexpr const char* RESET = "\033[0m";

Console::Console(std::ostream& out, bool styled)
    : out_(out)
    , styled_(styled) {
}

void Console::step(const std::string& message) {
    if (styled_) {
        out_ << CLEAR_LINE << "> " << BOLD_CYAN << message << RESET << std::endl;
    } else {
        out_ << "> " << message << std::endl;
    }
}

bool Console::stdout_is_terminal() {
    return isatty(STDOUT_FILENO) == 1;
}

} // namespace scribe

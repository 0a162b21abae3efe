#pragma once

#include <iosfwd>
#include <string>

namespace scribe {

// Progress lines of the form "> message"
class Console {
public:
    // `styled` adds bold cyan and clears the current line first
    Console(std::ostream& out, bool styled);

    void step(const std::string& message);

    // True when stdout is a terminal
    static bool stdout_is_terminal();

private:
    std::ostream& out_;
    bool styled_;
};

} // namespace scribe

#pragma once

#include "config.hpp"

#include <string>

namespace scribe {

class Clipboard {
public:
    explicit Clipboard(const ClipboardSettings& settings);

    // Set text to clipboard by piping it into the clipboard writer.
    // Throws SpawnError if it cannot be started, ClipboardError if it exits
    // non-zero or stops reading before taking all of `text`.
    void set_text(const std::string& text) const;

private:
    ClipboardSettings settings_;
};

} // namespace scribe

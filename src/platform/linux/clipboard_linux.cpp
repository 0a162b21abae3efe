#include "clipboard.hpp"
#include "process.hpp"

namespace scribe {

Clipboard::Clipboard(const ClipboardSettings& settings)
    : settings_(settings) {
}

void Clipboard::set_text(const std::string& text) const {
    bool delivered = true;
    ExitStatus status;
    try {
        status = run_with_input(settings_.program, settings_.args, text, Stage::Copying, &delivered);
    } catch (const ProcessError& e) {
        throw ClipboardError(e.what());
    }

    if (!status.success()) {
        throw ClipboardError("failed to copy transcription to clipboard, '" + settings_.program +
                             "' ended with " + status.describe());
    }
    if (!delivered) {
        throw ClipboardError("'" + settings_.program + "' closed its input before taking the whole transcript");
    }
}

} // namespace scribe

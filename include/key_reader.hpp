#pragma once

namespace scribe {

// Source of the "stop recording" keypress
class KeyReader {
public:
    virtual ~KeyReader() = default;

    // Block until one key arrives. No timeout.
    virtual void wait_for_key() = 0;
};

// Reads a single byte from the controlling terminal (stdin).
// A terminal is switched to raw mode for the read (Ctrl+C is a key, not a
// signal) and restored afterwards, with leftover input discarded.
// End of input counts as a key.
class TerminalKeyReader : public KeyReader {
public:
    explicit TerminalKeyReader(int fd = 0);

    void wait_for_key() override;

private:
    int fd_;
};

} // namespace scribe

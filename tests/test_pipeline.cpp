// End-to-end tests for Pipeline against mock recorder/transcriber/clipboard scripts

#include "pipeline.hpp"
#include "test_support.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace scribe;
using scribe_test::TempDir;

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::istringstream in(scribe_test::read_file(path));
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool contains(const std::vector<std::string>& lines, const std::string& entry) {
    for (const auto& line : lines) {
        if (line == entry) return true;
    }
    return false;
}

// Stands in for the keyboard. Optionally waits until the mock recorder is up
// so its SIGINT trap is in place, then logs the keypress.
class ScriptedKeyReader : public KeyReader {
public:
    ScriptedKeyReader(std::string log_path, bool wait_for_recorder)
        : log_path_(std::move(log_path))
        , wait_for_recorder_(wait_for_recorder) {}

    void wait_for_key() override {
        ++presses;
        if (wait_for_recorder_) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!contains(read_lines(log_path_), "start-recorder")) {
                assert(std::chrono::steady_clock::now() < deadline && "Recorder never started");
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        std::ofstream(log_path_, std::ios::app) << "wait\n";
    }

    int presses = 0;

private:
    std::string log_path_;
    bool wait_for_recorder_;
};

// Scratch directory with a call log and mock tools
struct Fixture {
    TempDir dir;
    std::string log = dir.file("calls.log");
    std::string clip = dir.file("clipboard.txt");
    Config config;

    Fixture() {
        scribe_test::write_file(log, "");
        config.output_dir = dir.path().string();
        config.recorder.program = recorder_script(true, 255);
        config.transcriber.program = transcriber_script("printf 'hello world'\n");
        config.clipboard.program = clipboard_script(0);
        config.clipboard.args = {"copy"};
    }

    // Last argument is the output path, as with ffmpeg
    std::string recorder_script(bool writes_audio, int exit_code) {
        std::string on_interrupt = "echo stop-recorder >> '" + log + "'; ";
        if (writes_audio) on_interrupt += "printf RIFF > \"$out\"; ";
        on_interrupt += "exit " + std::to_string(exit_code);

        return scribe_test::write_script(dir.file("recorder.sh"),
            "out=''\n"
            "for arg in \"$@\"; do out=\"$arg\"; done\n"
            "trap '" + escape_single(on_interrupt) + "' INT\n"
            "echo start-recorder >> '" + log + "'\n"
            "while true; do sleep 0.05; done\n");
    }

    std::string transcriber_script(const std::string& body) {
        return scribe_test::write_script(dir.file("transcriber.sh"),
            "for arg in \"$@\"; do input=\"$arg\"; done\n"
            "echo transcribe >> '" + log + "'\n" + body);
    }

    std::string clipboard_script(int exit_code) {
        return scribe_test::write_script(dir.file("clipboard.sh"),
            "[ \"$1\" = copy ] || exit 9\n"
            "cat > '" + clip + "'\n"
            "echo copy >> '" + log + "'\n"
            "exit " + std::to_string(exit_code) + "\n");
    }

    static std::string escape_single(const std::string& s) {
        std::string out;
        for (char c : s) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        return out;
    }

    std::vector<std::string> calls() const { return read_lines(log); }
};

} // namespace

void test_successful_run() {
    std::cout << "Testing successful run..." << std::endl;

    Fixture f;
    ScriptedKeyReader keys(f.log, true);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    assert(pipeline.state() == PipelineState::Idle);
    std::string transcript = pipeline.run(1700000000);

    std::vector<std::string> expected = {"start-recorder", "wait", "stop-recorder", "transcribe", "copy"};
    assert(f.calls() == expected);
    assert(keys.presses == 1);

    assert(transcript == "hello world");
    assert(scribe_test::read_file(f.clip) == "hello world");
    assert(pipeline.state() == PipelineState::Done);

    std::string recording = f.dir.file("output_1700000000.wav");
    assert(pipeline.recording_path() == recording);
    assert(scribe_test::read_file(recording) == "RIFF");

    assert(out.str().find("> Starting audio recording...") != std::string::npos);
    assert(out.str().find("> Process completed successfully.") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_transcript_passed_verbatim() {
    std::cout << "Testing transcript bytes..." << std::endl;

    Fixture f;
    f.config.transcriber.program = f.transcriber_script("printf ' Hello,\\n  world. \\n'\n");
    ScriptedKeyReader keys(f.log, true);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    pipeline.run(1);
    assert(scribe_test::read_file(f.clip) == " Hello,\n  world. \n");

    std::cout << "  PASS" << std::endl;
}

void test_missing_recorder() {
    std::cout << "Testing missing recorder..." << std::endl;

    Fixture f;
    f.config.recorder.program = f.dir.file("no-such-recorder");
    ScriptedKeyReader keys(f.log, false);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    bool threw = false;
    try {
        pipeline.run(1);
    } catch (const SpawnError& e) {
        threw = true;
        assert(e.stage() == Stage::Recording);
    }
    assert(threw && "Missing recorder should raise SpawnError");

    assert(keys.presses == 0);
    assert(f.calls().empty());
    assert(!std::filesystem::exists(f.clip));
    assert(pipeline.state() == PipelineState::Failed);

    std::cout << "  PASS" << std::endl;
}

void test_transcriber_failure_skips_clipboard() {
    std::cout << "Testing transcriber failure..." << std::endl;

    Fixture f;
    f.config.transcriber.program = f.transcriber_script("echo 'model not found' >&2\nexit 2\n");
    ScriptedKeyReader keys(f.log, true);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    bool threw = false;
    try {
        pipeline.run(1);
    } catch (const TranscriptionError& e) {
        threw = true;
        assert(e.stage() == Stage::Transcribing);
        assert(std::string(e.what()).find("exit code 2") != std::string::npos);
    }
    assert(threw && "Failing transcriber should raise TranscriptionError");

    std::vector<std::string> expected = {"start-recorder", "wait", "stop-recorder", "transcribe"};
    assert(f.calls() == expected);
    assert(!std::filesystem::exists(f.clip));
    assert(pipeline.state() == PipelineState::Failed);

    // Recording is left on disk after a failure
    assert(std::filesystem::exists(f.dir.file("output_1.wav")));

    std::cout << "  PASS" << std::endl;
}

void test_empty_transcript() {
    std::cout << "Testing empty transcript..." << std::endl;

    Fixture f;
    f.config.transcriber.program = f.transcriber_script("exit 0\n");
    ScriptedKeyReader keys(f.log, true);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    bool threw = false;
    try {
        pipeline.run(1);
    } catch (const TranscriptionError&) {
        threw = true;
    }
    assert(threw && "Empty transcript should raise TranscriptionError");
    assert(!contains(f.calls(), "copy"));

    std::cout << "  PASS" << std::endl;
}

void test_key_before_any_audio() {
    std::cout << "Testing stop before recorder output..." << std::endl;

    Fixture f;
    // Recorder never writes the file; transcriber rejects a missing/empty input
    f.config.recorder.program = f.recorder_script(false, 255);
    f.config.transcriber.program = f.transcriber_script(
        "[ -s \"$input\" ] || { echo \"cannot read $input\" >&2; exit 1; }\n"
        "printf 'hello world'\n");
    ScriptedKeyReader keys(f.log, false);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    bool threw = false;
    try {
        pipeline.run(1);
    } catch (const TranscriptionError&) {
        threw = true;
    }
    assert(threw && "Unusable recording should surface as TranscriptionError");

    std::vector<std::string> calls = f.calls();
    assert(contains(calls, "wait"));
    assert(contains(calls, "transcribe"));
    assert(!contains(calls, "copy"));
    assert(pipeline.state() == PipelineState::Failed);

    std::cout << "  PASS" << std::endl;
}

void test_recorder_abnormal_exit() {
    std::cout << "Testing recorder failure on stop..." << std::endl;

    Fixture f;
    f.config.recorder.program = f.recorder_script(true, 1);
    ScriptedKeyReader keys(f.log, true);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    bool threw = false;
    try {
        pipeline.run(1);
    } catch (const ProcessError& e) {
        threw = true;
        assert(e.stage() == Stage::Stopping);
        assert(std::string(e.what()).find("exit code 1") != std::string::npos);
    }
    assert(threw && "Recorder exit code 1 should raise ProcessError");

    std::vector<std::string> calls = f.calls();
    assert(!contains(calls, "transcribe"));
    assert(!contains(calls, "copy"));

    std::cout << "  PASS" << std::endl;
}

void test_clipboard_failure() {
    std::cout << "Testing clipboard failure..." << std::endl;

    Fixture f;
    f.config.clipboard.program = f.clipboard_script(4);
    ScriptedKeyReader keys(f.log, true);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    bool threw = false;
    try {
        pipeline.run(1);
    } catch (const ClipboardError& e) {
        threw = true;
        assert(e.stage() == Stage::Copying);
    }
    assert(threw && "Clipboard exit code 4 should raise ClipboardError");
    assert(out.str().find("Process completed successfully.") == std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_discard_recording() {
    std::cout << "Testing recording cleanup..." << std::endl;

    Fixture f;
    f.config.keep_recording = false;
    ScriptedKeyReader keys(f.log, true);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    pipeline.run(7);
    assert(!std::filesystem::exists(f.dir.file("output_7.wav")));

    std::cout << "  PASS" << std::endl;
}

void test_stage_by_stage() {
    std::cout << "Testing individual stages..." << std::endl;

    Fixture f;
    ScriptedKeyReader keys(f.log, true);
    std::ostringstream out;
    Console console(out, false);
    Pipeline pipeline(f.config, keys, console);

    std::string path = f.dir.file("manual.wav");
    Process recorder = pipeline.start_recording("default", path);
    assert(pipeline.state() == PipelineState::Recording);

    pipeline.await_stop_signal();
    pipeline.stop_recording(recorder);
    assert(pipeline.state() == PipelineState::Stopping);
    assert(!recorder.running());

    std::string text = pipeline.transcribe(path);
    assert(pipeline.state() == PipelineState::Transcribing);
    assert(text == "hello world");

    pipeline.copy_to_clipboard(text);
    assert(pipeline.state() == PipelineState::Copying);
    assert(scribe_test::read_file(f.clip) == "hello world");

    bool threw = false;
    try {
        pipeline.copy_to_clipboard("");
    } catch (const TranscriptionError&) {
        threw = true;
    }
    assert(threw && "Empty text must not reach the clipboard");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Pipeline Test Suite ===" << std::endl << std::endl;

    test_successful_run();
    test_transcript_passed_verbatim();
    test_missing_recorder();
    test_transcriber_failure_skips_clipboard();
    test_empty_transcript();
    test_key_before_any_audio();
    test_recorder_abnormal_exit();
    test_clipboard_failure();
    test_discard_recording();
    test_stage_by_stage();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}

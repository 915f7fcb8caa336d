// Validates child process handling: captured output, exit codes, pipe writes after the reader
// went away, and the burn's guaranteed encoder cleanup on failure paths.
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "captionburn.hpp"
#include "logging.hpp"
#include "subprocess.hpp"
#include "test_utils.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[subprocess_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_run_command() {
    auto res = run_command({"sh", "-c", "printf hello"});
    bool ok = check(res.spawned && res.exit_code == 0, "sh runs");
    ok &= check(res.output == "hello", "stdout captured");
    auto code = run_command({"sh", "-c", "exit 3"});
    ok &= check(code.spawned && code.exit_code == 3, "exit code reported");
    auto missing = run_command({"/nonexistent/captionburn-binary"});
    ok &= check(!missing.spawned, "missing binary is a spawn failure");
    ok &= check(!run_command({}).spawned, "empty argv rejected");
    return ok;
}

bool test_piped_process_drains() {
    PipedProcess proc;
    bool ok = check(proc.start({"sh", "-c", "cat > /dev/null"}), "start consumer");
    std::vector<uint8_t> chunk(1 << 20, 0x5A);
    for (int i = 0; i < 4; ++i) {
        ok &= check(proc.write(chunk.data(), chunk.size()), "write 1 MiB");
    }
    ok &= check(proc.close_and_wait() == 0, "consumer exits cleanly");
    ok &= check(!proc.running(), "reaped");
    ok &= check(proc.close_and_wait() == 0, "second close returns cached code");
    ok &= check(!proc.write(chunk.data(), 1), "write after close fails");
    return ok;
}

bool test_write_after_reader_exit() {
    PipedProcess proc;
    bool ok = check(proc.start({"true"}), "start short-lived child");
    std::vector<uint8_t> chunk(64 * 1024, 0);
    bool failed = false;
    // The pipe buffer absorbs a little; once `true` is gone every write hits EPIPE.
    for (int i = 0; i < 4096 && !failed; ++i) {
        failed = !proc.write(chunk.data(), chunk.size());
    }
    ok &= check(failed, "write fails once the child has exited");
    ok &= check(proc.last_error() == EPIPE, "failure is EPIPE, not SIGPIPE");
    ok &= check(proc.close_and_wait() == 0, "child exit code still collected");
    return ok;
}

bool test_destructor_reaps() {
    {
        PipedProcess proc;
        if (!check(proc.start({"sh", "-c", "cat > /dev/null"}), "start for destructor test")) {
            return false;
        }
        uint8_t byte = 1;
        if (!check(proc.write(&byte, 1), "single byte write")) {
            return false;
        }
    }
    // Reaching this line means the destructor closed stdin and waited without hanging.
    return true;
}

bool test_burn_failure_paths() {
    captionburn::set_log_verbosity(captionburn::LogVerbosity::Error);
    const auto out_dir = std::filesystem::path("test_outputs");
    std::filesystem::create_directories(out_dir);
    bool ok = true;

    // Encoder that exits non-zero without reading: burn must fail and still return.
    auto session = test_utils::make_session({}, 30.0, 5, 16, 16);
    EncoderSettings failing;
    failing.ffmpeg_binary = "false";
    const auto never = (out_dir / "never_written.mp4").string();
    std::filesystem::remove(never);
    auto status = captionburn::burn(session, never, SubtitleOptions{}, failing);
    ok &= check(!status.ok, "failing encoder fails the burn");
    ok &= check(!status.message.empty(), "failure carries a message");

    // Encoder that exits without reading while frames far exceed the pipe buffer: the write
    // fails with EPIPE, the loop stops and burn reports it.
    auto large = test_utils::make_session({}, 30.0, 60, 640, 480);
    EncoderSettings quitting;
    quitting.ffmpeg_binary = "true";
    status = captionburn::burn(large, never, SubtitleOptions{}, quitting);
    ok &= check(!status.ok, "encoder quitting early fails the burn");
    ok &= check(status.message.find("closed its input early") != std::string::npos,
                "early close reported as such: " + status.message);

    // Missing encoder binary.
    EncoderSettings missing;
    missing.ffmpeg_binary = "/nonexistent/ffmpeg";
    status = captionburn::burn(session, never, SubtitleOptions{}, missing);
    ok &= check(!status.ok && status.message.find("start encoder") != std::string::npos,
                "missing encoder reported");

    // Existing output without overwrite is refused before anything runs.
    const auto existing = (out_dir / "existing.mp4").string();
    std::ofstream(existing) << "x";
    status = captionburn::burn(session, existing, SubtitleOptions{}, failing);
    ok &= check(!status.ok && status.message.find("exists") != std::string::npos,
                "existing output refused");

    // Unloadable font with subtitles to draw is refused before spawning.
    auto with_text = test_utils::make_session({{"HELLO", 0.0}}, 30.0, 5, 16, 16);
    SubtitleOptions bad_font;
    bad_font.font_path = "/nonexistent/font.ttf";
    status = captionburn::burn(with_text, never, bad_font, failing);
    ok &= check(!status.ok && status.message.find("font") != std::string::npos,
                "font failure reported");
    captionburn::set_log_verbosity(captionburn::LogVerbosity::Info);
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_run_command();
    ok &= test_piped_process_drains();
    ok &= test_write_after_reader_exit();
    ok &= test_destructor_reaps();
    ok &= test_burn_failure_paths();
    if (!ok) {
        return 1;
    }
    std::cout << "subprocess_unit OK\n";
    return 0;
}

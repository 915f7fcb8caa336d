// Validates the encoder and recognizer argument templates.
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "encoder_command.hpp"
#include "subprocess.hpp"
#include "transcriber.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[encoder_command_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// Value following `flag` (first occurrence), empty when absent.
std::string arg_after(const std::vector<std::string> &argv, const std::string &flag) {
    auto it = std::find(argv.begin(), argv.end(), flag);
    if (it == argv.end() || it + 1 == argv.end()) {
        return {};
    }
    return *(it + 1);
}

bool test_default_template() {
    EncoderRequest req;
    req.input_path = "in.mp4";
    req.output_path = "out.mp4";
    auto argv = build_encoder_command(req, EncoderSettings{});
    const std::vector<std::string> expected = {
        "ffmpeg", "-i", "in.mp4", "-f", "rawvideo", "-pix_fmt", "rgba", "-s", "1080x1920",
        "-framerate", "30", "-i", "-", "-filter_complex",
        "[1:v]setpts=PTS+0/TB[v1];[0:v][v1]overlay=0:0", "-map", "0:a?", "-c:v", "libx264",
        "-c:a", "copy", "-loglevel", "error", "out.mp4"};
    bool ok = check(argv == expected, "default argv layout: " + format_command(argv));
    ok &= check(std::find(argv.begin(), argv.end(), "-y") == argv.end(), "no -y by default");
    return ok;
}

bool test_probed_geometry_and_offset() {
    EncoderRequest req;
    req.input_path = "clip.mov";
    req.output_path = "burned.mp4";
    req.fps_num = 30000;
    req.fps_den = 1001;
    req.width = 1920;
    req.height = 1080;
    req.render_offset = 0.5;
    EncoderSettings settings;
    settings.overwrite = true;
    settings.video_codec = "libx265";
    settings.ffmpeg_binary = "/opt/ffmpeg/bin/ffmpeg";
    auto argv = build_encoder_command(req, settings);
    bool ok = check(argv.front() == "/opt/ffmpeg/bin/ffmpeg", "custom binary");
    ok &= check(argv.size() > 1 && argv[1] == "-y", "-y right after the binary");
    ok &= check(arg_after(argv, "-s") == "1920x1080", "probed geometry");
    ok &= check(arg_after(argv, "-framerate") == "30000/1001", "rational frame rate");
    ok &= check(arg_after(argv, "-filter_complex") ==
                    "[1:v]setpts=PTS+0.5/TB[v1];[0:v][v1]overlay=0:0",
                "offset in filter");
    ok &= check(arg_after(argv, "-c:v") == "libx265", "custom codec");
    ok &= check(argv.back() == "burned.mp4", "output last");
    return ok;
}

bool test_overlay_filter() {
    bool ok = check(build_overlay_filter(-0.25) == "[1:v]setpts=PTS+-0.25/TB[v1];[0:v][v1]overlay=0:0",
                    "negative offset passes through");
    ok &= check(build_overlay_filter(2) == "[1:v]setpts=PTS+2/TB[v1];[0:v][v1]overlay=0:0",
                "integral offset");
    ok &= check(build_overlay_filter(1234567.25) ==
                    "[1:v]setpts=PTS+1234567.25/TB[v1];[0:v][v1]overlay=0:0",
                "large offset keeps every digit, no exponent");
    // The written offset parses back to the exact configured value.
    const double precise = 12.3456789;
    const std::string filter = build_overlay_filter(precise);
    const auto begin = filter.find("PTS+") + 4;
    const auto end = filter.find("/TB");
    ok &= check(std::strtod(filter.substr(begin, end - begin).c_str(), nullptr) == precise,
                "offset round-trips: " + filter);
    return ok;
}

bool test_whisper_command() {
    TranscriberSettings settings;
    auto argv = build_whisper_command("talk.mp4", WhisperModel::Small, "/tmp/x", settings);
    bool ok = check(argv.front() == "whisper" && argv[1] == "talk.mp4", "binary + input");
    ok &= check(arg_after(argv, "--model") == "small", "model name");
    ok &= check(arg_after(argv, "--output_format") == "json", "json output");
    ok &= check(arg_after(argv, "--output_dir") == "/tmp/x", "output dir");
    ok &= check(arg_after(argv, "--word_timestamps") == "True", "word timestamps");
    ok &= check(arg_after(argv, "--language").empty(), "no language by default");
    settings.language = "de";
    argv = build_whisper_command("talk.mp4", WhisperModel::Base, "/tmp/x", settings);
    ok &= check(arg_after(argv, "--language") == "de", "language hint");

    ok &= check(parse_whisper_model("large") == WhisperModel::Large, "parse large");
    ok &= check(!parse_whisper_model("huge"), "reject unknown model");
    ok &= check(std::string(whisper_model_name(WhisperModel::Tiny)) == "tiny", "name tiny");
    return ok;
}

bool test_format_command() {
    return check(format_command({"ffmpeg", "-i", "my clip.mp4", "[0:v]"}) ==
                     "ffmpeg -i 'my clip.mp4' '[0:v]'",
                 "quoting for logs");
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_default_template();
    ok &= test_probed_geometry_and_offset();
    ok &= test_overlay_filter();
    ok &= test_whisper_command();
    ok &= test_format_command();
    if (!ok) {
        return 1;
    }
    std::cout << "encoder_command_unit OK\n";
    return 0;
}

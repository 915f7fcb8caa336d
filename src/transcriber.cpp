//
//  transcriber.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "transcriber.hpp"

#include <stdlib.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "subprocess.hpp"

using captionburn::errno_message;

namespace {

struct ModelName {
    WhisperModel model;
    const char *name;
};

constexpr ModelName kModelNames[] = {
    {WhisperModel::Tiny, "tiny"},     {WhisperModel::Base, "base"},
    {WhisperModel::Small, "small"},   {WhisperModel::Medium, "medium"},
    {WhisperModel::Large, "large"},
};

// mkdtemp-backed scratch directory, removed with its contents on scope exit.
class ScratchDir {
public:
    ScratchDir() {
        std::error_code ec;
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            base = "/tmp";
        }
        std::string tmpl = (base / "captionburn-XXXXXX").string();
        if (::mkdtemp(tmpl.data())) {
            path_ = tmpl;
        } else {
            CB_LOG("error", "mkdtemp failed for " << tmpl << " errno=" << errno_message(errno));
        }
    }
    ~ScratchDir() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            CB_LOG("warn", "could not remove " << path_ << ": " << ec.message());
        }
    }
    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

}  // namespace

std::optional<WhisperModel> parse_whisper_model(const std::string &name) {
    for (const auto &m : kModelNames) {
        if (name == m.name) {
            return m.model;
        }
    }
    return std::nullopt;
}

const char *whisper_model_name(WhisperModel model) {
    for (const auto &m : kModelNames) {
        if (m.model == model) {
            return m.name;
        }
    }
    return "base";
}

std::vector<std::string> build_whisper_command(const std::string &video_path, WhisperModel model,
                                               const std::string &output_dir,
                                               const TranscriberSettings &settings) {
    std::vector<std::string> argv = {settings.whisper_binary,
                                     video_path,
                                     "--model",
                                     whisper_model_name(model),
                                     "--output_format",
                                     "json",
                                     "--output_dir",
                                     output_dir,
                                     "--word_timestamps",
                                     "True",
                                     "--verbose",
                                     "False"};
    if (!settings.language.empty()) {
        argv.push_back("--language");
        argv.push_back(settings.language);
    }
    return argv;
}

std::optional<RawTranscript> transcribe(const std::string &video_path, WhisperModel model,
                                        const TranscriberSettings &settings) {
    ScratchDir scratch;
    if (scratch.path().empty()) {
        return std::nullopt;
    }
    CB_LOG("info", "transcribing " << video_path << " with model '" << whisper_model_name(model)
                                   << "'");
    const auto t0 = std::chrono::steady_clock::now();
    auto res = run_command(build_whisper_command(video_path, model, scratch.path(), settings));
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - t0)
                                .count();
    if (!res.spawned) {
        CB_LOG("error", "transcription: could not run " << settings.whisper_binary);
        return std::nullopt;
    }
    if (res.exit_code != 0) {
        CB_LOG("error", "transcription: " << settings.whisper_binary << " exited with "
                                          << res.exit_code);
        return std::nullopt;
    }
    const auto result_path = std::filesystem::path(scratch.path()) /
                             (std::filesystem::path(video_path).stem().string() + ".json");
    std::ifstream f(result_path);
    if (!f.is_open()) {
        CB_LOG("error", "transcription: no result at " << result_path.string());
        return std::nullopt;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    CB_LOG("debug", "transcription took " << elapsed_ms << " ms");
    return parse_raw_transcript(ss.str());
}

//
//  captionburn.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "captionburn.hpp"
#include "captionburn_version.hpp"

#include <chrono>
#include <filesystem>
#include <utility>

#include "frame_sink.hpp"
#include "logging.hpp"
#include "rgba_image.hpp"
#include "subtitle_loader.hpp"
#include "subtitle_timing.hpp"
#include "text_renderer.hpp"

namespace captionburn {

std::string version_string() { return CAPTIONBURN_VERSION_DISPLAY; }

namespace {

BurnStatus make_status(bool ok, std::string msg = {}) { return BurnStatus{ok, std::move(msg)}; }

SessionResult fail_session(std::string msg) {
    CB_LOG("error", msg);
    return SessionResult{make_status(false, std::move(msg)), std::nullopt};
}

// Probe the video and assemble the session around already-resolved subtitles.
SessionResult finish_session(const std::string &video_path, std::vector<SubtitleEntry> subtitles,
                             const SessionSettings &settings) {
    auto probe = probe_media(video_path, settings.ffprobe_binary);
    if (!probe) {
        return fail_session("Failed to probe video " + video_path);
    }
    Session session;
    session.video_path = video_path;
    session.subtitles = std::move(subtitles);
    session.probe = *probe;
    CB_LOG("info", "session: " << session.subtitles.size() << " subtitles, " << probe->width << "x"
                               << probe->height << " @ " << probe->fps << " fps, "
                               << probe->frame_count << " frames");
    return SessionResult{make_status(true), std::move(session)};
}

}  // namespace

SessionResult open_session(const std::string &video_path, const std::string &subtitle_path,
                           const SessionSettings &settings) {
    CB_LOG("debug", "open_session(file) video=" << video_path << " subtitles=" << subtitle_path);
    auto subtitles = load_subtitles_from_file(subtitle_path);
    if (!subtitles) {
        return fail_session("Failed to load subtitles: " + subtitle_path);
    }
    return finish_session(video_path, std::move(*subtitles), settings);
}

SessionResult open_session(const std::string &video_path, const RawTranscript &transcript,
                           const SessionSettings &settings) {
    CB_LOG("debug", "open_session(raw) video=" << video_path << " segments="
                                               << transcript.segments.size());
    return finish_session(video_path, load_subtitles_from_raw_transcript(transcript), settings);
}

SessionResult open_session(const std::string &video_path, WhisperModel model,
                           const SessionSettings &settings) {
    CB_LOG("debug", "open_session(transcribe) video=" << video_path
                                                      << " model=" << whisper_model_name(model));
    auto raw = transcribe(video_path, model, settings.transcriber);
    if (!raw) {
        return fail_session("Failed to transcribe " + video_path);
    }
    return finish_session(video_path, load_subtitles_from_raw_transcript(*raw), settings);
}

BurnStatus render_frames(const Session &session, const SubtitleOptions &options,
                         TextRenderer &renderer, FrameSink &sink, uint64_t *frames_written) {
    const MediaProbe &probe = session.probe;
    if (frames_written) {
        *frames_written = 0;
    }
    if (probe.fps <= 0.0 || probe.width == 0 || probe.height == 0) {
        return make_status(false, "Invalid media probe (zero size or frame rate)");
    }
    const RgbaImage blank(probe.width, probe.height);
    RgbaImage canvas(probe.width, probe.height);
    std::optional<size_t> last_index;

    for (uint64_t n = 0; n < probe.frame_count; ++n) {
        const auto frame = static_cast<int64_t>(n);
        auto index = select_active_subtitle(session.subtitles, frame, probe.fps);
        const RgbaImage *out = &blank;
        if (index) {
            const SubtitleEntry &entry = session.subtitles[*index];
            if (index != last_index) {
                CB_LOG("debug", "frame " << n << ": \"" << text_preview(entry.text) << "\" @ "
                                         << entry.start << "s");
            }
            const double t =
                static_cast<double>(frame - start_frame_for(entry.start, probe.fps)) / probe.fps;
            if (!renderer.render(entry.text, animation_scale(options.animation, t), options,
                                 canvas)) {
                return make_status(false, "Failed to render subtitle at frame " +
                                              std::to_string(n));
            }
            out = &canvas;
        }
        last_index = index;
        if (!sink.write_frame(out->pixels.data(), out->byte_size())) {
            std::string msg = "Frame " + std::to_string(n) + ": " + sink.describe_failure();
            CB_LOG("error", msg);
            return make_status(false, msg);
        }
        if (frames_written) {
            ++*frames_written;
        }
    }
    return make_status(true);
}

BurnStatus burn(const Session &session, const std::string &output_path,
                const SubtitleOptions &options, const EncoderSettings &settings) {
    const auto t0 = std::chrono::steady_clock::now();
    CB_LOG("debug", "burn video=" << session.video_path << " output=" << output_path
                                  << " subtitles=" << session.subtitles.size()
                                  << " offset=" << options.render_offset);
    std::error_code ec;
    if (!settings.overwrite && std::filesystem::exists(output_path, ec)) {
        std::string msg = "Output exists (use overwrite): " + output_path;
        CB_LOG("error", msg);
        return make_status(false, msg);
    }
    TextRenderer renderer(options.font_path);
    if (!renderer.ok() && !session.subtitles.empty()) {
        return make_status(false, renderer.error());
    }

    EncoderRequest request;
    request.input_path = session.video_path;
    request.output_path = output_path;
    request.fps_num = session.probe.fps_num;
    request.fps_den = session.probe.fps_den;
    request.width = session.probe.width;
    request.height = session.probe.height;
    request.render_offset = options.render_offset;

    EncoderSink sink;
    if (!sink.start(build_encoder_command(request, settings))) {
        std::string msg = "Failed to start encoder " + settings.ffmpeg_binary;
        CB_LOG("error", msg);
        return make_status(false, msg);
    }
    uint64_t frames = 0;
    BurnStatus status = render_frames(session, options, renderer, sink, &frames);
    // Runs on both paths: the encoder sees EOF and finishes (or fails) on its own.
    const int exit_code = sink.finish();
    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - t0)
                              .count();
    CB_LOG("debug", "burn: " << frames << "/" << session.probe.frame_count << " frames in "
                             << total_ms << " ms, encoder exit=" << exit_code);
    if (!status.ok) {
        return status;
    }
    if (exit_code != 0) {
        std::string msg = "Encoder exited with code " + std::to_string(exit_code);
        CB_LOG("error", msg);
        return make_status(false, msg);
    }
    return make_status(true);
}

}  // namespace captionburn

//
//  frame_sink.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "subprocess.hpp"

/// Destination of rendered overlay frames.
class FrameSink {
public:
    virtual ~FrameSink() = default;
    // False stops the burn.
    virtual bool write_frame(const uint8_t *data, size_t size) = 0;
    virtual std::string describe_failure() const { return "frame sink rejected a frame"; }
};

/// Feeds frames into the encoder's stdin.
class EncoderSink : public FrameSink {
public:
    bool start(const std::vector<std::string> &argv) { return process_.start(argv); }
    bool write_frame(const uint8_t *data, size_t size) override {
        return process_.write(data, size);
    }
    std::string describe_failure() const override;

    // Close the pipe and reap the encoder; returns its exit code.
    int finish() { return process_.close_and_wait(); }

private:
    PipedProcess process_;
};

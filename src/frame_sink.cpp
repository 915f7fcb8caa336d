//
//  frame_sink.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "frame_sink.hpp"

#include <cerrno>

#include "logging.hpp"

std::string EncoderSink::describe_failure() const {
    const int err = process_.last_error();
    if (err == EPIPE) {
        return "encoder closed its input early";
    }
    return "write to encoder failed errno=" + captionburn::errno_message(err);
}

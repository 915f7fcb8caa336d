//
//  text_filter.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Drop ASCII punctuation/symbols, keep letters, digits and non-ASCII sequences, collapse
// whitespace runs and trim.
std::string filter_alnum(const std::string &text);

// Uppercase ASCII letters; everything else is left untouched.
std::string to_upper_ascii(const std::string &text);

// Trim leading/trailing ASCII whitespace.
std::string trim_whitespace(const std::string &text);

// Decode UTF-8 into code points. Malformed bytes decode as U+FFFD.
std::vector<uint32_t> decode_utf8(const std::string &text);

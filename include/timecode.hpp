//
//  timecode.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace subseg {

// Width of a fixed "HH:MM:SS,mmm" timestamp.
inline constexpr size_t kTimecodeLength = 12;

// True if `text` holds a "DD:DD:DD[,.]DDD" timestamp starting exactly at `pos`.
bool timecode_at(std::string_view text, size_t pos);

// Position of the first timestamp at or after `from`, or std::string_view::npos.
size_t find_timecode(std::string_view text, size_t from = 0);

// Seconds offset of the first timestamp found in `text`. Returns 0.0 when none is present;
// malformed input is not an error.
double parse_timecode_seconds(std::string_view text);

// Render seconds as "HH:MM:SS,mmm" (millisecond rounding, negatives clamp to zero).
std::string format_timecode(double seconds);

}  // namespace subseg

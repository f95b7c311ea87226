//
//  timecode.cpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timecode.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace subseg {

namespace {

inline bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Decimal value of `count` digits starting at `pos`; caller has validated the range.
int digits_value(std::string_view text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        value = value * 10 + (text[pos + i] - '0');
    }
    return value;
}

}  // namespace

bool timecode_at(std::string_view text, size_t pos) {
    if (pos > text.size() || text.size() - pos < kTimecodeLength) {
        return false;
    }
    // Layout: D D : D D : D D [,.] D D D
    static constexpr size_t kDigitOffsets[] = {0, 1, 3, 4, 6, 7, 9, 10, 11};
    for (size_t off : kDigitOffsets) {
        if (!is_digit(text[pos + off])) {
            return false;
        }
    }
    const char sep = text[pos + 8];
    return text[pos + 2] == ':' && text[pos + 5] == ':' && (sep == ',' || sep == '.');
}

size_t find_timecode(std::string_view text, size_t from) {
    if (text.size() < kTimecodeLength) {
        return std::string_view::npos;
    }
    for (size_t pos = from; pos + kTimecodeLength <= text.size(); ++pos) {
        if (timecode_at(text, pos)) {
            return pos;
        }
    }
    return std::string_view::npos;
}

double parse_timecode_seconds(std::string_view text) {
    const size_t pos = find_timecode(text);
    if (pos == std::string_view::npos) {
        return 0.0;
    }
    const int hours = digits_value(text, pos, 2);
    const int minutes = digits_value(text, pos + 3, 2);
    const int seconds = digits_value(text, pos + 6, 2);
    const int millis = digits_value(text, pos + 9, 3);
    return hours * 3600.0 + minutes * 60.0 + seconds + millis / 1000.0;
}

std::string format_timecode(double seconds) {
    // Anything past ~285 million years is not a transcript offset.
    static constexpr double kMaxSeconds = 9.0e12;
    int64_t total_ms = 0;
    if (std::isfinite(seconds) && seconds > 0.0 && seconds < kMaxSeconds) {
        total_ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
    }
    const int64_t ms = total_ms % 1000;
    const int64_t total_s = total_ms / 1000;
    const int64_t s = total_s % 60;
    const int64_t m = (total_s / 60) % 60;
    const int64_t h = total_s / 3600;

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", static_cast<long long>(h),
                  static_cast<long long>(m), static_cast<long long>(s),
                  static_cast<long long>(ms));
    return buf;
}

}  // namespace subseg

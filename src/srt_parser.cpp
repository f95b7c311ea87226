//
//  srt_parser.cpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_parser.hpp"

#include <charconv>
#include <cstdint>
#include <utility>

#include "logging.hpp"
#include "timecode.hpp"

namespace subseg {

namespace {

constexpr std::string_view kAsciiWhitespace = " \t\n\v\f\r";
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kArrow = "-->";

// Multi-byte UTF-8 whitespace: NBSP, U+1680, U+2000..U+200A, U+2028, U+2029, U+202F,
// U+205F, U+3000 (ideographic space) and U+FEFF.
constexpr std::string_view kUtf8Whitespace[] = {
    "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82",
    "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8", "\xE2\x80\xA9",
    "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80", "\xEF\xBB\xBF",
};

// Byte length of the whitespace character starting at `pos`, or 0.
size_t whitespace_at(std::string_view s, size_t pos) {
    if (pos >= s.size()) {
        return 0;
    }
    if (kAsciiWhitespace.find(s[pos]) != std::string_view::npos) {
        return 1;
    }
    for (std::string_view ws : kUtf8Whitespace) {
        if (s.substr(pos, ws.size()) == ws) {
            return ws.size();
        }
    }
    return 0;
}

// Byte length of the whitespace character ending at `end` (exclusive), or 0.
size_t whitespace_before(std::string_view s, size_t end) {
    if (end == 0) {
        return 0;
    }
    if (kAsciiWhitespace.find(s[end - 1]) != std::string_view::npos) {
        return 1;
    }
    for (std::string_view ws : kUtf8Whitespace) {
        if (end >= ws.size() && s.substr(end - ws.size(), ws.size()) == ws) {
            return ws.size();
        }
    }
    return 0;
}

size_t skip_whitespace(std::string_view s, size_t pos) {
    while (size_t n = whitespace_at(s, pos)) {
        pos += n;
    }
    return pos;
}

std::string_view trim(std::string_view s) {
    const size_t first = skip_whitespace(s, 0);
    size_t last = s.size();
    while (last > first) {
        const size_t n = whitespace_before(s, last);
        if (n == 0) {
            break;
        }
        last -= n;
    }
    return s.substr(first, last - first);
}

bool is_blank(std::string_view s) { return skip_whitespace(s, 0) == s.size(); }

// Fold "\r\n" and lone "\r" into "\n".
std::string normalize_line_endings(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Split into blocks of non-blank lines; any whitespace-only line ends a block.
std::vector<std::vector<std::string>> split_blocks(std::string_view transcript) {
    if (transcript.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        transcript.remove_prefix(kUtf8Bom.size());
    }
    const std::string text = normalize_line_endings(transcript);

    std::vector<std::vector<std::string>> blocks;
    std::vector<std::string> current;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string::npos) {
            eol = text.size();
        }
        std::string_view line(text.data() + pos, eol - pos);
        if (is_blank(line)) {
            if (!current.empty()) {
                blocks.emplace_back(std::move(current));
                current.clear();
            }
        } else {
            current.emplace_back(line);
        }
        pos = eol + 1;
    }
    if (!current.empty()) {
        blocks.emplace_back(std::move(current));
    }
    return blocks;
}

// Integer prefix of a trimmed line: optional sign then digits, trailing text ignored.
std::optional<int64_t> parse_index(std::string_view line) {
    line = trim(line);
    bool negative = false;
    if (!line.empty() && (line.front() == '+' || line.front() == '-')) {
        negative = line.front() == '-';
        line.remove_prefix(1);
    }
    uint64_t magnitude = 0;
    const char *begin = line.data();
    const char *end = line.data() + line.size();
    auto [ptr, ec] = std::from_chars(begin, end, magnitude);
    if (ptr == begin || (ec != std::errc() && ec != std::errc::result_out_of_range)) {
        return std::nullopt;
    }
    // Oversized indices saturate; the index is informational and the cue is kept.
    constexpr uint64_t kMaxPositive = static_cast<uint64_t>(INT64_MAX);
    if (negative) {
        if (ec == std::errc::result_out_of_range || magnitude > kMaxPositive) {
            return INT64_MIN;
        }
        return -static_cast<int64_t>(magnitude);
    }
    if (ec == std::errc::result_out_of_range || magnitude > kMaxPositive) {
        return INT64_MAX;
    }
    return static_cast<int64_t>(magnitude);
}

// Search a time line for "TS <ws> --> <ws> TS"; returns both timestamps verbatim.
std::optional<std::pair<std::string, std::string>> match_time_line(std::string_view line) {
    line = trim(line);
    size_t pos = find_timecode(line);
    while (pos != std::string_view::npos) {
        size_t cursor = skip_whitespace(line, pos + kTimecodeLength);
        if (line.substr(cursor, kArrow.size()) == kArrow) {
            cursor = skip_whitespace(line, cursor + kArrow.size());
            if (timecode_at(line, cursor)) {
                return std::make_pair(std::string(line.substr(pos, kTimecodeLength)),
                                      std::string(line.substr(cursor, kTimecodeLength)));
            }
        }
        pos = find_timecode(line, pos + 1);
    }
    return std::nullopt;
}

BlockParseResult skipped(BlockSkipReason reason) {
    BlockParseResult res;
    res.skip_reason = reason;
    return res;
}

}  // namespace

const char *to_string(BlockSkipReason reason) {
    switch (reason) {
    case BlockSkipReason::None:
        return "none";
    case BlockSkipReason::TooFewLines:
        return "too few lines";
    case BlockSkipReason::InvalidIndex:
        return "invalid index line";
    case BlockSkipReason::InvalidTimeLine:
        return "invalid time line";
    }
    return "unknown";
}

BlockParseResult parse_srt_block(const std::vector<std::string> &lines) {
    if (lines.size() < 2) {
        return skipped(BlockSkipReason::TooFewLines);
    }
    auto index = parse_index(lines[0]);
    if (!index) {
        return skipped(BlockSkipReason::InvalidIndex);
    }
    auto times = match_time_line(lines[1]);
    if (!times) {
        return skipped(BlockSkipReason::InvalidTimeLine);
    }

    TimedEntry entry{};
    entry.index = *index;
    entry.start_time = std::move(times->first);
    entry.end_time = std::move(times->second);
    entry.start_sec = parse_timecode_seconds(entry.start_time);
    entry.end_sec = parse_timecode_seconds(entry.end_time);
    for (size_t i = 2; i < lines.size(); ++i) {
        if (i > 2) {
            entry.text += '\n';
        }
        entry.text += lines[i];
    }

    BlockParseResult res;
    res.entry = std::move(entry);
    return res;
}

std::vector<BlockParseResult> parse_srt_blocks(std::string_view transcript) {
    std::vector<BlockParseResult> results;
    auto blocks = split_blocks(transcript);
    results.reserve(blocks.size());
    for (const auto &block : blocks) {
        results.push_back(parse_srt_block(block));
    }
    return results;
}

std::vector<TimedEntry> parse_srt(std::string_view transcript) {
    std::vector<TimedEntry> entries;
    auto results = parse_srt_blocks(transcript);
    entries.reserve(results.size());
    size_t skipped_count = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        auto &res = results[i];
        if (!res.ok()) {
            ++skipped_count;
            SS_LOG("parser", "skipping block " << (i + 1) << ": " << to_string(res.skip_reason));
            continue;
        }
        entries.push_back(std::move(*res.entry));
    }
    SS_LOG("parser", "parsed " << entries.size() << " entries from " << results.size()
                               << " blocks (" << skipped_count << " skipped)");
    return entries;
}

#ifdef SUBSEG_TESTING
std::vector<std::vector<std::string>> split_blocks_for_test(std::string_view transcript) {
    return split_blocks(transcript);
}

std::optional<int64_t> parse_index_for_test(std::string_view line) { return parse_index(line); }
#endif

}  // namespace subseg

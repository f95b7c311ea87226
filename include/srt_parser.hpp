//
//  srt_parser.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "timed_entry.hpp"

namespace subseg {

enum class BlockSkipReason {
    None = 0,
    TooFewLines,      // fewer than two non-blank lines (no time line)
    InvalidIndex,     // first line does not start with an integer
    InvalidTimeLine,  // second line lacks "start --> end"
};

const char *to_string(BlockSkipReason reason);

// Outcome of parsing a single block: either an entry or the reason it was skipped.
struct BlockParseResult {
    std::optional<TimedEntry> entry;
    BlockSkipReason skip_reason = BlockSkipReason::None;

    bool ok() const { return entry.has_value(); }
};

// Parse one block given its non-blank lines (index, time line, text lines...).
BlockParseResult parse_srt_block(const std::vector<std::string> &lines);

// Parse every block of a transcript, keeping skipped blocks in the result.
std::vector<BlockParseResult> parse_srt_blocks(std::string_view transcript);

// Main parsing entry point: well-formed entries in source order. Malformed blocks are
// skipped; an empty result is left for the caller to judge.
std::vector<TimedEntry> parse_srt(std::string_view transcript);

#ifdef SUBSEG_TESTING
// Test-only wrappers that allow unit tests to exercise the block splitter and line matchers.
std::vector<std::vector<std::string>> split_blocks_for_test(std::string_view transcript);
std::optional<int64_t> parse_index_for_test(std::string_view line);
#endif

}  // namespace subseg

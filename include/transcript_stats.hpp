//
//  transcript_stats.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <vector>

#include "timed_entry.hpp"

namespace subseg {

/// @ingroup api
/// Aggregate numbers reported alongside a parse (and optional grouping) run.
struct TranscriptStats {
    size_t total_entries = 0;     ///< Entries parsed from the transcript
    size_t grouped_entries = 0;   ///< Entries or segments in the returned sequence
    double total_duration = 0.0;  ///< last.end_sec - first.start_sec of the parsed entries
};

// `result` is the returned sequence: the segments, or `entries` itself when not grouped.
TranscriptStats summarize_transcript(const std::vector<TimedEntry> &entries,
                                     const std::vector<TimedEntry> &result);

}  // namespace subseg

//
//  transcript_stats.cpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "transcript_stats.hpp"

namespace subseg {

TranscriptStats summarize_transcript(const std::vector<TimedEntry> &entries,
                                     const std::vector<TimedEntry> &result) {
    TranscriptStats stats{};
    stats.total_entries = entries.size();
    stats.grouped_entries = result.size();
    if (!entries.empty()) {
        // Source order, not min/max: out-of-order transcripts may yield a negative span.
        stats.total_duration = entries.back().end_sec - entries.front().start_sec;
    }
    return stats;
}

}  // namespace subseg

//
//  segment_grouper.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <vector>

#include "timed_entry.hpp"

namespace subseg {

/// @ingroup api
/// Thresholds for merging consecutive entries into segments.
struct GroupingOptions {
    double max_gap_seconds = 2.0;        ///< Largest gap (next start - open end) still merged
    double min_duration_seconds = 30.0;  ///< Open segment keeps growing while shorter than this
};

// State of the single left-to-right merge pass: finished segments plus the open one.
struct SegmentAccumulator {
    std::vector<Segment> closed;
    std::optional<Segment> open;
};

// Fold one entry into the accumulator. The open segment absorbs `entry` only if the gap is
// <= max_gap_seconds AND the segment is still shorter than min_duration_seconds; otherwise
// it is closed and `entry` opens the next one.
SegmentAccumulator accumulate_entry(SegmentAccumulator acc, const TimedEntry &entry,
                                    const GroupingOptions &options);

// Close the open segment (if any) and return all segments in order.
std::vector<Segment> finish_segments(SegmentAccumulator acc);

// Greedily merge consecutive entries into segments. Order is preserved; empty in, empty out.
std::vector<Segment> group_entries(const std::vector<TimedEntry> &entries,
                                   const GroupingOptions &options = {});

}  // namespace subseg

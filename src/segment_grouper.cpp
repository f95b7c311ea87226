//
//  segment_grouper.cpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "segment_grouper.hpp"

#include <utility>

#include "logging.hpp"

namespace subseg {

namespace {

bool should_extend(const Segment &open, const TimedEntry &entry, const GroupingOptions &options) {
    const double gap = entry.start_sec - open.end_sec;
    const double current_duration = open.end_sec - open.start_sec;
    // Negative gaps (overlapping cues) count as small gaps.
    return gap <= options.max_gap_seconds && current_duration < options.min_duration_seconds;
}

void extend(Segment &open, const TimedEntry &entry) {
    open.end_time = entry.end_time;
    open.end_sec = entry.end_sec;
    open.text += '\n';
    open.text += entry.text;
}

}  // namespace

SegmentAccumulator accumulate_entry(SegmentAccumulator acc, const TimedEntry &entry,
                                    const GroupingOptions &options) {
    if (!acc.open) {
        acc.open = entry;
        return acc;
    }
    if (should_extend(*acc.open, entry, options)) {
        extend(*acc.open, entry);
        return acc;
    }
    acc.closed.push_back(std::move(*acc.open));
    acc.open = entry;
    return acc;
}

std::vector<Segment> finish_segments(SegmentAccumulator acc) {
    if (acc.open) {
        acc.closed.push_back(std::move(*acc.open));
        acc.open.reset();
    }
    return std::move(acc.closed);
}

std::vector<Segment> group_entries(const std::vector<TimedEntry> &entries,
                                   const GroupingOptions &options) {
    SegmentAccumulator acc;
    for (const auto &entry : entries) {
        acc = accumulate_entry(std::move(acc), entry, options);
    }
    auto segments = finish_segments(std::move(acc));
    SS_LOG("grouper", "grouped " << entries.size() << " entries into " << segments.size()
                                 << " segments (max_gap=" << options.max_gap_seconds
                                 << "s min_duration=" << options.min_duration_seconds << "s)");
    return segments;
}

}  // namespace subseg

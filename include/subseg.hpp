//
//  subseg.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "segment_grouper.hpp"
#include "timed_entry.hpp"
#include "transcript_stats.hpp"

namespace subseg {

/// @defgroup api SubSeg Public API
/// Public, supported C++ interfaces for turning subtitle transcripts into timed segments.
/// @{

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., failure to open the transcript or no valid entries found).
 */
struct SegmentStatus {
    bool ok{false};
    std::string message;
};

/// Message reported when a transcript yields no well-formed blocks.
inline constexpr const char *kNoValidEntriesMessage = "no valid entries found";

/**
 * @brief Caller-supplied knobs for one parse run.
 *
 * `group == false` returns the parsed entries unmodified; the thresholds are then unused.
 */
struct SegmentOptions {
    bool group = false;          ///< Run the segment grouper
    double max_gap = 2.0;        ///< Seconds; see GroupingOptions::max_gap_seconds
    double min_duration = 30.0;  ///< Seconds; see GroupingOptions::min_duration_seconds

    GroupingOptions grouping() const { return GroupingOptions{max_gap, min_duration}; }
};

/**
 * @brief Outcome of a parse (and optional grouping) run.
 *
 * `entries` holds segments when grouping ran, otherwise the parsed entries. On failure
 * `entries` is empty and `stats` is zeroed.
 */
struct SegmentResult {
    SegmentStatus status;
    TranscriptStats stats;
    std::vector<TimedEntry> entries;
};

/**
 * @brief Return the SubSeg library version string (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/// Parse transcript text, optionally group it, and summarize.
SegmentResult segment_transcript(std::string_view transcript,
                                 const SegmentOptions &options = {});  ///< @ingroup api

/// Read a transcript file (e.g. `.srt`) and run segment_transcript() on its contents.
SegmentResult segment_srt_file(const std::string &path,
                               const SegmentOptions &options = {});  ///< @ingroup api

/**
 * @brief Overlay options from a JSON config file.
 *
 * Recognized keys: `group` (bool), `max_gap` (number), `min_duration` (number). Missing keys
 * leave `options` untouched. Wrong types, negative or non-finite numbers and malformed JSON
 * fail without modifying `options`.
 */
SegmentStatus load_options_json(const std::string &path,
                                SegmentOptions &options);  ///< @ingroup api

/// @}

}  // namespace subseg

//
//  result_json.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "subseg.hpp"
#include "timed_entry.hpp"
#include "transcript_stats.hpp"

namespace subseg {

// Keys follow the transcript API: startTime/endTime/startSec/endSec/text.
nlohmann::json to_json(const TimedEntry &entry);
nlohmann::json to_json(const TranscriptStats &stats);

// {"success": true, "stats": {...}, "entries": [...]} or {"success": false, "error": "..."}.
nlohmann::json to_json(const SegmentResult &result);

// {"startSec", "endSec", "excerptRange", "excerptText"} for the entries overlapping the range.
nlohmann::json excerpt_to_json(const std::vector<TimedEntry> &entries, double start_sec,
                               double end_sec);

// Serialize for output. Text that is not valid UTF-8 (e.g. Shift-JIS or Latin-1 transcripts)
// is written with U+FFFD substituted instead of throwing.
std::string dump_json(const nlohmann::json &j, int indent = 2);

}  // namespace subseg

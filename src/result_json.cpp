//
//  result_json.cpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "result_json.hpp"

#include "excerpt.hpp"
#include "timecode.hpp"

using json = nlohmann::json;

namespace subseg {

json to_json(const TimedEntry &entry) {
    json j;
    j["index"] = entry.index;
    j["startTime"] = entry.start_time;
    j["endTime"] = entry.end_time;
    j["startSec"] = entry.start_sec;
    j["endSec"] = entry.end_sec;
    j["text"] = entry.text;
    return j;
}

json to_json(const TranscriptStats &stats) {
    json j;
    j["totalEntries"] = stats.total_entries;
    j["groupedEntries"] = stats.grouped_entries;
    j["totalDuration"] = stats.total_duration;
    return j;
}

json to_json(const SegmentResult &result) {
    json j;
    j["success"] = result.status.ok;
    if (!result.status.ok) {
        j["error"] = result.status.message;
        return j;
    }
    j["stats"] = to_json(result.stats);
    json entries = json::array();
    for (const auto &entry : result.entries) {
        entries.push_back(to_json(entry));
    }
    j["entries"] = entries;
    return j;
}

json excerpt_to_json(const std::vector<TimedEntry> &entries, double start_sec, double end_sec) {
    json j;
    j["startSec"] = start_sec;
    j["endSec"] = end_sec;
    j["excerptRange"] = format_timecode(start_sec) + " --> " + format_timecode(end_sec);
    j["excerptText"] = extract_text_for_range(entries, start_sec, end_sec);
    return j;
}

std::string dump_json(const json &j, int indent) {
    return j.dump(indent, ' ', /*ensure_ascii=*/false, json::error_handler_t::replace);
}

}  // namespace subseg

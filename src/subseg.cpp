//
//  subseg.cpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "subseg.hpp"
#include "subseg_version.hpp"

#include <cerrno>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

#include "logging.hpp"
#include "segment_grouper.hpp"
#include "srt_parser.hpp"
#include "transcript_stats.hpp"

using json = nlohmann::json;

namespace subseg {

std::string version_string() { return SUBSEG_VERSION_DISPLAY; }

namespace {

SegmentStatus make_status(bool ok, std::string msg = {}) {
    return SegmentStatus{ok, std::move(msg)};
}

std::string errno_text(int err) {
    return "errno=" + std::to_string(err) + " (" + std::generic_category().message(err) + ")";
}

bool read_text_file(const std::string &path, std::string &out, std::string &error) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        error = "open failed for " + path + " " + errno_text(errno);
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    if (f.bad()) {
        error = "read failed for " + path + " " + errno_text(errno);
        return false;
    }
    return true;
}

// Reads an optional non-negative finite number; false if present but unusable.
bool read_threshold(const json &j, const char *key, double &out, std::string &error) {
    if (!j.contains(key)) {
        return true;
    }
    const auto &v = j.at(key);
    if (!v.is_number()) {
        error = std::string("'") + key + "' must be a number";
        return false;
    }
    const double value = v.get<double>();
    if (!std::isfinite(value) || value < 0.0) {
        error = std::string("'") + key + "' must be a finite, non-negative number";
        return false;
    }
    out = value;
    return true;
}

}  // namespace

SegmentResult segment_transcript(std::string_view transcript, const SegmentOptions &options) {
    const auto t0 = std::chrono::steady_clock::now();
    SS_LOG("debug", "segment_transcript bytes=" << transcript.size() << " group=" << options.group
                                                << " max_gap=" << options.max_gap
                                                << " min_duration=" << options.min_duration);
    SegmentResult res;
    auto entries = parse_srt(transcript);
    if (entries.empty()) {
        res.status = make_status(false, kNoValidEntriesMessage);
        SS_LOG("warn", "transcript contained no well-formed subtitle blocks");
        return res;
    }

    if (options.group) {
        res.entries = group_entries(entries, options.grouping());
    } else {
        res.entries = entries;
    }
    res.stats = summarize_transcript(entries, res.entries);
    res.status = make_status(true);

    const auto t1 = std::chrono::steady_clock::now();
    SS_LOG("info", "entries=" << res.stats.total_entries << " returned="
                              << res.stats.grouped_entries
                              << " duration=" << res.stats.total_duration << "s in "
                              << std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0)
                                     .count()
                              << "us");
    if (!res.entries.empty()) {
        SS_LOG("debug", "first: [" << res.entries.front().start_time << " --> "
                                   << res.entries.front().end_time << "] \""
                                   << text_preview(res.entries.front().text) << "\"");
    }
    return res;
}

SegmentResult segment_srt_file(const std::string &path, const SegmentOptions &options) {
    std::string content;
    std::string error;
    if (!read_text_file(path, content, error)) {
        SS_LOG("error", error);
        SegmentResult res;
        res.status = make_status(false, error);
        return res;
    }
    SS_LOG("debug", "read " << content.size() << " bytes from " << path);
    return segment_transcript(content, options);
}

SegmentStatus load_options_json(const std::string &path, SegmentOptions &options) {
    std::string content;
    std::string error;
    if (!read_text_file(path, content, error)) {
        SS_LOG("error", error);
        return make_status(false, error);
    }
    json j = json::parse(content, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        std::string msg = "malformed JSON in " + path;
        SS_LOG("error", msg);
        return make_status(false, msg);
    }
    if (!j.is_object()) {
        std::string msg = "config " + path + " must contain a JSON object";
        SS_LOG("error", msg);
        return make_status(false, msg);
    }

    SegmentOptions updated = options;
    if (j.contains("group")) {
        if (!j["group"].is_boolean()) {
            std::string msg = "config " + path + ": 'group' must be a boolean";
            SS_LOG("error", msg);
            return make_status(false, msg);
        }
        updated.group = j["group"].get<bool>();
    }
    if (!read_threshold(j, "max_gap", updated.max_gap, error) ||
        !read_threshold(j, "min_duration", updated.min_duration, error)) {
        std::string msg = "config " + path + ": " + error;
        SS_LOG("error", msg);
        return make_status(false, msg);
    }
    options = updated;
    SS_LOG("debug", "loaded options from " << path << " group=" << options.group
                                           << " max_gap=" << options.max_gap
                                           << " min_duration=" << options.min_duration);
    return make_status(true);
}

}  // namespace subseg

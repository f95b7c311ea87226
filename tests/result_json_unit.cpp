// Validates the JSON records handed to callers (entry keys, stats, failure shape, excerpts).
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "result_json.hpp"
#include "subseg.hpp"
#include "test_utils.hpp"

using json = nlohmann::json;
using test_utils::join_blocks;
using test_utils::srt_block;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[result_json_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

}  // namespace

int main() {
    bool ok = true;

    const std::string srt = join_blocks({srt_block(4, "00:00:01,250", "00:00:03,000", "Budget"),
                                         srt_block(5, "00:00:03,500", "00:00:06,000", "Vote")});
    subseg::SegmentOptions opts;
    opts.group = true;
    auto res = subseg::segment_transcript(srt, opts);
    json j = subseg::to_json(res);

    ok &= check(j.value("success", false), "success flag");
    ok &= check(j["stats"]["totalEntries"] == 2 && j["stats"]["groupedEntries"] == 1,
                "stats counts");
    ok &= check(j["stats"]["totalDuration"].get<double>() == 4.75, "stats duration");
    ok &= check(j["entries"].is_array() && j["entries"].size() == 1, "entries array");
    if (j["entries"].size() == 1) {
        const json &e = j["entries"][0];
        ok &= check(e["index"] == 4, "entry index");
        ok &= check(e["startTime"] == "00:00:01,250" && e["endTime"] == "00:00:06,000",
                    "entry timestamps");
        ok &= check(e["startSec"].get<double>() == 1.25 && e["endSec"].get<double>() == 6.0,
                    "entry seconds");
        ok &= check(e["text"] == "Budget\nVote", "entry text");
    }

    auto failed = subseg::to_json(subseg::segment_transcript("nothing here", {}));
    ok &= check(failed["success"] == false, "failure flag");
    ok &= check(failed["error"] == subseg::kNoValidEntriesMessage, "failure message");
    ok &= check(!failed.contains("entries") && !failed.contains("stats"),
                "failure has no payload");

    const std::vector<subseg::TimedEntry> entries = {
        test_utils::make_entry(1, 60.0, 65.0, "Item one"),
        test_utils::make_entry(2, 66.0, 70.0, "Item two"),
        test_utils::make_entry(3, 130.0, 131.0, "Later")};
    json ex = subseg::excerpt_to_json(entries, 61.5, 68.0);
    ok &= check(ex["excerptRange"] == "00:01:01,500 --> 00:01:08,000", "excerpt range text");
    ok &= check(ex["excerptText"] == "Item one\nItem two", "excerpt text");
    ok &= check(ex["startSec"].get<double>() == 61.5 && ex["endSec"].get<double>() == 68.0,
                "excerpt bounds");

    // Shift-JIS text survives parsing untouched; output substitutes U+FFFD instead of throwing.
    const std::string sjis = srt_block(1, "00:00:00,000", "00:00:02,000",
                                       "\x82\xb1\x82\xf1\x82\xc9\x82\xbf\x82\xcd");
    auto sjis_res = subseg::segment_transcript(sjis, {});
    ok &= check(sjis_res.status.ok && sjis_res.entries.size() == 1 &&
                    sjis_res.entries[0].text.size() == 10,
                "non-UTF-8 text parsed verbatim");
    std::string dumped;
    bool threw = false;
    try {
        dumped = subseg::dump_json(subseg::to_json(sjis_res));
    } catch (const json::exception &e) {
        threw = true;
        std::cerr << "[result_json_unit] dump threw: " << e.what() << "\n";
    }
    ok &= check(!threw, "dump_json does not throw on invalid UTF-8");
    ok &= check(dumped.find("\xEF\xBF\xBD") != std::string::npos,
                "invalid bytes replaced by U+FFFD");
    ok &= check(dumped.find("00:00:02,000") != std::string::npos, "rest of the record intact");
    ok &= check(subseg::dump_json(json{{"text", "plain"}}, -1) == "{\"text\":\"plain\"}",
                "valid text unchanged, compact form");

    return ok ? 0 : 1;
}

// Unit test for the public segmentation API: end-to-end runs, file input and failure status.
#include <cstdio>
#include <filesystem>
#include <string>

#include "logging.hpp"
#include "subseg.hpp"
#include "test_utils.hpp"

#ifndef TESTDATA_DIR
#error "TESTDATA_DIR must be defined"
#endif

using test_utils::join_blocks;
using test_utils::srt_block;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[segment_api_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

const std::string kHelloWorld =
    join_blocks({srt_block(1, "00:00:00,000", "00:00:02,000", "Hello"),
                 srt_block(2, "00:00:02,500", "00:00:05,000", "World")});

bool test_hello_world_grouped() {
    subseg::SegmentOptions opts;
    opts.group = true;
    opts.max_gap = 1.0;
    opts.min_duration = 100.0;
    auto res = subseg::segment_transcript(kHelloWorld, opts);
    bool ok = check(res.status.ok && res.status.message.empty(), "grouped run succeeds");
    ok &= check(res.entries.size() == 1, "two entries merge into one segment");
    if (!ok) {
        return false;
    }
    ok &= check(res.entries[0].start_sec == 0.0 && res.entries[0].end_sec == 5.0,
                "segment spans 0..5");
    ok &= check(res.entries[0].start_time == "00:00:00,000" &&
                    res.entries[0].end_time == "00:00:05,000",
                "segment timestamps from first/last entry");
    ok &= check(res.entries[0].text == "Hello\nWorld", "segment text");
    ok &= check(res.stats.total_entries == 2 && res.stats.grouped_entries == 1 &&
                    res.stats.total_duration == 5.0,
                "stats for grouped run");
    return ok;
}

bool test_hello_world_gap_too_large() {
    subseg::SegmentOptions opts;
    opts.group = true;
    opts.max_gap = 0.1;
    auto res = subseg::segment_transcript(kHelloWorld, opts);
    bool ok = check(res.status.ok && res.entries.size() == 2, "gap of 0.5 exceeds 0.1");
    ok &= check(res.entries.size() == 2 && res.entries[0].text == "Hello" &&
                    res.entries[0].end_sec == 2.0 && res.entries[1].text == "World" &&
                    res.entries[1].start_sec == 2.5,
                "segments equal the original entries");
    return ok;
}

bool test_grouping_disabled() {
    subseg::SegmentOptions opts;  // group = false by default
    opts.max_gap = 100.0;
    opts.min_duration = 1000.0;
    auto res = subseg::segment_transcript(kHelloWorld, opts);
    bool ok = check(res.status.ok && res.entries.size() == 2, "entries returned unmodified");
    ok &= check(res.stats.total_entries == 2 && res.stats.grouped_entries == 2,
                "stats report identical counts");
    return ok;
}

bool test_no_entries() {
    subseg::set_log_verbosity(subseg::LogVerbosity::Warn);
    subseg::SegmentResult res;
    auto log_text = test_utils::capture_stderr(
        [&]() { res = subseg::segment_transcript("just some prose\n\nand more", {}); });
    bool ok = check(!res.status.ok, "no entries is a failed status");
    ok &= check(res.status.message == subseg::kNoValidEntriesMessage, "failure message");
    ok &= check(res.entries.empty() && res.stats.total_entries == 0 &&
                    res.stats.total_duration == 0.0,
                "failure leaves empty result");
    ok &= check(log_text.find("no well-formed subtitle blocks") != std::string::npos,
                "failure logged as warning");
    subseg::set_log_verbosity(subseg::LogVerbosity::Info);
    return ok;
}

bool test_fixture_file() {
    const std::filesystem::path testdata(TESTDATA_DIR);
    subseg::SegmentOptions opts;
    opts.group = true;
    auto res = subseg::segment_srt_file((testdata / "council_meeting.srt").string(), opts);
    bool ok = check(res.status.ok, "fixture parses");
    ok &= check(res.stats.total_entries == 9, "fixture has 9 valid entries");
    ok &= check(res.stats.grouped_entries == 4 && res.entries.size() == 4,
                "default thresholds give 4 segments");
    ok &= check(res.stats.total_duration == 82.0, "fixture duration");
    if (res.entries.size() != 4) {
        return false;
    }
    ok &= check(res.entries[0].start_sec == 0.0 && res.entries[0].end_sec == 33.0,
                "first segment closes after crossing 30s");
    ok &= check(res.entries[1].text == "Seconded.", "short segment isolated by the gap after it");
    ok &= check(res.entries[2].start_time == "00:00:45,000" &&
                    res.entries[2].end_time == "00:01:20,000",
                "third segment timestamps");
    ok &= check(res.entries[3].index == 9 && res.entries[3].text == "Thank you.",
                "last segment is the trailing entry");
    return ok;
}

bool test_missing_file() {
    subseg::set_log_verbosity(subseg::LogVerbosity::Error);
    subseg::SegmentResult res;
    auto log_text = test_utils::capture_stderr([&]() {
        res = subseg::segment_srt_file("/nonexistent/subseg/none.srt", {});
    });
    subseg::set_log_verbosity(subseg::LogVerbosity::Info);
    bool ok = check(!res.status.ok, "missing file fails");
    ok &= check(res.status.message.find("/nonexistent/subseg/none.srt") != std::string::npos,
                "message names the path");
    ok &= check(log_text.find("[SubSeg][error]") != std::string::npos, "error logged");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_hello_world_grouped();
    ok &= test_hello_world_gap_too_large();
    ok &= test_grouping_disabled();
    ok &= test_no_entries();
    ok &= test_fixture_file();
    ok &= test_missing_file();
    ok &= check(!subseg::version_string().empty(), "version string set");
    return ok ? 0 : 1;
}

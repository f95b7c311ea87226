// Shared helpers for the SubSeg test executables: fixtures built in memory so each test
// states its own transcript.
#pragma once

#include <cmath>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "timed_entry.hpp"

namespace test_utils {

inline bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

// One SRT block: index line, time line, then text lines.
inline std::string srt_block(int index, const std::string &start, const std::string &end,
                             const std::string &text) {
    return std::to_string(index) + "\n" + start + " --> " + end + "\n" + text;
}

inline std::string join_blocks(const std::vector<std::string> &blocks,
                               const std::string &separator = "\n\n") {
    std::string out;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += blocks[i];
    }
    return out;
}

inline subseg::TimedEntry make_entry(int64_t index, double start_sec, double end_sec,
                                     const std::string &text) {
    subseg::TimedEntry e{};
    e.index = index;
    e.start_sec = start_sec;
    e.end_sec = end_sec;
    e.start_time = "start#" + std::to_string(index);
    e.end_time = "end#" + std::to_string(index);
    e.text = text;
    return e;
}

// Capture stderr (where SS_LOG writes) while a function runs.
template <typename Fn>
std::string capture_stderr(Fn &&fn) {
    std::ostringstream oss;
    auto *old_buf = std::cerr.rdbuf(oss.rdbuf());
    fn();
    std::cerr.rdbuf(old_buf);
    return oss.str();
}

}  // namespace test_utils

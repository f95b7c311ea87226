//
//  logging.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace subseg {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI/config level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Short, single-line preview of transcript text for debug logs.
inline constexpr size_t kTextPreviewChars = 32;
inline std::string text_preview(std::string_view text, size_t max_len = kTextPreviewChars) {
    std::string out(text.substr(0, std::min(max_len, text.size())));
    std::replace(out.begin(), out.end(), '\n', ' ');
    if (text.size() > max_len) {
        out += "...";
    }
    return out;
}

}  // namespace subseg

inline constexpr subseg::LogVerbosity ss_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return subseg::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return subseg::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return subseg::LogVerbosity::Info;
    }
    // Everything else (parser/grouper/config/etc.) treated as debug-level.
    return subseg::LogVerbosity::Debug;
}

inline bool ss_should_log(const char* level) {
    const auto current = subseg::get_log_verbosity();
    const auto sev = ss_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void ss_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[SubSeg][" << level << "][" << file << ":" << line << " " << func << "] "
                  << msg << std::endl;
    } else {
        std::cerr << "[SubSeg][" << level << "] " << msg << std::endl;
    }
}

#define SS_LOG(level, message)                                              \
    do {                                                                    \
        if (ss_should_log(level)) {                                         \
            std::ostringstream _ss_log_ss;                                  \
            _ss_log_ss << message;                                          \
            ss_log_impl(level, _ss_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)

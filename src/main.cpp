//
//  main.cpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "result_json.hpp"
#include "subseg.hpp"
#include "subseg_version.hpp"
#include "timecode.hpp"
#include <nlohmann/json.hpp>

// Accepts plain seconds ("12.5") or a timestamp ("00:00:12,500").
std::optional<double> parse_seconds_arg(const std::string &s) {
    if (subseg::find_timecode(s) != std::string::npos) {
        return subseg::parse_timecode_seconds(s);
    }
    if (s.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v) || v < 0.0) {
        return std::nullopt;
    }
    return v;
}

void print_usage() {
    std::cerr << "SubSeg " << SUBSEG_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  subseg <transcript.srt> [--group] [--max-gap SEC] [--min-duration SEC]\n"
              << "         [--config FILE] [--log-level warn|info|debug]\n"
              << "  subseg <transcript.srt> --range START END [--log-level warn|info|debug]\n"
              << "Options:\n"
              << "  --group             Merge consecutive entries into segments.\n"
              << "  --max-gap SEC       Largest gap between entries that still merges (default: 2).\n"
              << "  --min-duration SEC  Segments keep growing while shorter than this (default: 30).\n"
              << "  --config FILE       JSON file with group/max_gap/min_duration; flags override.\n"
              << "  --range START END   Print the text overlapping START..END (seconds or\n"
              << "                      HH:MM:SS,mmm) instead of the entry list.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  -h, --help          Show this help.\n"
              << "JSON is always written to stdout.\n";
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "SubSeg " << SUBSEG_VERSION_DISPLAY << "\n";
        return 0;
    }
    if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        print_usage();
        return 0;
    }

    // Flags are applied after --config so they win regardless of argument order.
    std::vector<std::string> positional;
    std::string config_path;
    std::optional<bool> group;
    std::optional<double> max_gap;
    std::optional<double> min_duration;
    std::optional<double> range_start;
    std::optional<double> range_end;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--group") {
            group = true;
        } else if ((arg == "--max-gap" || arg == "--min-duration") && i + 1 < argc) {
            auto value = parse_seconds_arg(argv[++i]);
            if (!value) {
                std::cerr << "Invalid value for " << arg << ": " << argv[i] << "\n";
                return 2;
            }
            (arg == "--max-gap" ? max_gap : min_duration) = *value;
        } else if (arg == "--range" && i + 2 < argc) {
            range_start = parse_seconds_arg(argv[i + 1]);
            range_end = parse_seconds_arg(argv[i + 2]);
            if (!range_start || !range_end) {
                std::cerr << "Invalid --range: " << argv[i + 1] << " " << argv[i + 2] << "\n";
                return 2;
            }
            i += 2;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            subseg::set_log_verbosity(subseg::parse_log_verbosity(argv[i + 1]));
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }
    if (positional.size() != 1) {
        std::cerr << "Invalid arguments. See --help for usage.\n";
        return 2;
    }
    const std::string input_path = positional[0];

    subseg::SegmentOptions options;
    if (!config_path.empty()) {
        auto status = subseg::load_options_json(config_path, options);
        if (!status.ok) {
            std::cerr << "Invalid config: " << status.message << "\n";
            return 2;
        }
    }
    if (group) options.group = *group;
    if (max_gap) options.max_gap = *max_gap;
    if (min_duration) options.min_duration = *min_duration;

    if (range_start) {
        if (options.group) {
            SS_LOG("debug", "--range uses ungrouped entries; ignoring grouping options");
        }
        options.group = false;
        auto res = subseg::segment_srt_file(input_path, options);
        if (!res.status.ok) {
            SS_LOG("error", "subseg: failed to parse transcript: " << res.status.message);
            std::cout << subseg::dump_json(subseg::to_json(res)) << "\n";
            return 1;
        }
        std::cout << subseg::dump_json(
                         subseg::excerpt_to_json(res.entries, *range_start, *range_end))
                  << "\n";
        return 0;
    }

    auto res = subseg::segment_srt_file(input_path, options);
    std::cout << subseg::dump_json(subseg::to_json(res)) << "\n";
    if (!res.status.ok) {
        SS_LOG("error", "subseg: failed to parse transcript: " << res.status.message);
        return 1;
    }
    return 0;
}

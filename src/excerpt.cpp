//
//  excerpt.cpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "excerpt.hpp"

namespace subseg {

std::vector<TimedEntry> entries_in_range(const std::vector<TimedEntry> &entries,
                                         double start_sec, double end_sec) {
    std::vector<TimedEntry> out;
    for (const auto &entry : entries) {
        if (entry.end_sec >= start_sec && entry.start_sec <= end_sec) {
            out.push_back(entry);
        }
    }
    return out;
}

std::string extract_text_for_range(const std::vector<TimedEntry> &entries, double start_sec,
                                   double end_sec) {
    std::string text;
    bool first = true;
    for (const auto &entry : entries_in_range(entries, start_sec, end_sec)) {
        if (!first) {
            text += '\n';
        }
        text += entry.text;
        first = false;
    }
    return text;
}

}  // namespace subseg

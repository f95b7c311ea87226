//
//  excerpt.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "timed_entry.hpp"

namespace subseg {

// Entries overlapping the closed range [start_sec, end_sec], in source order.
std::vector<TimedEntry> entries_in_range(const std::vector<TimedEntry> &entries,
                                         double start_sec, double end_sec);

// Newline-joined text of the overlapping entries; empty when nothing overlaps.
std::string extract_text_for_range(const std::vector<TimedEntry> &entries, double start_sec,
                                   double end_sec);

}  // namespace subseg

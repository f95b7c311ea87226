//
//  timed_entry.hpp
//  SubSeg
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

namespace subseg {

/// @ingroup api
/// One subtitle cue as declared in the transcript.
struct TimedEntry {
    int64_t index = 0;       ///< Sequence number as written in the source (not validated)
    std::string start_time;  ///< Start timestamp, verbatim (e.g. "00:00:01,500")
    std::string end_time;    ///< End timestamp, verbatim
    double start_sec = 0.0;  ///< Start offset in seconds
    double end_sec = 0.0;    ///< End offset in seconds (not forced >= start_sec)
    std::string text;        ///< Spoken content, lines joined with '\n'
};

/// @ingroup api
/// One or more merged entries; start fields come from the first entry, end fields from the last.
using Segment = TimedEntry;

}  // namespace subseg

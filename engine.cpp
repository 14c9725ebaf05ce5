//
//  engine.cpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#include <sstream>

#include "engine.hpp"

/* whisper timestamps have a 10ms resolution */
static constexpr double time_tolerance = 0.01;

bool check_segments(const std::vector<LocalSegment> &segments, double duration,
                    std::string &error) {
  double prev_end{0};
  for (size_t i = 0; i < segments.size(); i++) {
    const auto &segment = segments[i];
    std::stringstream ss;
    if (segment.start < 0 || segment.end < segment.start) {
      ss << "segment " << i << " has invalid span [" << segment.start << ", "
         << segment.end << "]";
    } else if (segment.end > duration + time_tolerance) {
      ss << "segment " << i << " ends at " << segment.end
         << " beyond window duration " << duration;
    } else if (segment.start + time_tolerance < prev_end) {
      ss << "segment " << i << " starts at " << segment.start
         << " before previous end " << prev_end;
    }
    if (!ss.str().empty()) {
      error = ss.str();
      return false;
    }
    prev_end = segment.end;
  }
  return true;
}

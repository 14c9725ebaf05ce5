//
//  segment.hpp
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

#ifndef _SEGMENT_HPP_
#define _SEGMENT_HPP_

#include <string>

/* engine output, times in seconds relative to the window start */
struct LocalSegment {
  std::string text;
  double start{0};
  double end{0};
};

/* segment on the session time axis */
struct GlobalSegment {
  std::string text;
  double start{0};
  double end{0};
};

#endif

//
//  audio.hpp
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

#ifndef _AUDIO_HPP_
#define _AUDIO_HPP_

#include <cstdint>
#include <vector>

/* block of mono samples, position is the global index of the first sample */
struct AudioFrame {
  uint64_t position{0};
  std::vector<int16_t> samples;
};

/* span of audio submitted as one unit to the engine */
struct Window {
  uint64_t index{0};
  uint64_t start_sample{0};
  uint32_t sample_rate{16000};
  bool final{false};
  std::vector<int16_t> samples;

  double global_start() const {
    return static_cast<double>(start_sample) / sample_rate;
  }
  double global_end() const {
    return static_cast<double>(start_sample + samples.size()) / sample_rate;
  }
  double duration() const {
    return static_cast<double>(samples.size()) / sample_rate;
  }
};

#endif

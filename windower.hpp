//
//  windower.hpp
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

#ifndef _WINDOWER_HPP_
#define _WINDOWER_HPP_

#include <cstdint>
#include <vector>

#include "audio.hpp"
#include "config.hpp"

/*
 * Slices the incoming frames into overlapping windows.
 * Window N always spans samples [N * stride, N * stride + window), whatever
 * the frame sizes are. Only the audio from the next window start on is kept
 * buffered, which is the overlap once a window has been emitted.
 */
class Windower {
public:
  explicit Windower(const Config &config);
  Windower(const Windower &) = delete;

  /* returns the windows completed by this frame, possibly none */
  std::vector<Window> push(const AudioFrame &frame);
  /* emits the end of stream partial window, once */
  bool flush(Window &out);
  void reset();

  uint64_t get_next_position() const { return buffer_start_ + buffer_.size(); }
  uint64_t get_padded_samples() const { return padded_samples_; }
  uint64_t get_windows_num() const { return window_index_; }

private:
  uint32_t rate_;
  uint32_t window_samples_;
  uint32_t stride_samples_;
  uint32_t min_flush_samples_;
  std::vector<int16_t> buffer_;
  uint64_t buffer_start_{0};
  uint64_t covered_end_{0};
  uint64_t window_index_{0};
  uint64_t padded_samples_{0};
  bool flushed_{false};
};

#endif

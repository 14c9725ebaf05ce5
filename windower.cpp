//
//  windower.cpp
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

#include <algorithm>

#include "log.hpp"
#include "windower.hpp"

Windower::Windower(const Config &config)
    : rate_(config.get_sample_rate()),
      window_samples_(config.get_window_samples()),
      stride_samples_(config.get_stride_samples()),
      min_flush_samples_(config.get_min_flush_samples()) {
  buffer_.reserve(window_samples_ + config.get_chunk_samples());
}

void Windower::reset() {
  buffer_.clear();
  buffer_start_ = 0;
  covered_end_ = 0;
  window_index_ = 0;
  padded_samples_ = 0;
  flushed_ = false;
}

std::vector<Window> Windower::push(const AudioFrame &frame) {
  std::vector<Window> windows;
  if (flushed_) {
    BOOST_LOG_TRIVIAL(warning) << "windower:: frame at " << frame.position
                               << " pushed after flush, ignored";
    return windows;
  }

  uint64_t expected = get_next_position();
  size_t skip = 0;
  if (frame.position > expected) {
    /* source skipped audio, keep the time axis by padding with silence */
    uint64_t gap = frame.position - expected;
    BOOST_LOG_TRIVIAL(warning)
        << "windower:: audio underrun, padding " << gap
        << " samples at " << expected;
    buffer_.insert(buffer_.end(), gap, 0);
    padded_samples_ += gap;
  } else if (frame.position < expected) {
    skip = std::min<uint64_t>(expected - frame.position, frame.samples.size());
    BOOST_LOG_TRIVIAL(debug) << "windower:: dropping " << skip
                             << " already buffered samples at "
                             << frame.position;
  }
  buffer_.insert(buffer_.end(), frame.samples.begin() + skip,
                 frame.samples.end());

  while (buffer_.size() >= window_samples_) {
    Window window;
    window.index = window_index_++;
    window.start_sample = buffer_start_;
    window.sample_rate = rate_;
    window.samples.assign(buffer_.begin(), buffer_.begin() + window_samples_);
    covered_end_ = buffer_start_ + window_samples_;

    BOOST_LOG_TRIVIAL(debug) << "windower:: window " << window.index
                             << " start " << window.global_start() << "s";
    windows.push_back(std::move(window));

    /* keep the overlap for the next window */
    buffer_.erase(buffer_.begin(), buffer_.begin() + stride_samples_);
    buffer_start_ += stride_samples_;
  }

  return windows;
}

bool Windower::flush(Window &out) {
  if (flushed_)
    return false;
  flushed_ = true;

  uint64_t end = get_next_position();
  if (end <= covered_end_ || buffer_.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "windower:: nothing to flush";
    buffer_.clear();
    return false;
  }
  if (buffer_.size() < min_flush_samples_) {
    BOOST_LOG_TRIVIAL(info) << "windower:: skipping flush, only "
                            << buffer_.size() << " samples buffered";
    buffer_.clear();
    return false;
  }

  out.index = window_index_++;
  out.start_sample = buffer_start_;
  out.sample_rate = rate_;
  out.final = true;
  out.samples.swap(buffer_);
  buffer_.clear();
  buffer_start_ = end;
  covered_end_ = end;

  BOOST_LOG_TRIVIAL(debug) << "windower:: final window " << out.index
                           << " start " << out.global_start() << "s duration "
                           << out.duration() << "s";
  return true;
}

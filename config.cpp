//
//  config.cpp
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

#include "config.hpp"

void Config::validate() const {
  std::stringstream ss;
  if (sample_rate_ != sample_rate_hz) {
    ss << "sample rate " << sample_rate_ << " not supported, expected "
       << sample_rate_hz;
  } else if (window_seconds_ <= 0) {
    ss << "window duration must be positive, got " << window_seconds_;
  } else if (overlap_seconds_ < 0) {
    ss << "overlap duration cannot be negative, got " << overlap_seconds_;
  } else if (overlap_seconds_ >= window_seconds_ ||
             get_overlap_samples() >= get_window_samples()) {
    ss << "overlap " << overlap_seconds_ << "s must be shorter than window "
       << window_seconds_ << "s";
  } else if (min_flush_seconds_ < 0 || min_flush_seconds_ > window_seconds_) {
    ss << "minimum flush duration " << min_flush_seconds_
       << "s out of range [0, " << window_seconds_ << "]";
  } else if (rms_threshold_ < 0 || peak_threshold_ < 0) {
    ss << "silence thresholds cannot be negative";
  } else if (flush_rms_threshold_ < rms_threshold_ ||
             flush_peak_threshold_ < peak_threshold_) {
    ss << "flush thresholds (" << flush_rms_threshold_ << ", "
       << flush_peak_threshold_ << ") looser than silence thresholds ("
       << rms_threshold_ << ", " << peak_threshold_ << ")";
  } else if (start_rms_threshold_ < rms_threshold_ ||
             start_peak_threshold_ < peak_threshold_) {
    ss << "start gate thresholds (" << start_rms_threshold_ << ", "
       << start_peak_threshold_ << ") looser than silence thresholds ("
       << rms_threshold_ << ", " << peak_threshold_ << ")";
  } else if (chunk_ms_ == 0 || get_chunk_samples() == 0) {
    ss << "chunk duration must be positive";
  } else if (queue_size_ == 0) {
    ss << "window queue size must be positive";
  } else if (threads_ <= 0) {
    ss << "whisper threads must be positive, got " << threads_;
  }

  if (!ss.str().empty()) {
    throw ConfigurationError(ss.str());
  }
}

//
//  silence_gate.hpp
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

#ifndef _SILENCE_GATE_HPP_
#define _SILENCE_GATE_HPP_

#include <cstdint>
#include <vector>

#include "config.hpp"

enum class GateMode { start, flush };

struct GateState {
  GateMode mode{GateMode::start};
  bool voiced{false};
  /* above the silence thresholds but held back by the closed start gate */
  bool held{false};
  float rms{0};
  float peak{0};
};

/*
 * Energy based silence detection. A window is silent only when both the RMS
 * and the peak amplitude are below their thresholds.
 * While closed (session start, or after a silent window) the start gate
 * also holds back windows below the start thresholds. It opens on the first
 * window above them.
 * The flush mode uses the stricter thresholds meant for the truncated
 * window at the end of the stream.
 */
class SilenceGate {
public:
  explicit SilenceGate(const Config &config)
      : enabled_(config.get_start_gate_enabled()),
        rms_threshold_(config.get_rms_threshold()),
        peak_threshold_(config.get_peak_threshold()),
        start_rms_threshold_(config.get_start_rms_threshold()),
        start_peak_threshold_(config.get_start_peak_threshold()),
        flush_rms_threshold_(config.get_flush_rms_threshold()),
        flush_peak_threshold_(config.get_flush_peak_threshold()){};

  GateState classify(const std::vector<int16_t> &samples, GateMode mode);

  /* true until the first voiced window and after each silent one */
  bool is_closed() const { return closed_; }

  static float rms(const std::vector<int16_t> &samples);
  static float peak(const std::vector<int16_t> &samples);

private:
  bool enabled_;
  float rms_threshold_;
  float peak_threshold_;
  float start_rms_threshold_;
  float start_peak_threshold_;
  float flush_rms_threshold_;
  float flush_peak_threshold_;
  bool closed_{true};
};

#endif

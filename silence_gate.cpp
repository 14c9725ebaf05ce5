//
//  silence_gate.cpp
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

#include <cmath>
#include <cstdlib>

#include "log.hpp"
#include "silence_gate.hpp"

float SilenceGate::rms(const std::vector<int16_t> &samples) {
  if (samples.empty())
    return 0;
  double sum{0};
  for (auto sample : samples) {
    sum += static_cast<double>(sample) * sample;
  }
  return static_cast<float>(std::sqrt(sum / samples.size()));
}

float SilenceGate::peak(const std::vector<int16_t> &samples) {
  int32_t peak{0};
  for (auto sample : samples) {
    int32_t value = std::abs(static_cast<int32_t>(sample));
    if (value > peak)
      peak = value;
  }
  return static_cast<float>(peak);
}

GateState SilenceGate::classify(const std::vector<int16_t> &samples,
                                GateMode mode) {
  GateState state;
  state.mode = mode;
  state.rms = rms(samples);
  state.peak = peak(samples);

  if (samples.empty()) {
    state.voiced = false;
  } else if (mode == GateMode::flush) {
    state.voiced = !(state.rms < flush_rms_threshold_ &&
                     state.peak < flush_peak_threshold_);
  } else {
    state.voiced =
        !(state.rms < rms_threshold_ && state.peak < peak_threshold_);
    if (state.voiced && enabled_ && closed_ &&
        state.rms < start_rms_threshold_ &&
        state.peak < start_peak_threshold_) {
      BOOST_LOG_TRIVIAL(debug) << "silence_gate:: start gate holding, rms "
                               << state.rms << " peak " << state.peak;
      state.voiced = false;
      state.held = true;
    }
  }

  if (state.voiced && closed_) {
    BOOST_LOG_TRIVIAL(debug) << "silence_gate:: opening, rms " << state.rms
                             << " peak " << state.peak;
  }
  closed_ = !state.voiced;
  return state;
}

//
//  capture.hpp
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

#ifndef _CAPTURE_HPP_
#define _CAPTURE_HPP_

#include <alsa/asoundlib.h>
#include <chrono>
#include <string>

#include "audio_source.hpp"
#include "config.hpp"

/* ALSA capture, S16_LE mono */
class Capture : public AudioSource {
public:
  explicit Capture(const Config &config) : config_(config){};
  Capture(const Capture &) = delete;
  ~Capture() override { close(); }

  bool open() override;
  ReadStatus read(AudioFrame &frame,
                  std::chrono::milliseconds timeout) override;
  void close() override;
  std::string get_name() const override;

  snd_pcm_uframes_t get_chunk_samples() const { return chunk_samples_; }
  uint32_t get_xruns() const { return xruns_; }
  uint64_t get_lost_samples() const { return lost_samples_; }

  /* sample index of the audio captured now, never moving backwards */
  static uint64_t resync_position(uint64_t position,
                                  std::chrono::steady_clock::duration elapsed,
                                  uint32_t sample_rate);

private:
  bool recover(int err);

  const Config &config_;
  snd_pcm_t *handle_{nullptr};
  snd_pcm_uframes_t chunk_samples_{1600};
  uint64_t position_{0};
  uint64_t lost_samples_{0};
  uint32_t xruns_{0};
  std::chrono::steady_clock::time_point started_;
};

#endif

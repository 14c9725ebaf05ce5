//
//  capture.cpp
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

#include <cerrno>

#include "capture.hpp"
#include "log.hpp"

static constexpr unsigned int capture_latency_us = 500000;

bool Capture::open() {
  if (handle_ != nullptr)
    return true;

  const auto &device = config_.get_device_name();
  BOOST_LOG_TRIVIAL(info) << "capture:: opening " << device << " at "
                          << config_.get_sample_rate() << " Hz";

  int err = snd_pcm_open(&handle_, device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot open " << device << ": "
                             << snd_strerror(err);
    handle_ = nullptr;
    return false;
  }

  err = snd_pcm_set_params(handle_, SND_PCM_FORMAT_S16_LE,
                           SND_PCM_ACCESS_RW_INTERLEAVED, 1,
                           config_.get_sample_rate(), 1, capture_latency_us);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot set parameters: "
                             << snd_strerror(err);
    close();
    return false;
  }

  chunk_samples_ = config_.get_chunk_samples();
  position_ = 0;
  lost_samples_ = 0;
  xruns_ = 0;

  err = snd_pcm_start(handle_);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot start: " << snd_strerror(err);
    close();
    return false;
  }
  started_ = std::chrono::steady_clock::now();

  BOOST_LOG_TRIVIAL(debug) << "capture:: chunk_samples " << chunk_samples_;
  return true;
}

uint64_t
Capture::resync_position(uint64_t position,
                         std::chrono::steady_clock::duration elapsed,
                         uint32_t sample_rate) {
  auto usec =
      std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
  if (usec <= 0)
    return position;
  uint64_t now = static_cast<uint64_t>(usec) * sample_rate / 1000000;
  return now > position ? now : position;
}

bool Capture::recover(int err) {
  bool lost = (err == -EPIPE || err == -ESTRPIPE);
  if (err == -EPIPE) {
    xruns_++;
    BOOST_LOG_TRIVIAL(warning) << "capture:: overrun, audio lost";
  } else if (err == -ESTRPIPE) {
    BOOST_LOG_TRIVIAL(warning) << "capture:: stream suspended, resuming";
  }
  err = snd_pcm_recover(handle_, err, 1);
  if (err < 0) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot recover: "
                             << snd_strerror(err);
    return false;
  }
  err = snd_pcm_start(handle_);
  if (err < 0 && err != -EBADFD) {
    BOOST_LOG_TRIVIAL(error) << "capture:: cannot restart: "
                             << snd_strerror(err);
    return false;
  }

  if (lost) {
    /* the ring buffer restarts empty, the next sample is captured now */
    auto position =
        resync_position(position_, std::chrono::steady_clock::now() - started_,
                        config_.get_sample_rate());
    if (position > position_) {
      BOOST_LOG_TRIVIAL(warning) << "capture:: " << position - position_
                                 << " samples lost, skipping ahead";
      lost_samples_ += position - position_;
      position_ = position;
    }
  }
  return true;
}

ReadStatus Capture::read(AudioFrame &frame,
                         std::chrono::milliseconds timeout) {
  if (handle_ == nullptr)
    return ReadStatus::error;

  int ready = snd_pcm_wait(handle_, static_cast<int>(timeout.count()));
  if (ready == 0)
    return ReadStatus::timeout;
  if (ready < 0) {
    return recover(ready) ? ReadStatus::timeout : ReadStatus::error;
  }

  frame.position = position_;
  frame.samples.resize(chunk_samples_);
  snd_pcm_uframes_t offset = 0;
  while (offset < chunk_samples_) {
    snd_pcm_sframes_t n = snd_pcm_readi(
        handle_, frame.samples.data() + offset, chunk_samples_ - offset);
    if (n == -EAGAIN)
      continue;
    if (n < 0) {
      if (!recover(static_cast<int>(n)))
        return ReadStatus::error;
      break;
    }
    offset += n;
    position_ += n;
  }

  frame.samples.resize(offset);
  return offset > 0 ? ReadStatus::frame : ReadStatus::timeout;
}

void Capture::close() {
  if (handle_ == nullptr)
    return;
  BOOST_LOG_TRIVIAL(info) << "capture:: closing " << config_.get_device_name();
  snd_pcm_drop(handle_);
  snd_pcm_close(handle_);
  handle_ = nullptr;
}

std::string Capture::get_name() const {
  return "alsa:" + config_.get_device_name();
}

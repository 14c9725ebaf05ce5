//
//  transcriber.cpp
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

#include <chrono>
#include <mutex>

#include "log.hpp"
#include "transcriber.hpp"
#include "utils.hpp"

using namespace std::chrono_literals;

static constexpr auto read_timeout = 200ms;

const char *to_string(State state) {
  switch (state) {
  case State::init:
    return "init";
  case State::preload:
    return "preload";
  case State::streaming:
    return "streaming";
  case State::flushing:
    return "flushing";
  case State::stopped:
    return "stopped";
  }
  return "unknown";
}

std::shared_ptr<Transcriber>
Transcriber::create(const Config &config, std::shared_ptr<Engine> engine,
                    std::shared_ptr<AudioSource> source,
                    std::shared_ptr<TranscriptSink> sink) {
  /* one instance per session, the watermark is never shared */
  return std::shared_ptr<Transcriber>(
      new Transcriber(config, engine, source, sink));
}

Transcriber::~Transcriber() {
  stop();
}

void Transcriber::set_state(State state) {
  BOOST_LOG_TRIVIAL(info) << "transcriber:: " << to_string(state_.load())
                          << " -> " << to_string(state);
  state_ = state;
}

bool Transcriber::init() {
  BOOST_LOG_TRIVIAL(info) << "transcriber:: init";
  if (state_ != State::init) {
    BOOST_LOG_TRIVIAL(warning) << "transcriber:: already started";
    return false;
  }

  try {
    config_.validate();
  } catch (const ConfigurationError &e) {
    BOOST_LOG_TRIVIAL(fatal) << "transcriber:: invalid configuration: "
                             << e.what();
    return false;
  }

  if (!engine_ || !source_ || !sink_) {
    BOOST_LOG_TRIVIAL(fatal) << "transcriber:: missing engine, source or sink";
    return false;
  }

  windower_.reset(new Windower(config_));
  queue_.reset(
      new WindowQueue(config_.get_queue_size(), config_.get_backpressure()));
  gate_.reset(new SilenceGate(config_));
  dedup_.reset(new Deduplicator(config_.get_suppress_repeats()));

  BOOST_LOG_TRIVIAL(debug) << "transcriber:: window "
                           << config_.get_window_samples() << " samples, stride "
                           << config_.get_stride_samples() << " samples";
  initialized_ = true;
  return true;
}

bool Transcriber::start() {
  if (!initialized_ || state_ != State::init) {
    BOOST_LOG_TRIVIAL(error) << "transcriber:: cannot start in state "
                             << to_string(state_.load());
    return false;
  }

  set_state(State::preload);
  BOOST_LOG_TRIVIAL(info) << "transcriber:: preloading "
                          << engine_->get_name() << " ...";
  {
    TimeElapsed te("transcriber:: preload");
    if (!engine_->preload()) {
      BOOST_LOG_TRIVIAL(fatal) << "transcriber:: cannot preload engine";
      set_state(State::stopped);
      return false;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "transcriber:: starting audio capture from "
                          << source_->get_name() << " ... ";
  if (!source_->open()) {
    BOOST_LOG_TRIVIAL(fatal) << "transcriber:: cannot open audio source";
    engine_->terminate();
    set_state(State::stopped);
    return false;
  }

  set_state(State::streaming);

  /* transcription on a separate thread, one window at a time */
  res_trans_ = std::async(std::launch::async,
                          [this]() { return transcription_loop(); });

  /* capturing on a separate thread */
  res_capts_ =
      std::async(std::launch::async, [this]() { return capture_loop(); });

  return true;
}

bool Transcriber::capture_loop() {
  BOOST_LOG_TRIVIAL(debug) << "transcriber:: audio capture loop start";
  bool ret = true;
  bool stalled = false;
  bool reported = false;
  auto stall_start = std::chrono::steady_clock::now();
  const auto underrun_limit =
      std::chrono::milliseconds(config_.get_underrun_ms());

  AudioFrame frame;
  while (!stop_requested_) {
    auto status = source_->read(frame, read_timeout);

    if (status == ReadStatus::timeout) {
      auto now = std::chrono::steady_clock::now();
      if (!stalled) {
        stalled = true;
        stall_start = now;
      } else if (!reported && now - stall_start >= underrun_limit) {
        BOOST_LOG_TRIVIAL(warning) << "transcriber:: audio underrun, no audio "
                                   << "for " << config_.get_underrun_ms()
                                   << " ms";
        underruns_++;
        reported = true;
      }
      continue;
    }
    if (status == ReadStatus::end_of_stream) {
      BOOST_LOG_TRIVIAL(info) << "transcriber:: end of stream";
      break;
    }
    if (status == ReadStatus::error) {
      BOOST_LOG_TRIVIAL(error) << "transcriber:: audio source error, "
                               << "ending stream";
      ret = false;
      break;
    }

    if (reported) {
      BOOST_LOG_TRIVIAL(info) << "transcriber:: audio resumed";
    }
    stalled = false;
    reported = false;

    for (auto &window : windower_->push(frame)) {
      if (!queue_->push(std::move(window))) {
        windows_discarded_++;
      }
    }
  }

  Window final;
  if (windower_->flush(final)) {
    queue_->push_final(std::move(final));
  } else {
    queue_->close();
  }
  padded_samples_ = windower_->get_padded_samples();

  BOOST_LOG_TRIVIAL(debug) << "transcriber:: audio capture loop end";
  return ret;
}

bool Transcriber::transcription_loop() {
  BOOST_LOG_TRIVIAL(debug) << "transcriber:: transcriptions loop start";

  Window window;
  while (queue_->pop(window)) {
    if (state_ == State::streaming && (stop_requested_ || window.final)) {
      set_state(State::flushing);
    }

    if (stop_requested_ && !window.final) {
      BOOST_LOG_TRIVIAL(debug) << "transcriber:: stopping, discarding window "
                               << window.index;
      windows_discarded_++;
      continue;
    }

    process_window(window);
  }

  if (state_ == State::streaming) {
    set_state(State::flushing);
  }

  watermark_ = dedup_->get_watermark();
  segments_emitted_ = dedup_->get_emitted_num();
  segments_discarded_ = dedup_->get_discarded_num();
  /* the watermark lives as long as the session */
  dedup_.reset();

  set_state(State::stopped);
  BOOST_LOG_TRIVIAL(debug) << "transcriber:: transcriptions loop end";
  return true;
}

void Transcriber::process_window(const Window &window) {
  windows_++;
  auto mode = window.final ? GateMode::flush : GateMode::start;
  auto gate = gate_->classify(window.samples, mode);

  BOOST_LOG_TRIVIAL(debug) << "transcriber:: window " << window.index << " ["
                           << to_timestamp(window.global_start()) << " --> "
                           << to_timestamp(window.global_end()) << "] peak "
                           << gate.peak << " rms " << gate.rms;

  if (!gate.voiced) {
    BOOST_LOG_TRIVIAL(info) << "transcriber:: skipping "
                            << (window.final ? "final"
                                : gate.held  ? "quiet"
                                             : "silent")
                            << " window " << window.index << " rms "
                            << gate.rms << " peak " << gate.peak;
    windows_silent_++;
    return;
  }

  std::vector<LocalSegment> local;
  bool ok{false};
  try {
    TimeElapsed te("transcriber:: window " + std::to_string(window.index));
    ok = engine_->transcribe(window.samples.data(), window.samples.size(),
                             local);
  } catch (const std::exception &e) {
    BOOST_LOG_TRIVIAL(error) << "transcriber:: engine exception: " << e.what();
    ok = false;
  }

  std::string error;
  if (ok && !check_segments(local, window.duration(), error)) {
    BOOST_LOG_TRIVIAL(error) << "transcriber:: malformed engine output: "
                             << error;
    ok = false;
  }
  if (!ok) {
    BOOST_LOG_TRIVIAL(error) << "transcriber:: engine failure, skipping window "
                             << window.index;
    windows_failed_++;
    return;
  }

  auto segments = dedup_->reconcile(window, local);
  watermark_ = dedup_->get_watermark();
  segments_emitted_ = dedup_->get_emitted_num();
  segments_discarded_ = dedup_->get_discarded_num();

  for (const auto &segment : segments) {
    {
      std::unique_lock lock(text_mutex_);
      output_text_ << segment.text << "\n";
    }
    try {
      sink_->on_segment(segment);
    } catch (const std::exception &e) {
      BOOST_LOG_TRIVIAL(error) << "transcriber:: transcript sink failed: "
                               << e.what();
    }
  }
}

bool Transcriber::wait() {
  if (res_capts_.valid()) {
    result_ = res_capts_.get() && result_;
  }
  if (res_trans_.valid()) {
    result_ = res_trans_.get() && result_;
  }
  if (source_) {
    source_->close();
  }
  return result_;
}

bool Transcriber::stop() {
  auto state = state_.load();
  if (state == State::init || (state == State::stopped && !res_trans_.valid()))
    return result_;

  if (!stop_requested_) {
    BOOST_LOG_TRIVIAL(info) << "transcriber:: stopping audio capture ... ";
    stop_requested_ = true;
    if (queue_) {
      queue_->interrupt();
    }
  }
  return wait();
}

bool Transcriber::terminate() {
  BOOST_LOG_TRIVIAL(info) << "transcriber:: terminating ... ";
  bool ret = stop();
  if (engine_) {
    engine_->terminate();
  }
  return ret;
}

bool Transcriber::get_text(std::string &out) {
  auto state = state_.load();
  if (state == State::init || state == State::preload) {
    BOOST_LOG_TRIVIAL(warning) << "transcriber:: not started";
    return false;
  }

  std::shared_lock lock(text_mutex_);
  out = output_text_.str();
  return true;
}

bool Transcriber::clear_text() {
  auto state = state_.load();
  if (state == State::init || state == State::preload) {
    BOOST_LOG_TRIVIAL(warning) << "transcriber:: not started";
    return false;
  }

  std::unique_lock lock(text_mutex_);
  output_text_.str("");
  output_text_.clear();
  return true;
}

Stats Transcriber::get_stats() const {
  Stats stats;
  stats.windows = windows_;
  stats.windows_silent = windows_silent_;
  stats.windows_failed = windows_failed_;
  stats.windows_discarded = windows_discarded_;
  stats.windows_dropped = queue_ ? queue_->get_dropped() : 0;
  stats.segments_emitted = segments_emitted_;
  stats.segments_discarded = segments_discarded_;
  stats.underruns = underruns_;
  stats.padded_samples = padded_samples_;
  stats.watermark = watermark_;
  return stats;
}

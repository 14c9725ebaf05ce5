//
//  transcriber.hpp
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

#ifndef _TRANSCRIBER_HPP_
#define _TRANSCRIBER_HPP_

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <shared_mutex>
#include <sstream>
#include <string>

#include "audio_source.hpp"
#include "config.hpp"
#include "deduplicator.hpp"
#include "engine.hpp"
#include "silence_gate.hpp"
#include "transcript_sink.hpp"
#include "window_queue.hpp"
#include "windower.hpp"

enum class State { init, preload, streaming, flushing, stopped };

const char *to_string(State state);

struct Stats {
  uint64_t windows{0};
  uint64_t windows_silent{0};
  uint64_t windows_failed{0};
  uint64_t windows_discarded{0};
  uint64_t windows_dropped{0};
  uint64_t segments_emitted{0};
  uint64_t segments_discarded{0};
  uint64_t underruns{0};
  uint64_t padded_samples{0};
  double watermark{0};
};

/*
 * One transcription session.
 * The capture loop reads frames from the source and slices them into
 * windows, the transcription loop gates, transcribes and deduplicates them
 * one at a time, in order.
 *
 * init -> preload -> streaming -> flushing -> stopped
 */
class Transcriber {
public:
  static std::shared_ptr<Transcriber>
  create(const Config &config, std::shared_ptr<Engine> engine,
         std::shared_ptr<AudioSource> source,
         std::shared_ptr<TranscriptSink> sink);
  Transcriber() = delete;
  Transcriber(const Transcriber &) = delete;
  ~Transcriber();

  bool init();
  bool terminate();

  /* preloads the engine, then starts capture and transcription */
  bool start();
  /* flushes what is buffered and waits for the session to stop */
  bool stop();
  /* waits for the end of the stream */
  bool wait();

  bool get_text(std::string &out);
  bool clear_text();

  State get_state() const { return state_.load(); }
  Stats get_stats() const;

protected:
  Transcriber(const Config &config, std::shared_ptr<Engine> engine,
              std::shared_ptr<AudioSource> source,
              std::shared_ptr<TranscriptSink> sink)
      : config_(config), engine_(engine), source_(source), sink_(sink){};

private:
  bool capture_loop();
  bool transcription_loop();
  void process_window(const Window &window);
  void set_state(State state);

  const Config &config_;
  std::shared_ptr<Engine> engine_;
  std::shared_ptr<AudioSource> source_;
  std::shared_ptr<TranscriptSink> sink_;

  std::unique_ptr<Windower> windower_;
  std::unique_ptr<WindowQueue> queue_;
  std::unique_ptr<SilenceGate> gate_;
  std::unique_ptr<Deduplicator> dedup_;

  std::atomic<State> state_{State::init};
  std::atomic_bool initialized_{false};
  std::atomic_bool stop_requested_{false};
  std::future<bool> res_capts_;
  std::future<bool> res_trans_;
  bool result_{true};

  std::atomic<uint64_t> windows_{0};
  std::atomic<uint64_t> windows_silent_{0};
  std::atomic<uint64_t> windows_failed_{0};
  std::atomic<uint64_t> windows_discarded_{0};
  std::atomic<uint64_t> segments_emitted_{0};
  std::atomic<uint64_t> segments_discarded_{0};
  std::atomic<uint64_t> underruns_{0};
  std::atomic<uint64_t> padded_samples_{0};
  std::atomic<double> watermark_{0};

  std::stringstream output_text_;
  mutable std::shared_mutex text_mutex_;
};

#endif

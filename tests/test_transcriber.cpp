//
//  test_transcriber.cpp
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

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "test_helpers.hpp"
#include "transcriber.hpp"

using namespace std::chrono_literals;

/* head of every window repeats the previous tail */
static bool head_and_tail(uint32_t call, double duration,
                          std::vector<LocalSegment> &segments) {
  segments.push_back({"head " + std::to_string(call), 0.25, 1.25});
  if (duration >= 5.0) {
    segments.push_back({"tail " + std::to_string(call), 3.75, 4.75});
  }
  return true;
}

struct Session {
  std::shared_ptr<FakeEngine> engine;
  std::shared_ptr<VectorSource> source;
  std::shared_ptr<CollectSink> sink;
  std::shared_ptr<Transcriber> transcriber;
};

static Session make_session(const Config &config, std::vector<int16_t> audio,
                            TranscribeHandler handler) {
  Session session;
  session.engine = std::make_shared<FakeEngine>(handler);
  session.source = std::make_shared<VectorSource>(std::move(audio), 1600);
  session.sink = std::make_shared<CollectSink>();
  session.transcriber = Transcriber::create(config, session.engine,
                                            session.source, session.sink);
  return session;
}

static void run(Session &session) {
  assert(session.transcriber->init());
  assert(session.transcriber->get_state() == State::init);
  assert(session.transcriber->start());
  assert(session.transcriber->wait());
  assert(session.transcriber->get_state() == State::stopped);
}

void test_preload_before_audio() {
  Config config;
  auto session = make_session(config, make_tone(6.0, 8000), head_and_tail);
  run(session);

  auto events = session.engine->get_events();
  assert(!events.empty());
  assert(events.front() == "preload");
  for (size_t i = 1; i < events.size(); i++) {
    assert(events[i] == "transcribe");
  }
  assert(session.source->opened_);
  assert(session.source->closed_);
  assert(!session.engine->concurrent_);
  std::cout << "[PASS] test_preload_before_audio" << std::endl;
}

void test_stream_is_deduplicated() {
  Config config;
  auto session = make_session(config, make_tone(20.0, 8000), head_and_tail);
  run(session);

  /* five full windows and the 2.5s final window */
  auto durations = session.engine->get_durations();
  assert(durations.size() == 6);
  for (size_t i = 0; i < 5; i++) {
    assert(durations[i] == 5.0);
  }
  assert(durations[5] == 2.5);

  auto segments = session.sink->get_segments();
  /* head of window 0, then one tail per full window */
  assert(segments.size() == 6);
  assert(segments[0].text == "head 0");
  assert(segments[1].text == "tail 0");
  assert(segments[2].text == "tail 1");
  for (size_t i = 1; i < segments.size(); i++) {
    assert(segments[i].end > segments[i - 1].end);
    assert(segments[i].start >= segments[i - 1].end);
  }
  assert(segments[5].start == 14.0 + 3.75);

  auto stats = session.transcriber->get_stats();
  assert(stats.windows == 6);
  assert(stats.windows_silent == 0);
  assert(stats.windows_failed == 0);
  assert(stats.segments_emitted == 6);
  /* four repeated heads and the head of the final window */
  assert(stats.segments_discarded == 5);
  assert(stats.watermark == 14.0 + 4.75);

  std::string text;
  assert(session.transcriber->get_text(text));
  assert(text == "head 0\ntail 0\ntail 1\ntail 2\ntail 3\ntail 4\n");
  assert(session.transcriber->clear_text());
  assert(session.transcriber->get_text(text) && text.empty());
  std::cout << "[PASS] test_stream_is_deduplicated" << std::endl;
}

void test_silence_only() {
  Config config;
  auto session = make_session(config, make_silence(20.0), head_and_tail);
  run(session);

  assert(session.engine->get_calls() == 0);
  assert(session.sink->get_segments().empty());
  auto stats = session.transcriber->get_stats();
  assert(stats.windows == 6);
  assert(stats.windows_silent == 6);
  assert(stats.watermark == 0.0);
  std::cout << "[PASS] test_silence_only" << std::endl;
}

void test_silence_gated_without_start_gate() {
  Config config;
  config.set_start_gate_enabled(false);
  auto session = make_session(
      config, make_silence(12.0),
      [](uint32_t, double, std::vector<LocalSegment> &segments) {
        segments.push_back({"thank you", 0.5, 1.5});
        return true;
      });
  run(session);

  assert(session.engine->get_calls() == 0);
  assert(session.sink->get_segments().empty());
  auto stats = session.transcriber->get_stats();
  assert(stats.windows_silent == stats.windows);
  assert(stats.segments_emitted == 0);
  assert(stats.watermark == 0.0);
  std::cout << "[PASS] test_silence_gated_without_start_gate" << std::endl;
}

void test_start_gate_waits_for_clear_speech() {
  /* 7s of hum above the silence thresholds, then speech */
  auto audio = make_hum(7.0, 100, 1000);
  append(audio, make_tone(6.0, 8000));

  {
    Config config;
    auto session = make_session(config, audio, head_and_tail);
    run(session);
    /* window [0, 5) only holds the hum, [3.5, 8.5) opens the gate */
    auto durations = session.engine->get_durations();
    assert(durations.size() == 3);
    auto stats = session.transcriber->get_stats();
    assert(stats.windows == 4);
    assert(stats.windows_silent == 1);
    assert(session.sink->get_segments().front().start == 3.5 + 0.25);
  }
  {
    Config config;
    config.set_start_gate_enabled(false);
    auto session = make_session(config, audio, head_and_tail);
    run(session);
    assert(session.engine->get_calls() == 4);
    assert(session.sink->get_segments().front().start == 0.25);
  }
  std::cout << "[PASS] test_start_gate_waits_for_clear_speech" << std::endl;
}

void test_silent_windows_are_skipped() {
  Config config;
  /* speech, 11s of silence, speech */
  auto audio = make_tone(5.0, 8000);
  append(audio, make_silence(11.0));
  append(audio, make_tone(5.0, 8000));
  auto session = make_session(config, audio, head_and_tail);
  run(session);

  /* windows at 7.0 and 10.5 are fully silent */
  auto stats = session.transcriber->get_stats();
  assert(stats.windows == 6);
  assert(stats.windows_silent == 2);
  assert(session.engine->get_calls() == 4);
  std::cout << "[PASS] test_silent_windows_are_skipped" << std::endl;
}

void test_engine_failure_skips_window() {
  Config config;
  auto session = make_session(
      config, make_tone(13.0, 8000),
      [](uint32_t call, double duration, std::vector<LocalSegment> &segments) {
        if (call == 1) {
          segments.push_back({"garbage", 0.0, 1.0});
          return false;
        }
        return head_and_tail(call, duration, segments);
      });
  run(session);

  /* windows at 0, 3.5 (fails), 7.0, final at 10.5 */
  assert(session.engine->get_calls() == 4);
  auto segments = session.sink->get_segments();
  for (const auto &segment : segments) {
    assert(segment.text != "garbage");
    assert(segment.text.find(" 1") == std::string::npos);
  }
  /* head 0, tail 0, head 2 (past the watermark of window 0), tail 2 */
  assert(segments.size() == 4);
  assert(segments[2].text == "head 2");
  assert(segments[2].start == 7.25);

  auto stats = session.transcriber->get_stats();
  assert(stats.windows_failed == 1);
  std::cout << "[PASS] test_engine_failure_skips_window" << std::endl;
}

void test_engine_exception_is_failure() {
  Config config;
  auto session = make_session(
      config, make_tone(6.0, 8000),
      [](uint32_t call, double duration, std::vector<LocalSegment> &segments) {
        if (call == 0)
          throw std::runtime_error("model exploded");
        return head_and_tail(call, duration, segments);
      });
  run(session);

  auto stats = session.transcriber->get_stats();
  assert(stats.windows == 2);
  assert(stats.windows_failed == 1);
  assert(session.sink->get_segments().size() == 1);
  std::cout << "[PASS] test_engine_exception_is_failure" << std::endl;
}

void test_malformed_output_is_failure() {
  Config config;
  auto session = make_session(
      config, make_tone(5.0, 8000),
      [](uint32_t, double, std::vector<LocalSegment> &segments) {
        segments.push_back({"backwards", 2.0, 1.0});
        return true;
      });
  run(session);

  assert(session.sink->get_segments().empty());
  auto stats = session.transcriber->get_stats();
  assert(stats.windows_failed == 1);
  assert(stats.watermark == 0.0);
  std::cout << "[PASS] test_malformed_output_is_failure" << std::endl;
}

void test_flush_gate_on_final_window() {
  /* speech for 3.5s, then a hum just above the silence thresholds */
  auto audio = make_tone(3.5, 8000);
  append(audio, make_hum(3.0, 100, 1000));

  {
    Config config;
    auto session = make_session(config, audio, head_and_tail);
    run(session);
    /* final window [3.5, 6.5) only holds the hum */
    assert(session.engine->get_calls() == 1);
    auto stats = session.transcriber->get_stats();
    assert(stats.windows == 2);
    assert(stats.windows_silent == 1);
  }
  {
    Config config;
    config.set_flush_rms_threshold(80.0f);
    config.set_flush_peak_threshold(900.0f);
    auto session = make_session(config, audio, head_and_tail);
    run(session);
    assert(session.engine->get_calls() == 2);
  }
  std::cout << "[PASS] test_flush_gate_on_final_window" << std::endl;
}

void test_configuration_error() {
  Config config;
  config.set_overlap_seconds(5.0f);
  auto session = make_session(config, make_tone(6.0, 8000), head_and_tail);

  assert(!session.transcriber->init());
  assert(session.transcriber->get_state() == State::init);
  assert(!session.transcriber->start());
  assert(session.engine->get_events().empty());
  assert(session.transcriber->stop());
  std::cout << "[PASS] test_configuration_error" << std::endl;
}

void test_preload_failure() {
  Config config;
  auto engine = std::make_shared<FakeEngine>(head_and_tail, false);
  auto source = std::make_shared<VectorSource>(make_tone(6.0, 8000), 1600);
  auto sink = std::make_shared<CollectSink>();
  auto transcriber = Transcriber::create(config, engine, source, sink);

  assert(transcriber->init());
  assert(!transcriber->start());
  assert(transcriber->get_state() == State::stopped);
  assert(!source->opened_);
  assert(engine->get_calls() == 0);
  std::cout << "[PASS] test_preload_failure" << std::endl;
}

void test_stop_request() {
  Config config;
  config.set_queue_size(2);
  auto engine = std::make_shared<FakeEngine>(
      [](uint32_t call, double duration, std::vector<LocalSegment> &segments) {
        std::this_thread::sleep_for(20ms);
        return head_and_tail(call, duration, segments);
      });
  auto source = std::make_shared<EndlessSource>();
  auto sink = std::make_shared<CollectSink>();
  auto transcriber = Transcriber::create(config, engine, source, sink);

  assert(transcriber->init());
  assert(transcriber->start());
  assert(transcriber->get_state() == State::streaming);

  while (engine->get_calls() < 3) {
    std::this_thread::sleep_for(5ms);
  }
  assert(transcriber->stop());
  assert(transcriber->get_state() == State::stopped);

  auto stats = transcriber->get_stats();
  auto calls = engine->get_calls();
  /* window in flight, possibly one more, and the final window */
  assert(calls <= 3 + 2);
  assert(stats.windows == calls);
  assert(!engine->concurrent_);

  /* stopped sessions stay stopped */
  assert(transcriber->stop());
  auto frames = source->frames_.load();
  std::this_thread::sleep_for(20ms);
  assert(source->frames_.load() == frames);
  std::cout << "[PASS] test_stop_request" << std::endl;
}

void test_underrun_is_reported_once_per_stall() {
  Config config;
  config.set_underrun_ms(100);
  /* two stalls of 6 x 50ms, before frames 10 and 40 */
  auto source = std::make_shared<StallingSource>(
      make_tone(6.0, 8000), 1600, std::set<size_t>{10, 40}, 6, 50ms, false);
  auto engine = std::make_shared<FakeEngine>(head_and_tail);
  auto sink = std::make_shared<CollectSink>();
  auto transcriber = Transcriber::create(config, engine, source, sink);

  assert(transcriber->init());
  assert(transcriber->start());
  assert(transcriber->wait());
  assert(transcriber->get_state() == State::stopped);

  auto stats = transcriber->get_stats();
  assert(stats.underruns == 2);
  assert(stats.padded_samples == 0);
  /* the session carried on past both stalls */
  assert(engine->get_calls() == 2);
  assert(stats.watermark == 4.75);
  std::cout << "[PASS] test_underrun_is_reported_once_per_stall" << std::endl;
}

/* engine that records the session state seen by each call */
struct StateLog {
  std::mutex mutex;
  std::vector<State> states;
  Transcriber *transcriber{nullptr};
};

static TranscribeHandler recording_states(std::shared_ptr<StateLog> seen) {
  return [seen](uint32_t call, double duration,
                std::vector<LocalSegment> &segments) {
    std::lock_guard<std::mutex> lock(seen->mutex);
    seen->states.push_back(seen->transcriber->get_state());
    return head_and_tail(call, duration, segments);
  };
}

void test_states_at_end_of_stream() {
  Config config;
  auto seen = std::make_shared<StateLog>();
  auto session =
      make_session(config, make_tone(13.0, 8000), recording_states(seen));
  seen->transcriber = session.transcriber.get();
  run(session);

  /* windows at 0, 3.5, 7.0, then the final one at 10.5 */
  assert(seen->states.size() == 4);
  for (size_t i = 0; i < 3; i++) {
    assert(seen->states[i] == State::streaming);
  }
  assert(seen->states[3] == State::flushing);
  assert(session.transcriber->get_state() == State::stopped);
  std::cout << "[PASS] test_states_at_end_of_stream" << std::endl;
}

void test_states_on_stop() {
  Config config;
  auto seen = std::make_shared<StateLog>();
  /* 6s of speech, then the input goes idle */
  auto source = std::make_shared<StallingSource>(
      make_tone(6.0, 8000), 1600, std::set<size_t>{}, 0, 10ms, true);
  auto engine = std::make_shared<FakeEngine>(recording_states(seen));
  auto sink = std::make_shared<CollectSink>();
  auto transcriber = Transcriber::create(config, engine, source, sink);
  seen->transcriber = transcriber.get();

  assert(transcriber->init());
  assert(transcriber->start());
  while (!source->drained_ || engine->get_calls() < 1) {
    std::this_thread::sleep_for(5ms);
  }
  assert(transcriber->get_state() == State::streaming);
  assert(transcriber->stop());
  assert(transcriber->get_state() == State::stopped);

  /* window [0, 5), then [3.5, 6) flushed on stop */
  assert(seen->states.size() == 2);
  assert(seen->states[0] == State::streaming);
  assert(seen->states[1] == State::flushing);
  assert(engine->get_durations().back() == 2.5);
  std::cout << "[PASS] test_states_on_stop" << std::endl;
}

void test_independent_sessions() {
  Config config;
  auto a = make_session(config, make_tone(6.0, 8000), head_and_tail);
  auto b = make_session(config, make_tone(13.0, 8000), head_and_tail);
  assert(a.transcriber != b.transcriber);

  assert(a.transcriber->init() && b.transcriber->init());
  assert(a.transcriber->start() && b.transcriber->start());
  assert(a.transcriber->wait() && b.transcriber->wait());

  assert(a.transcriber->get_stats().watermark == 4.75);
  assert(b.transcriber->get_stats().watermark == 7.0 + 4.75);
  std::cout << "[PASS] test_independent_sessions" << std::endl;
}

int main() {
  quiet_logs();
  std::cout << "=== Transcriber Tests ===" << std::endl;

  test_preload_before_audio();
  test_stream_is_deduplicated();
  test_silence_only();
  test_silence_gated_without_start_gate();
  test_start_gate_waits_for_clear_speech();
  test_silent_windows_are_skipped();
  test_engine_failure_skips_window();
  test_engine_exception_is_failure();
  test_malformed_output_is_failure();
  test_flush_gate_on_final_window();
  test_configuration_error();
  test_preload_failure();
  test_stop_request();
  test_underrun_is_reported_once_per_stall();
  test_states_at_end_of_stream();
  test_states_on_stop();
  test_independent_sessions();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}

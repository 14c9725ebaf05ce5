//
//  config.hpp
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

#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

enum class Backpressure { block, drop_oldest };

class Config {
 public:
  static constexpr uint32_t sample_rate_hz = 16000;

  /* throws ConfigurationError */
  void validate() const;

  float get_window_seconds() const { return window_seconds_; }
  float get_overlap_seconds() const { return overlap_seconds_; }
  float get_min_flush_seconds() const { return min_flush_seconds_; }
  float get_rms_threshold() const { return rms_threshold_; }
  float get_peak_threshold() const { return peak_threshold_; }
  float get_flush_rms_threshold() const { return flush_rms_threshold_; }
  float get_flush_peak_threshold() const { return flush_peak_threshold_; }
  bool get_start_gate_enabled() const { return start_gate_enabled_; }
  float get_start_rms_threshold() const { return start_rms_threshold_; }
  float get_start_peak_threshold() const { return start_peak_threshold_; }
  uint32_t get_sample_rate() const { return sample_rate_; }
  uint16_t get_chunk_ms() const { return chunk_ms_; }
  uint16_t get_queue_size() const { return queue_size_; }
  Backpressure get_backpressure() const { return backpressure_; }
  uint32_t get_underrun_ms() const { return underrun_ms_; }
  bool get_suppress_repeats() const { return suppress_repeats_; }
  const std::string& get_input() const { return input_; }
  const std::string& get_output() const { return output_; }
  const std::string& get_model() const { return model_; }
  const std::string& get_language() const { return language_; }
  const std::string& get_openvino_device() const { return openvino_device_; }
  int get_threads() const { return threads_; }
  int get_log_severity() const { return log_severity_; };
  const std::string& get_device_name() const { return device_name_; };
  bool get_use_context() const { return use_context_; };
  bool get_vad_enabled() const { return vad_enabled_; };
  const std::string& get_vad_model() const { return vad_model_; };
  float get_vad_threshold() const { return vad_threshold_; };

  /* derived sample counts */
  uint32_t get_window_samples() const {
    return seconds_to_samples(window_seconds_);
  }
  uint32_t get_overlap_samples() const {
    return seconds_to_samples(overlap_seconds_);
  }
  uint32_t get_stride_samples() const {
    return get_window_samples() - get_overlap_samples();
  }
  uint32_t get_min_flush_samples() const {
    return seconds_to_samples(min_flush_seconds_);
  }
  uint32_t get_chunk_samples() const {
    return sample_rate_ * chunk_ms_ / 1000;
  }

  void set_window_seconds(float window_seconds) {
    window_seconds_ = window_seconds;
  }
  void set_overlap_seconds(float overlap_seconds) {
    overlap_seconds_ = overlap_seconds;
  }
  void set_min_flush_seconds(float min_flush_seconds) {
    min_flush_seconds_ = min_flush_seconds;
  }
  void set_rms_threshold(float rms_threshold) {
    rms_threshold_ = rms_threshold;
  }
  void set_peak_threshold(float peak_threshold) {
    peak_threshold_ = peak_threshold;
  }
  void set_flush_rms_threshold(float flush_rms_threshold) {
    flush_rms_threshold_ = flush_rms_threshold;
  }
  void set_flush_peak_threshold(float flush_peak_threshold) {
    flush_peak_threshold_ = flush_peak_threshold;
  }
  void set_start_gate_enabled(bool start_gate_enabled) {
    start_gate_enabled_ = start_gate_enabled;
  }
  void set_start_rms_threshold(float start_rms_threshold) {
    start_rms_threshold_ = start_rms_threshold;
  }
  void set_start_peak_threshold(float start_peak_threshold) {
    start_peak_threshold_ = start_peak_threshold;
  }
  void set_sample_rate(uint32_t sample_rate) { sample_rate_ = sample_rate; };
  void set_chunk_ms(uint16_t chunk_ms) { chunk_ms_ = chunk_ms; }
  void set_queue_size(uint16_t queue_size) { queue_size_ = queue_size; }
  void set_backpressure(Backpressure backpressure) {
    backpressure_ = backpressure;
  }
  void set_underrun_ms(uint32_t underrun_ms) { underrun_ms_ = underrun_ms; }
  void set_suppress_repeats(bool suppress_repeats) {
    suppress_repeats_ = suppress_repeats;
  }
  void set_input(const std::string& input) { input_ = input; }
  void set_output(const std::string& output) { output_ = output; }
  void set_model(const std::string& model) { model_ = model; }
  void set_language(const std::string& language) { language_ = language; }
  void set_openvino_device(const std::string& openvino_device) {
    openvino_device_ = openvino_device;
  }
  void set_threads(int threads) { threads_ = threads; }
  void set_log_severity(int log_severity) { log_severity_ = log_severity; };
  void set_device_name(std::string_view device_name) {
    device_name_ = device_name;
  };
  void set_use_context(bool use_context) { use_context_ = use_context; };
  void set_vad_enabled(bool vad_enabled) { vad_enabled_ = vad_enabled; };
  void set_vad_model(const std::string& vad_model) { vad_model_ = vad_model; };
  void set_vad_threshold(float vad_threshold) {
    vad_threshold_ = vad_threshold;
  };

 private:
  uint32_t seconds_to_samples(float seconds) const {
    return static_cast<uint32_t>(seconds * sample_rate_ + 0.5f);
  }

  float window_seconds_{5.0f};
  float overlap_seconds_{1.5f};
  float min_flush_seconds_{0.6f};
  float rms_threshold_{80.0f};
  float peak_threshold_{900.0f};
  float flush_rms_threshold_{120.0f};
  float flush_peak_threshold_{1500.0f};
  bool start_gate_enabled_{true};
  float start_rms_threshold_{120.0f};
  float start_peak_threshold_{1500.0f};
  uint32_t sample_rate_{sample_rate_hz};
  uint16_t chunk_ms_{100};
  uint16_t queue_size_{20};
  Backpressure backpressure_{Backpressure::block};
  uint32_t underrun_ms_{2000};
  bool suppress_repeats_{false};
  std::string input_;
  std::string output_;
  std::string model_{"./models/ggml-base.en.bin"};
  std::string language_{"en"};
  std::string openvino_device_{"CPU"};
  int threads_{4};
  int log_severity_{2};
  std::string device_name_{"default"};
  bool use_context_{false};
  bool vad_enabled_{false};
  std::string vad_model_{"./models/ggml-silero-v5.1.2.bin"};
  float vad_threshold_{5e-1};
};

#endif

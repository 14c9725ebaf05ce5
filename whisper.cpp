//
//  whisper.cpp
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
#include <boost/algorithm/string.hpp>

#include "log.hpp"
#include "utils.hpp"
#include "whisper.hpp"

static void whisper_log_callback(enum ggml_log_level level, const char *text,
                                 void * /*user_data*/) {
  if (text == nullptr)
    return;
  std::string msg = boost::algorithm::trim_right_copy(std::string(text));
  if (msg.empty())
    return;
  switch (level) {
  case GGML_LOG_LEVEL_ERROR:
    BOOST_LOG_TRIVIAL(error) << "whisper:: " << msg;
    break;
  case GGML_LOG_LEVEL_WARN:
    BOOST_LOG_TRIVIAL(warning) << "whisper:: " << msg;
    break;
  default:
    BOOST_LOG_TRIVIAL(trace) << "whisper:: " << msg;
    break;
  }
}

bool Whisper::preload() {
  if (ctx_ != nullptr)
    return true;

  TimeElapsed te("whisper:: preload");
  whisper_log_set(whisper_log_callback, nullptr);

  language_ = config_.get_language();
  vad_model_ = config_.get_vad_model();
  if (language_ != "auto" && whisper_lang_id(language_.c_str()) == -1) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: unknown language " << language_;
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "whisper:: loading model "
                          << config_.get_model() << " ...";
  struct whisper_context_params cparams = whisper_context_default_params();
  ctx_ = whisper_init_from_file_with_params_no_state(
      config_.get_model().c_str(), cparams);
  if (ctx_ == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: cannot load model "
                             << config_.get_model();
    return false;
  }

  state_ = whisper_init_state(ctx_);
  if (state_ == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: cannot allocate state";
    whisper_free(ctx_);
    ctx_ = nullptr;
    return false;
  }

  if (whisper_ctx_init_openvino_encoder_with_state(
          ctx_, state_, nullptr, config_.get_openvino_device().c_str(),
          nullptr) != 0) {
    BOOST_LOG_TRIVIAL(debug) << "whisper:: openvino encoder not available, "
                             << "using default encoder";
  }

  BOOST_LOG_TRIVIAL(info) << "whisper:: model loaded, language " << language_
                          << ", threads " << config_.get_threads();
  return true;
}

bool Whisper::transcribe(const int16_t *in, uint32_t samples_in,
                         std::vector<LocalSegment> &segments) {
  segments.clear();
  if (ctx_ == nullptr || state_ == nullptr) {
    BOOST_LOG_TRIVIAL(error) << "whisper:: transcribe called before preload";
    return false;
  }

  pcmf32_.resize(samples_in);
  for (uint32_t i = 0; i < samples_in; i++) {
    pcmf32_[i] = static_cast<float>(in[i]) / 32768.0f;
  }
  const double duration =
      static_cast<double>(samples_in) / WHISPER_SAMPLE_RATE;

  whisper_full_params wparams =
      whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  wparams.print_progress = false;
  wparams.print_special = false;
  wparams.print_realtime = false;
  wparams.print_timestamps = false;
  wparams.translate = false;
  wparams.single_segment = false;
  wparams.no_timestamps = false;
  wparams.language = language_.c_str();
  wparams.n_threads = config_.get_threads();
  wparams.no_context = !config_.get_use_context();
  if (config_.get_use_context()) {
    wparams.prompt_tokens = prompt_tokens_.empty() ? nullptr
                                                   : prompt_tokens_.data();
    wparams.prompt_n_tokens = prompt_tokens_.size();
  }
  if (config_.get_vad_enabled()) {
    wparams.vad = true;
    wparams.vad_model_path = vad_model_.c_str();
    wparams.vad_params.threshold = config_.get_vad_threshold();
  }

  {
    TimeElapsed te("whisper:: whisper_full");
    if (whisper_full_with_state(ctx_, state_, wparams, pcmf32_.data(),
                                pcmf32_.size()) != 0) {
      BOOST_LOG_TRIVIAL(error) << "whisper:: failed to process audio";
      return false;
    }
  }

  const int n_segments = whisper_full_n_segments_from_state(state_);
  for (int i = 0; i < n_segments; i++) {
    const char *text = whisper_full_get_segment_text_from_state(state_, i);
    if (text == nullptr) {
      BOOST_LOG_TRIVIAL(error) << "whisper:: segment " << i << " has no text";
      segments.clear();
      return false;
    }
    /* t0 and t1 are in units of 10 ms */
    const int64_t t0 = whisper_full_get_segment_t0_from_state(state_, i);
    const int64_t t1 = whisper_full_get_segment_t1_from_state(state_, i);

    LocalSegment segment;
    segment.text = text;
    segment.start = std::min(t0 * 0.01, duration);
    segment.end = std::min(t1 * 0.01, duration);
    BOOST_LOG_TRIVIAL(debug) << "whisper:: [" << to_timestamp(segment.start)
                             << " --> " << to_timestamp(segment.end) << "] "
                             << segment.text;
    segments.push_back(std::move(segment));
  }

  if (config_.get_use_context()) {
    prompt_tokens_.clear();
    for (int i = 0; i < n_segments; i++) {
      const int token_count = whisper_full_n_tokens_from_state(state_, i);
      for (int j = 0; j < token_count; j++) {
        prompt_tokens_.push_back(
            whisper_full_get_token_id_from_state(state_, i, j));
      }
    }
  }

  return true;
}

void Whisper::terminate() {
  if (state_ != nullptr) {
    whisper_free_state(state_);
    state_ = nullptr;
  }
  if (ctx_ != nullptr) {
    whisper_free(ctx_);
    ctx_ = nullptr;
  }
  prompt_tokens_.clear();
}

std::string Whisper::get_name() const {
  return "whisper (" + config_.get_model() + ")";
}

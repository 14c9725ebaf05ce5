//
//  whisper.hpp
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

#ifndef _WHISPER_HPP_
#define _WHISPER_HPP_

#include <string>
#include <vector>
#include <whisper.h>

#include "config.hpp"
#include "engine.hpp"

class Whisper : public Engine {
public:
  explicit Whisper(const Config &config) : config_(config){};
  Whisper(const Whisper &) = delete;
  ~Whisper() override { terminate(); }

  bool preload() override;
  bool transcribe(const int16_t *in, uint32_t samples_in,
                  std::vector<LocalSegment> &segments) override;
  void terminate() override;
  std::string get_name() const override;

private:
  const Config &config_;

  std::string language_;
  std::string vad_model_;
  std::vector<float> pcmf32_;
  std::vector<whisper_token> prompt_tokens_;
  struct whisper_state *state_{0};
  struct whisper_context *ctx_{0};
};

#endif

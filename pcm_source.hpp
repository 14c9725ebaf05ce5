//
//  pcm_source.hpp
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

#ifndef _PCM_SOURCE_HPP_
#define _PCM_SOURCE_HPP_

#include <string>
#include <vector>

#include "audio_source.hpp"

/*
 * Raw s16le mono 16 kHz PCM read from a file, or from stdin when the path
 * is "-", e.g. ffmpeg -i in.mp3 -f s16le -ac 1 -ar 16000 - | livescribe -i -
 * A pipe with no data pending times out, so a stop is not blocked by an idle
 * writer.
 */
class PcmFileSource : public AudioSource {
public:
  PcmFileSource(const std::string &path, uint32_t chunk_samples)
      : path_(path), chunk_samples_(chunk_samples){};
  PcmFileSource(const PcmFileSource &) = delete;
  ~PcmFileSource() override { close(); }

  bool open() override;
  ReadStatus read(AudioFrame &frame,
                  std::chrono::milliseconds timeout) override;
  void close() override;
  std::string get_name() const override { return "pcm:" + path_; }

private:
  std::string path_;
  uint32_t chunk_samples_;
  int fd_{-1};
  bool owns_input_{false};
  std::vector<uint8_t> buffer_;
  std::vector<uint8_t> carry_;
  uint64_t position_{0};
};

#endif

//
//  audio_source.hpp
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

#ifndef _AUDIO_SOURCE_HPP_
#define _AUDIO_SOURCE_HPP_

#include <chrono>
#include <string>

#include "audio.hpp"

enum class ReadStatus { frame, timeout, end_of_stream, error };

/*
 * Pull based source of 16 kHz mono frames.
 * read() waits at most timeout for the next frame and reports the end of
 * the stream explicitly.
 */
class AudioSource {
public:
  virtual ~AudioSource() = default;

  virtual bool open() = 0;
  virtual ReadStatus read(AudioFrame &frame,
                          std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
  virtual std::string get_name() const = 0;
};

#endif

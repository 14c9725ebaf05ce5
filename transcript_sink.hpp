//
//  transcript_sink.hpp
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

#ifndef _TRANSCRIPT_SINK_HPP_
#define _TRANSCRIPT_SINK_HPP_

#include <mutex>
#include <ostream>

#include "segment.hpp"

/* receives the deduplicated segments in emission order */
class TranscriptSink {
public:
  virtual ~TranscriptSink() = default;
  virtual void on_segment(const GlobalSegment &segment) = 0;
};

/* prints "[hh:mm:ss.mmm --> hh:mm:ss.mmm]  text" lines */
class StreamSink : public TranscriptSink {
public:
  explicit StreamSink(std::ostream &os) : os_(os){};
  void on_segment(const GlobalSegment &segment) override;

private:
  std::mutex mutex_;
  std::ostream &os_;
};

#endif

//
//  transcript_sink.cpp
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

#include "transcript_sink.hpp"
#include "utils.hpp"

void StreamSink::on_segment(const GlobalSegment &segment) {
  std::lock_guard<std::mutex> lock(mutex_);
  os_ << "[" << to_timestamp(segment.start) << " --> "
      << to_timestamp(segment.end) << "]  " << segment.text << std::endl;
}

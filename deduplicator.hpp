//
//  deduplicator.hpp
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

#ifndef _DEDUPLICATOR_HPP_
#define _DEDUPLICATOR_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "audio.hpp"
#include "segment.hpp"

/*
 * Drops the segments an overlapping window transcribed twice.
 * The decision is taken on time only: a segment ending at or before the
 * watermark (end of the last emitted segment) was already emitted.
 * A segment straddling the watermark is emitted whole.
 */
class Deduplicator {
public:
  explicit Deduplicator(bool suppress_repeats = false)
      : suppress_repeats_(suppress_repeats){};

  std::vector<GlobalSegment> reconcile(const Window &window,
                                       const std::vector<LocalSegment> &local);

  double get_watermark() const { return watermark_; }
  uint64_t get_emitted_num() const { return emitted_num_; }
  uint64_t get_discarded_num() const { return discarded_num_; }

  static std::string normalize(const std::string &text);

private:
  bool suppress_repeats_;
  double watermark_{0};
  std::string last_text_;
  uint64_t emitted_num_{0};
  uint64_t discarded_num_{0};
};

#endif

//
//  deduplicator.cpp
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

#include <boost/algorithm/string.hpp>

#include "deduplicator.hpp"
#include "log.hpp"

std::string Deduplicator::normalize(const std::string &text) {
  std::string norm = boost::algorithm::to_lower_copy(text);
  boost::algorithm::trim_if(
      norm, boost::algorithm::is_space() ||
                boost::algorithm::is_any_of(".,!?;:\"'()[]{}"));
  return norm;
}

std::vector<GlobalSegment>
Deduplicator::reconcile(const Window &window,
                        const std::vector<LocalSegment> &local) {
  std::vector<GlobalSegment> out;
  const double offset = window.global_start();

  for (const auto &segment : local) {
    GlobalSegment global;
    global.text = boost::algorithm::trim_copy(segment.text);
    global.start = offset + segment.start;
    global.end = offset + segment.end;

    if (global.text.empty()) {
      continue;
    }

    if (global.end <= watermark_) {
      BOOST_LOG_TRIVIAL(debug)
          << "deduplicator:: drop [" << global.start << ", " << global.end
          << "] below watermark " << watermark_ << ": " << global.text;
      discarded_num_++;
      continue;
    }

    if (suppress_repeats_) {
      auto norm = normalize(global.text);
      if (!norm.empty() && norm == last_text_) {
        BOOST_LOG_TRIVIAL(debug)
            << "deduplicator:: drop repeated text: " << global.text;
        watermark_ = global.end;
        discarded_num_++;
        continue;
      }
      last_text_ = std::move(norm);
    }

    watermark_ = global.end;
    emitted_num_++;
    out.push_back(std::move(global));
  }

  return out;
}

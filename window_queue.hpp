//
//  window_queue.hpp
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

#ifndef _WINDOW_QUEUE_HPP_
#define _WINDOW_QUEUE_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>

#include "audio.hpp"
#include "config.hpp"

/*
 * Bounded FIFO between the capture loop and the transcription loop.
 * When full, push() either waits for room or drops the oldest window,
 * depending on the backpressure policy.
 */
class WindowQueue {
public:
  WindowQueue(size_t capacity, Backpressure policy)
      : capacity_(capacity), policy_(policy){};
  WindowQueue(const WindowQueue &) = delete;

  /* false if the queue was interrupted or closed, window not queued */
  bool push(Window &&window);
  /* end of stream window, bypasses the capacity, then closes the queue */
  void push_final(Window &&window);
  /* false once closed and drained */
  bool pop(Window &window);

  /* no more windows will be pushed */
  void close();
  /* wakes up a producer blocked in push() */
  void interrupt();

  size_t size() const;
  uint64_t get_dropped() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Window> windows_;
  size_t capacity_;
  Backpressure policy_;
  uint64_t dropped_{0};
  bool closed_{false};
  bool interrupted_{false};
};

#endif

//
//  window_queue.cpp
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

#include "log.hpp"
#include "window_queue.hpp"

bool WindowQueue::push(Window &&window) {
  std::unique_lock lock(mutex_);
  if (policy_ == Backpressure::block) {
    not_full_.wait(lock, [&] {
      return interrupted_ || closed_ || windows_.size() < capacity_;
    });
  }
  if (interrupted_ || closed_)
    return false;

  if (windows_.size() >= capacity_) {
    BOOST_LOG_TRIVIAL(warning)
        << "window_queue:: queue full, dropping window "
        << windows_.front().index << ", probably running too slow";
    windows_.pop_front();
    dropped_++;
  }
  windows_.push_back(std::move(window));
  lock.unlock();
  not_empty_.notify_one();
  return true;
}

void WindowQueue::push_final(Window &&window) {
  std::unique_lock lock(mutex_);
  if (!closed_) {
    windows_.push_back(std::move(window));
    closed_ = true;
  }
  lock.unlock();
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool WindowQueue::pop(Window &window) {
  std::unique_lock lock(mutex_);
  not_empty_.wait(lock, [&] { return closed_ || !windows_.empty(); });
  if (windows_.empty())
    return false;

  window = std::move(windows_.front());
  windows_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return true;
}

void WindowQueue::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  not_empty_.notify_all();
  not_full_.notify_all();
}

void WindowQueue::interrupt() {
  std::lock_guard<std::mutex> lock(mutex_);
  interrupted_ = true;
  not_full_.notify_all();
}

size_t WindowQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.size();
}

uint64_t WindowQueue::get_dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

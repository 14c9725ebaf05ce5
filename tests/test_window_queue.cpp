//
//  test_window_queue.cpp
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

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "test_helpers.hpp"
#include "window_queue.hpp"

using namespace std::chrono_literals;

static Window make_window(uint64_t index, bool final = false) {
  Window window;
  window.index = index;
  window.start_sample = index * 56000;
  window.final = final;
  return window;
}

void test_fifo_order() {
  WindowQueue queue(4, Backpressure::block);
  for (uint64_t i = 0; i < 3; i++) {
    assert(queue.push(make_window(i)));
  }
  assert(queue.size() == 3);

  Window window;
  for (uint64_t i = 0; i < 3; i++) {
    assert(queue.pop(window));
    assert(window.index == i);
  }
  assert(queue.size() == 0);
  std::cout << "[PASS] test_fifo_order" << std::endl;
}

void test_drop_oldest() {
  WindowQueue queue(2, Backpressure::drop_oldest);
  assert(queue.push(make_window(0)));
  assert(queue.push(make_window(1)));
  assert(queue.push(make_window(2)));
  assert(queue.size() == 2);
  assert(queue.get_dropped() == 1);

  Window window;
  assert(queue.pop(window) && window.index == 1);
  assert(queue.pop(window) && window.index == 2);
  std::cout << "[PASS] test_drop_oldest" << std::endl;
}

void test_block_waits_for_room() {
  WindowQueue queue(1, Backpressure::block);
  assert(queue.push(make_window(0)));

  std::atomic_bool pushed{false};
  std::thread producer([&]() {
    assert(queue.push(make_window(1)));
    pushed = true;
  });

  std::this_thread::sleep_for(50ms);
  assert(!pushed);
  assert(queue.size() == 1);

  Window window;
  assert(queue.pop(window) && window.index == 0);
  producer.join();
  assert(pushed);
  assert(queue.pop(window) && window.index == 1);
  assert(queue.get_dropped() == 0);
  std::cout << "[PASS] test_block_waits_for_room" << std::endl;
}

void test_interrupt_releases_producer() {
  WindowQueue queue(1, Backpressure::block);
  assert(queue.push(make_window(0)));

  std::atomic_bool result{true};
  std::thread producer([&]() { result = queue.push(make_window(1)); });

  std::this_thread::sleep_for(20ms);
  queue.interrupt();
  producer.join();
  assert(!result);
  assert(queue.size() == 1);
  std::cout << "[PASS] test_interrupt_releases_producer" << std::endl;
}

void test_final_window_and_close() {
  WindowQueue queue(1, Backpressure::block);
  assert(queue.push(make_window(0)));
  /* the final window never waits and closes the queue */
  queue.push_final(make_window(1, true));
  assert(queue.size() == 2);
  assert(!queue.push(make_window(2)));

  Window window;
  assert(queue.pop(window) && window.index == 0 && !window.final);
  assert(queue.pop(window) && window.index == 1 && window.final);
  assert(!queue.pop(window));
  std::cout << "[PASS] test_final_window_and_close" << std::endl;
}

void test_close_wakes_consumer() {
  WindowQueue queue(2, Backpressure::block);
  std::atomic_bool result{true};
  std::thread consumer([&]() {
    Window window;
    result = queue.pop(window);
  });

  std::this_thread::sleep_for(20ms);
  queue.close();
  consumer.join();
  assert(!result);
  std::cout << "[PASS] test_close_wakes_consumer" << std::endl;
}

int main() {
  quiet_logs();
  std::cout << "=== WindowQueue Tests ===" << std::endl;

  test_fifo_order();
  test_drop_oldest();
  test_block_waits_for_room();
  test_interrupt_releases_producer();
  test_final_window_and_close();
  test_close_wakes_consumer();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}

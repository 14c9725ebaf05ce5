//
//  engine.hpp
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

#ifndef _ENGINE_HPP_
#define _ENGINE_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "segment.hpp"

/*
 * Speech recognition engine called once per window.
 * Implementations are not required to be thread safe, the transcriber
 * never has more than one call in flight.
 */
class Engine {
public:
  virtual ~Engine() = default;

  /* loads the model, called once before any audio is accepted */
  virtual bool preload() = 0;
  /* false on failure, segments are then left empty */
  virtual bool transcribe(const int16_t *in, uint32_t samples_in,
                          std::vector<LocalSegment> &segments) = 0;
  virtual void terminate() {}
  virtual std::string get_name() const = 0;
};

/* checks the engine contract, segments ordered and within [0, duration] */
bool check_segments(const std::vector<LocalSegment> &segments, double duration,
                    std::string &error);

#endif

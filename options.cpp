//
//  options.cpp
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

#include "options.hpp"

namespace po = boost::program_options;

Backpressure parse_backpressure(const std::string &policy) {
  if (policy == "block")
    return Backpressure::block;
  if (policy == "drop_oldest")
    return Backpressure::drop_oldest;
  throw po::validation_error(po::validation_error::invalid_option_value,
                             "backpressure", policy);
}

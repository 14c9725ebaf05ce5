//
//  options.hpp
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

#ifndef _OPTIONS_HPP_
#define _OPTIONS_HPP_

#include <boost/program_options.hpp>
#include <limits>
#include <string>

#include "config.hpp"

/* throws boost::program_options::validation_error */
Backpressure parse_backpressure(const std::string &policy);

/*
 * Reads an integer option into the narrower type the Config setter takes.
 * Throws boost::program_options::validation_error when the value is below
 * min or does not fit.
 */
template <typename T>
T parse_count(const boost::program_options::variables_map &vm,
              const std::string &name, int min) {
  namespace po = boost::program_options;
  int value = vm[name].as<int>();
  if (value < min || static_cast<long long>(value) >
                         static_cast<long long>(std::numeric_limits<T>::max())) {
    throw po::validation_error(po::validation_error::invalid_option_value,
                               name, std::to_string(value));
  }
  return static_cast<T>(value);
}

#endif

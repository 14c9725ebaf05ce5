//
//  pcm_source.cpp
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

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "log.hpp"
#include "pcm_source.hpp"

bool PcmFileSource::open() {
  if (fd_ >= 0)
    return true;

  if (path_ == "-") {
    fd_ = STDIN_FILENO;
    owns_input_ = false;
  } else {
    fd_ = ::open(path_.c_str(), O_RDONLY);
    if (fd_ < 0) {
      BOOST_LOG_TRIVIAL(error) << "pcm_source:: cannot open " << path_ << ": "
                               << strerror(errno);
      return false;
    }
    owns_input_ = true;
  }

  buffer_.resize(chunk_samples_ * sizeof(int16_t));
  carry_.clear();
  position_ = 0;
  BOOST_LOG_TRIVIAL(info) << "pcm_source:: reading " << path_;
  return true;
}

ReadStatus PcmFileSource::read(AudioFrame &frame,
                               std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return ReadStatus::error;

  struct pollfd pfd;
  pfd.fd = fd_;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready == 0 || (ready < 0 && errno == EINTR))
    return ReadStatus::timeout;
  if (ready < 0) {
    BOOST_LOG_TRIVIAL(error) << "pcm_source:: poll error on " << path_ << ": "
                             << strerror(errno);
    return ReadStatus::error;
  }

  ssize_t n_read = ::read(fd_, buffer_.data(), buffer_.size());
  if (n_read < 0) {
    if (errno == EINTR || errno == EAGAIN)
      return ReadStatus::timeout;
    BOOST_LOG_TRIVIAL(error) << "pcm_source:: read error on " << path_ << ": "
                             << strerror(errno);
    return ReadStatus::error;
  }
  if (n_read == 0) {
    if (!carry_.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "pcm_source:: dropping " << carry_.size()
                                 << " trailing bytes";
      carry_.clear();
    }
    return ReadStatus::end_of_stream;
  }

  std::vector<uint8_t> data;
  data.reserve(carry_.size() + n_read);
  data.insert(data.end(), carry_.begin(), carry_.end());
  data.insert(data.end(), buffer_.begin(), buffer_.begin() + n_read);
  carry_.clear();

  const size_t n_samples = data.size() / sizeof(int16_t);
  const size_t rem = data.size() % sizeof(int16_t);
  if (rem > 0) {
    carry_.insert(carry_.end(), data.end() - rem, data.end());
  }

  frame.position = position_;
  frame.samples.resize(n_samples);
  for (size_t i = 0; i < n_samples; i++) {
    /* little endian */
    frame.samples[i] =
        static_cast<int16_t>(data[i * 2] | (data[i * 2 + 1] << 8));
  }
  position_ += n_samples;

  return n_samples > 0 ? ReadStatus::frame : ReadStatus::timeout;
}

void PcmFileSource::close() {
  if (fd_ >= 0 && owns_input_) {
    ::close(fd_);
  }
  fd_ = -1;
}

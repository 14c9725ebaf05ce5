//
//  main.cpp
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

#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <thread>

#include "capture.hpp"
#include "config.hpp"
#include "log.hpp"
#include "options.hpp"
#include "pcm_source.hpp"
#include "transcriber.hpp"
#include "transcript_sink.hpp"
#include "whisper.hpp"

namespace po = boost::program_options;
namespace postyle = boost::program_options::command_line_style;

static const std::string version("livescribe-1.0.0");
static std::atomic<bool> terminate = false;

void termination_handler(int /*signum*/) {
  // Terminate program
  terminate = true;
}

bool is_terminated() { return terminate.load(); }

static bool export_text(const std::string &path, const std::string &text) {
  std::ofstream out(path);
  if (!out) {
    BOOST_LOG_TRIVIAL(error) << "main:: cannot open " << path;
    return false;
  }
  out << text;
  out.close();
  if (!out) {
    BOOST_LOG_TRIVIAL(error) << "main:: cannot write " << path;
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "main:: transcript written to " << path;
  return true;
}

int main(int argc, char *argv[]) {
  int rc(EXIT_SUCCESS);
  po::options_description desc("Options");
  desc.add_options()
      ("version,v", "Print version and exit")
      ("input,i", po::value<std::string>(), "Raw s16le mono 16kHz PCM file, - for stdin, ALSA capture if not set")
      ("device_name,D", po::value<std::string>()->default_value("default"), "ALSA capture device name")
      ("window,w", po::value<float>()->default_value(5.0f, "5.0"), "Window duration in seconds")
      ("overlap,O", po::value<float>()->default_value(1.5f, "1.5"), "Overlap between windows in seconds")
      ("min_flush,f", po::value<float>()->default_value(0.6f, "0.6"), "Minimum duration of the final window in seconds")
      ("rms_threshold,t", po::value<float>()->default_value(80.0f, "80"), "Silence RMS threshold")
      ("peak_threshold,p", po::value<float>()->default_value(900.0f, "900"), "Silence peak threshold")
      ("flush_rms_threshold", po::value<float>()->default_value(120.0f, "120"), "Final window silence RMS threshold")
      ("flush_peak_threshold", po::value<float>()->default_value(1500.0f, "1500"), "Final window silence peak threshold")
      ("start_gate,g", po::value<bool>()->default_value(true), "Enable/disable start gate, waiting for clear speech at start and after silence")
      ("start_rms_threshold", po::value<float>()->default_value(120.0f, "120"), "Start gate RMS threshold")
      ("start_peak_threshold", po::value<float>()->default_value(1500.0f, "1500"), "Start gate peak threshold")
      ("queue_size,q", po::value<int>()->default_value(20), "Windows waiting for transcription")
      ("backpressure,b", po::value<std::string>()->default_value("block"), "Full queue policy: block or drop_oldest")
      ("chunk_ms,k", po::value<int>()->default_value(100), "Audio frame duration in ms")
      ("underrun_ms,u", po::value<int>()->default_value(2000), "Audio stall reported as underrun in ms")
      ("suppress_repeats,R", po::value<bool>()->default_value(false), "Drop segments repeating the previous text")
      ("language,l", po::value<std::string>()->default_value("en"), "Whisper default language")
      ("model,m", po::value<std::string>()->default_value("models/ggml-base.en.bin"), "Whisper model to use")
      ("openvino_device,o", po::value<std::string>()->default_value("CPU"), "Whisper openvino device to use")
      ("threads,j", po::value<int>()->default_value(4), "Whisper threads")
      ("vad_enabled,e", po::value<bool>()->default_value(false), "Whisper enable/disable VAD")
      ("use_context,x", po::value<bool>()->default_value(false), "Whisper enable/disable token context")
      ("vad_model,a", po::value<std::string>()->default_value("models/ggml-silero-v5.1.2.bin"), "Whisper VAD model to use")
      ("vad_threshold", po::value<float>()->default_value(0.5f, "0.5"), "Whisper VAD threshold to use")
      ("output,T", po::value<std::string>(), "Write the transcript to file on exit")
      ("log_level,d", po::value<int>()->default_value(2), "Log level from 0=trace to 5=fatal")
      ("help,h", "Print this help " "message");
  int unix_style = postyle::unix_style | postyle::short_allow_next;

  po::variables_map vm;
  Config config;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .style(unix_style)
                  .run(),
              vm);

    po::notify(vm);

    if (vm.count("version")) {
      std::cout << version << '\n';
      return EXIT_SUCCESS;
    }
    if (vm.count("help")) {
      std::cout << "USAGE: " << argv[0] << '\n' << desc << '\n';
      return EXIT_SUCCESS;
    }

    config.set_backpressure(
        parse_backpressure(vm["backpressure"].as<std::string>()));
    config.set_queue_size(parse_count<uint16_t>(vm, "queue_size", 1));
    config.set_chunk_ms(parse_count<uint16_t>(vm, "chunk_ms", 1));
    config.set_underrun_ms(parse_count<uint32_t>(vm, "underrun_ms", 0));
    config.set_threads(parse_count<int>(vm, "threads", 1));
    config.set_log_severity(parse_count<int>(vm, "log_level", 0));

  } catch (po::error &poe) {
    std::cerr << poe.what() << '\n'
              << "USAGE: " << argv[0] << '\n'
              << desc << '\n';
    return EXIT_FAILURE;
  }

  signal(SIGINT, termination_handler);
  signal(SIGTERM, termination_handler);
  signal(SIGCHLD, SIG_IGN);

  if (vm.count("input")) {
    config.set_input(vm["input"].as<std::string>());
  }
  if (vm.count("output")) {
    config.set_output(vm["output"].as<std::string>());
  }
  config.set_device_name(vm["device_name"].as<std::string>());
  config.set_window_seconds(vm["window"].as<float>());
  config.set_overlap_seconds(vm["overlap"].as<float>());
  config.set_min_flush_seconds(vm["min_flush"].as<float>());
  config.set_rms_threshold(vm["rms_threshold"].as<float>());
  config.set_peak_threshold(vm["peak_threshold"].as<float>());
  config.set_flush_rms_threshold(vm["flush_rms_threshold"].as<float>());
  config.set_flush_peak_threshold(vm["flush_peak_threshold"].as<float>());
  config.set_start_gate_enabled(vm["start_gate"].as<bool>());
  config.set_start_rms_threshold(vm["start_rms_threshold"].as<float>());
  config.set_start_peak_threshold(vm["start_peak_threshold"].as<float>());
  config.set_suppress_repeats(vm["suppress_repeats"].as<bool>());
  config.set_language(vm["language"].as<std::string>());
  config.set_model(vm["model"].as<std::string>());
  config.set_openvino_device(vm["openvino_device"].as<std::string>());
  config.set_vad_enabled(vm["vad_enabled"].as<bool>());
  config.set_vad_model(vm["vad_model"].as<std::string>());
  config.set_vad_threshold(vm["vad_threshold"].as<float>());
  config.set_use_context(vm["use_context"].as<bool>());

  /* init logging */
  log_init(config);

  BOOST_LOG_TRIVIAL(debug) << "main:: initializing ...";
  try {
    std::shared_ptr<AudioSource> source;
    if (config.get_input().empty()) {
      source = std::make_shared<Capture>(config);
    } else {
      source = std::make_shared<PcmFileSource>(config.get_input(),
                                               config.get_chunk_samples());
    }
    auto engine = std::make_shared<Whisper>(config);
    auto sink = std::make_shared<StreamSink>(std::cout);

    auto transcriber = Transcriber::create(config, engine, source, sink);
    if (!transcriber->init()) {
      throw std::runtime_error(std::string("main:: Transcriber init failed"));
    }

    BOOST_LOG_TRIVIAL(debug) << "main:: init done, entering loop...";

    if (!transcriber->start()) {
      throw std::runtime_error(
          std::string("main:: Transcriber start failed"));
    }

    while (!is_terminated() && transcriber->get_state() != State::stopped) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (is_terminated()) {
      BOOST_LOG_TRIVIAL(info) << "main:: got termination signal";
    }

    if (!transcriber->stop()) {
      BOOST_LOG_TRIVIAL(warning) << "main:: audio source ended with error";
    }

    auto stats = transcriber->get_stats();
    BOOST_LOG_TRIVIAL(info)
        << "main:: windows " << stats.windows << " silent "
        << stats.windows_silent << " failed " << stats.windows_failed
        << " discarded " << stats.windows_discarded << " dropped "
        << stats.windows_dropped << ", segments " << stats.segments_emitted
        << " duplicates " << stats.segments_discarded << ", underruns "
        << stats.underruns << ", last segment end " << stats.watermark << "s";

    std::string text;
    if (!config.get_output().empty() && transcriber->get_text(text)) {
      if (!export_text(config.get_output(), text)) {
        rc = EXIT_FAILURE;
      }
    }

    if (!transcriber->terminate()) {
      rc = EXIT_FAILURE;
    }
  } catch (std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "main:: fatal exception error: " << e.what();
    rc = EXIT_FAILURE;
  }

  BOOST_LOG_TRIVIAL(debug) << "main:: exiting with code: " << rc;
  return rc;
}

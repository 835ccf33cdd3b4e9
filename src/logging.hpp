#ifndef SPRAY_LOGGING_HPP
#define SPRAY_LOGGING_HPP

#include "spray/Config.h"
#include "scene.hpp"
#include "image.hpp"
#include <iostream>
#ifdef WITH_TIMING
  #include <chrono>
#endif
#ifdef WITH_PROGRESS
  #include <atomic>
  #include <iomanip>
  #include <string>
  #include <thread>
#endif

struct StageLogger {
  const RenderOptions &opts;
  StageLogger(const RenderOptions &opts) : opts(opts) {}
#ifdef WITH_PROGRESS
  static constexpr unsigned progressWidth = 4;
  const Image *image = nullptr;
  std::atomic<bool> renderFinished{false};
  std::thread progressPrinter;
  ~StageLogger() {
    renderFinished = true;
    if (progressPrinter.joinable()) progressPrinter.join();
  }
#endif // WITH_PROGRESS
#ifdef WITH_TIMING
  using timepoint_t = std::chrono::time_point<std::chrono::high_resolution_clock>;
  timepoint_t begin;
  timepoint_t preprocess_begin;
  timepoint_t render_begin;
  timepoint_t output_begin;
  timepoint_t end;
#endif
  void start() {
    std::cout << "Loading " << (opts.filename.empty() ? "built-in job" : opts.filename) << std::endl;
#ifdef WITH_TIMING
    begin = std::chrono::high_resolution_clock::now();
#endif
  }
  void finish() {
#ifdef WITH_TIMING
    end = std::chrono::high_resolution_clock::now();
#endif
  }
  void startPreprocessing(const Scene &scene) {
    std::cout << scene.size() << " objects, " << opts.resolution.w << "x" << opts.resolution.h
              << ", " << opts.path_opts.num_samples << " samples, depth " << opts.path_opts.max_depth << std::endl;
#ifdef WITH_TIMING
    preprocess_begin = std::chrono::high_resolution_clock::now();
#endif
  }
  void startRendering() {
    std::cout << "Rendering..." << std::endl;
#ifdef WITH_PROGRESS
    progressPrinter = std::thread([](const StageLogger *logger) {
      while (!logger->renderFinished) {
        std::this_thread::sleep_for(std::chrono::milliseconds{200});

        unsigned int writtenPixelsSum = logger->image->writtenPixels;

        auto percent = writtenPixelsSum * 100ull / (logger->opts.resolution.w * logger->opts.resolution.h);
        if (percent == 100) break;
        auto f(std::cout.flags());
        std::cout << std::string(StageLogger::progressWidth, '\b');
        std::cout << std::right << std::setw(StageLogger::progressWidth - 1); // -1 because of %
        std::cout << percent << "%" << std::flush;
        std::cout.flags(f);
      }
    }, this);
#endif // WITH_PROGRESS
#ifdef WITH_TIMING
    render_begin = std::chrono::high_resolution_clock::now();
#endif
  }
  void startOutput() {
#ifdef WITH_PROGRESS
    renderFinished = true;
    if (progressPrinter.joinable()) progressPrinter.join();
    std::cout << std::string(progressWidth, '\b') << std::setw(progressWidth) << "100%" << std::endl;
#endif // WITH_PROGRESS
    std::cout << "Saving " << opts.output << std::endl;
#ifdef WITH_TIMING
    output_begin = std::chrono::high_resolution_clock::now();
#endif
  }
  void log() const {
#ifdef WITH_TIMING
    std::cout << "Preprocess Time: " << std::chrono::duration_cast<std::chrono::milliseconds>(render_begin - preprocess_begin).count() << "ms\n";
    std::cout << "Render Time: " << std::chrono::duration_cast<std::chrono::milliseconds>(output_begin - render_begin).count() << "ms\n";
    std::cout << "Total Time: " << std::chrono::duration_cast<std::chrono::milliseconds>(end - begin).count() << "ms\n";
#endif
  }
  void dump_config() const;
};
#ifdef WITH_CONFDUMP
#include <iomanip>
#include <cstring>
#define STR_(x)  #x
#define STR(x)   STR_(x)

#define print_opt(x) do {                              \
    auto f(std::cout.flags());                         \
    std::cout << std::left << std::setw(16) << #x ": ";\
    if (strcmp(#x, STR(x))) {                          \
      if (strcmp(STR(x), "")) {                        \
        std::cout << STR(x)"\n";                       \
      } else {                                         \
        std::cout << "ON\n";                           \
      }                                                \
    } else {                                           \
      std::cout << "OFF\n";                            \
    }                                                  \
    std::cout.flags(f);                                \
  } while(false)

  inline void StageLogger::dump_config() const {
    std::cout << "####### Configuration: #######\n";
    print_opt(WITH_TIMING);
    print_opt(WITH_CONFDUMP);
    print_opt(WITH_PROGRESS);
    std::cout << "##############################\n";
#ifdef DEBUG
    std::cout << "Warning: This is a Debug build and might be very slow!\n";
#endif
  }
#undef STR
#undef STR_
#undef print_opt
#else
  inline void StageLogger::dump_config() const {}
#endif
#endif // SPRAY_LOGGING_HPP

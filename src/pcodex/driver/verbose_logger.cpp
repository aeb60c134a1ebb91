#include "verbose_logger.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pcodex::driver {

namespace {

auto LevelFor(int verbosity) -> spdlog::level::level_enum {
  if (verbosity >= 2) {
    return spdlog::level::debug;
  }
  if (verbosity == 1) {
    return spdlog::level::info;
  }
  return spdlog::level::warn;
}

}  // namespace

VerboseLogger::VerboseLogger(int level)
    : level_(level),
      logger_(
          std::make_shared<spdlog::logger>(
              "pcodex",
              std::make_shared<spdlog::sinks::stderr_color_sink_mt>())) {
  logger_->set_pattern("[pcodex][%H:%M:%S][%^%l%$] %v");
  logger_->set_level(LevelFor(level));
  spdlog::set_default_logger(logger_);
}

void VerboseLogger::PhaseBegin(std::string_view phase_name) {
  if (!Enabled(1)) {
    return;
  }
  logger_->info("{}: begin", phase_name);
}

void VerboseLogger::PhaseDone(std::string_view phase_name, double seconds) {
  if (!Enabled(1)) {
    return;
  }
  logger_->info("{}: done ({:.3f}s)", phase_name, seconds);
}

PhaseTimer::PhaseTimer(VerboseLogger& logger, std::string phase_name)
    : logger_(logger),
      phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()) {
  logger_.PhaseBegin(phase_name_);
}

PhaseTimer::~PhaseTimer() {
  auto end = std::chrono::steady_clock::now();
  std::chrono::duration<double> seconds = end - start_;
  logger_.PhaseDone(phase_name_, seconds.count());
}

}  // namespace pcodex::driver

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace pcodex::driver {

// Central logger for the driver, backed by a stderr spdlog logger that is
// also installed as the spdlog default. stdout stays reserved for output.
// Level 0 logs warnings only, 1 adds phase timing, 2 and up add debug output.
class VerboseLogger {
 public:
  explicit VerboseLogger(int level);

  [[nodiscard]] auto Enabled(int required_level) const -> bool {
    return level_ >= required_level;
  }

  // Log a phase begin event (level 1).
  void PhaseBegin(std::string_view phase_name);

  // Log a phase done event with duration (level 1).
  void PhaseDone(std::string_view phase_name, double seconds);

  [[nodiscard]] auto logger() const -> spdlog::logger& {
    return *logger_;
  }

  [[nodiscard]] auto level() const -> int {
    return level_;
  }

 private:
  int level_;
  std::shared_ptr<spdlog::logger> logger_;
};

// RAII helper for timing phases. Logs begin on construction, done on
// destruction.
class PhaseTimer {
 public:
  PhaseTimer(VerboseLogger& logger, std::string phase_name);
  ~PhaseTimer();

  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

 private:
  VerboseLogger& logger_;
  std::string phase_name_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace pcodex::driver

#pragma once

#include <array>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>
#include <unordered_map>

namespace weld::driver {

// Central logger for verbose output during a build.
// All output goes to stderr to keep stdout for dumps.
class VerboseLogger {
 public:
  explicit VerboseLogger(int level, FILE* sink = stderr)
      : level_(level), sink_(sink) {
  }

  auto Enabled(int required_level) const -> bool {
    return level_ >= required_level;
  }

  // Log a phase begin event (level 1).
  void PhaseBegin(std::string_view phase_name);

  // Log a phase done event with duration (level 1).
  void PhaseDone(std::string_view phase_name, double seconds);

  // Free-form detail line (level 1).
  void Detail(std::string_view message);

  // Record phase duration regardless of verbosity.
  void RecordPhaseDuration(std::string_view name, double seconds);

  // Print phase summary line for --stats output.
  void PrintPhaseSummary(FILE* sink = stderr) const;

  auto level() const -> int {
    return level_;
  }

 private:
  // Fixed phase order for deterministic output.
  static constexpr std::array<std::string_view, 5> kPhaseOrder = {
      "scan", "link", "chunk", "render", "write"};

  int level_;
  FILE* sink_;
  std::unordered_map<std::string, double> phase_durations_;
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
  bool enabled_;
};

}  // namespace weld::driver

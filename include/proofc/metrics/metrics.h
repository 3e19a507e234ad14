/***
 * Name: proofc::metrics::Metrics
 * Purpose: OO metrics interface with static registry. Pipeline stages can inherit
 *   this class and use ScopedTimer plus helper methods to record metrics.
 * Inputs: Phase identifiers and counter updates (units verified, artifacts built)
 * Outputs: A static registry accessible by the driver for reporting.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace proofc {

namespace metrics {

class Metrics {
 public:
  enum class Phase { Translate, Resolve, Optimize, Solve, CodeGen, NativeBuild, Run };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    std::map<std::string, std::uint64_t> counters;
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() noexcept {
      if (!reg_.enabled) return;
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      reg_.durations_ns.emplace_back(phase_, static_cast<std::uint64_t>(ns));
    }

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  static void Enable(bool on) { reg_.enabled = on; }
  static Registry& GetRegistry() { return reg_; }
  static void Reset() { reg_ = Registry{}; }
  static void IncCounter(const std::string& key, std::uint64_t delta = 1) { if (reg_.enabled) reg_.counters[key] += delta; }

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
};

}  // namespace metrics
}  // namespace proofc

/***
 * Name: proofc::pipeline::FormatElapsed
 * Purpose: Render a duration as HH:MM:SS (hours are not wrapped).
 */
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

#include "proofc/pipeline/result_aggregator.h"

namespace proofc::pipeline {

auto FormatElapsed(std::chrono::nanoseconds elapsed) -> std::string {
  const auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
  constexpr long long kSecondsPerMinute = 60;
  constexpr long long kSecondsPerHour = 3600;
  std::ostringstream out;
  out << std::setfill('0') << std::setw(2) << (total / kSecondsPerHour) << ':'
      << std::setw(2) << ((total % kSecondsPerHour) / kSecondsPerMinute) << ':'
      << std::setw(2) << (total % kSecondsPerMinute);
  return out.str();
}

}  // namespace proofc::pipeline

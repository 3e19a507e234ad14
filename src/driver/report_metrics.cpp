/***
 * Name: proofc::driver::ReportMetricsIfRequested
 * Purpose: Print metrics if enabled by CLI.
 * Inputs:
 *   - opts: CLI options containing metrics flags
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Reads Metrics registry and prints text or JSON.
 */
#include "proofc/driver/app.h"
#include "proofc/metrics/metrics.h"

#include <ostream>

namespace proofc::driver {

auto ReportMetricsIfRequested(const CliOptions& opts, std::ostream& out) -> void {
  if (!opts.metrics) {
    return;
  }
  const auto& reg = metrics::Metrics::GetRegistry();
  if (opts.metrics_format == CliOptions::MetricsFormat::Json) {
    metrics::Metrics::PrintMetricsJson(reg, out);
  } else {
    metrics::Metrics::PrintMetrics(reg, out);
  }
}

}  // namespace proofc::driver

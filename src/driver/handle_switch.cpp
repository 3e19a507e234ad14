/***
 * Name: proofc::driver::detail::HandleSwitch
 * Purpose: Handle value-less boolean switches (banners, verification and build policy).
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match
 * Theory of Operation: Table of exact names to setters; no error cases.
 */
#include "proofc/driver/cli_parse.h"
#include "proofc/driver/cli.h"  // direct use of CliOptions

#include <array>
#include <string>
#include <string_view>

namespace proofc {
namespace driver {
namespace detail {

namespace {

struct Switch {
  std::string_view name;
  void (*apply)(CliOptions&);
};

const std::array kSwitches{
    Switch{"--nologo", [](CliOptions& o) { o.no_logo = true; }},
    Switch{"--show-env", [](CliOptions& o) { o.show_env = true; }},
    Switch{"--verify-separately", [](CliOptions& o) { o.pipeline.verify_separately = true; }},
    Switch{"--no-verify", [](CliOptions& o) { o.pipeline.verify = false; }},
    Switch{"--no-resolve", [](CliOptions& o) { o.pipeline.no_resolve = true; }},
    Switch{"--no-typecheck", [](CliOptions& o) { o.pipeline.no_typecheck = true; }},
    Switch{"--separate-module-output", [](CliOptions& o) { o.pipeline.separate_module_output = true; }},
    Switch{"--force-compile", [](CliOptions& o) { o.pipeline.force_compile = true; }},
    Switch{"--run", [](CliOptions& o) { o.pipeline.run_after_compile = true; }},
    Switch{"--optimize", [](CliOptions& o) { o.pipeline.optimize = true; }},
    Switch{"--runtime-lib", [](CliOptions& o) { o.pipeline.use_runtime_lib = true; }},
    Switch{"--print-stats", [](CliOptions& o) { o.pipeline.print_stats = true; }},
    Switch{"--print-call-graph", [](CliOptions& o) { o.pipeline.print_function_call_graph = true; }},
};

}  // namespace

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  for (const auto& entry : kSwitches) {
    if (arg == entry.name) {
      entry.apply(dst);
      return OptResult::Handled;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace proofc

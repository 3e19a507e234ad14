/***
 * Name: proofc::pipeline::Config
 * Purpose: Explicit configuration value threaded through the controller, the
 *   verification runner and the code-gen dispatcher.
 * Inputs: Populated by driver::ParseCli (or directly by embedders/tests).
 * Outputs: Read-only policy for one run.
 * Theory of Operation: Plain aggregate; defaults verify and build when verified.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "proofc/codegen/target.h"

namespace proofc {
namespace pipeline {

struct Config {
  // Verification policy
  bool verify = true;                    // --no-verify clears
  bool no_resolve = false;               // --no-resolve
  bool no_typecheck = false;             // --no-typecheck
  bool verify_separately = false;        // --verify-separately
  int verify_snapshots = -1;             // --verify-snapshots=<n>; < 0 disables lookup
  bool separate_module_output = false;   // --separate-module-output
  std::optional<std::string> print_file; // --print-vc=<file>
  std::string dump_dir;                  // --dump-dir=<dir>; empty uses the system temp dir
  std::vector<std::string> procs_to_check;  // --proc=<name>, repeatable

  // Code generation and native build
  bool compile = true;                   // --compile=<0|1>
  bool force_compile = false;            // --force-compile
  bool run_after_compile = false;        // --run
  int spill_target_code = 0;             // --spill=<0..3>
  codegen::Target target = codegen::Target::Cpp;  // --target=<cpp|js>
  std::optional<std::string> print_compiled_file; // --out=<file>
  bool optimize = false;                 // --optimize
  bool use_runtime_lib = false;          // --runtime-lib
  std::string runtime_lib_dir;           // --runtime-lib-dir=<dir>
  std::string cxx = "clang++";           // --cxx=<compiler>

  // Reporting
  bool count_verification_errors = true; // --count-verification-errors=<0|1>
  bool print_stats = false;              // --print-stats
  bool print_function_call_graph = false;  // --print-call-graph
};

}  // namespace pipeline
}  // namespace proofc

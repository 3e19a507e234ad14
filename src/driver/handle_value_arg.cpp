/***
 * Name: proofc::driver::detail::HandleValueArg
 * Purpose: Handle --name=value options.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult; Error (with a message on err) for empty or malformed values
 * Theory of Operation: Table of "--name=" prefixes to setters. Each setter validates
 *   its value and reports the problem itself.
 */
#include "proofc/driver/cli_parse.h"
#include "proofc/driver/cli.h"  // direct use of CliOptions

#include <array>
#include <climits>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include "proofc/codegen/target.h"

namespace proofc {
namespace driver {
namespace detail {

namespace {

using Setter = bool (*)(const std::string& value, CliOptions& dst, std::ostream& err);

struct ValueOption {
  std::string_view prefix;
  Setter apply;
};

auto Fail(std::ostream& err, std::string_view option, const std::string& value, std::string_view expected)
    -> bool {
  err << "proofc: error: invalid value '" << value << "' for '" << option << "' (expected " << expected << ")"
      << '\n';
  return false;
}

auto ParseFlag(const std::string& value, std::string_view option, bool& flag, std::ostream& err) -> bool {
  if (value == "0" || value == "1") {
    flag = value == "1";
    return true;
  }
  return Fail(err, option, value, "0 or 1");
}

constexpr long long kMinStackSize = 64LL * 1024LL;
constexpr long long kMaxStackSize = 1024LL * 1024LL * 1024LL;
constexpr long long kMaxSpill = 3;

const std::array kValueOptions{
    ValueOption{"--toolchain=", [](const std::string& v, CliOptions& o, std::ostream&) {
                  o.toolchain_path = v;
                  return true;
                }},
    ValueOption{"--diag-log=", [](const std::string& v, CliOptions& o, std::ostream&) {
                  o.diag_log = v;
                  return true;
                }},
    ValueOption{"--stack-size=", [](const std::string& v, CliOptions& o, std::ostream& e) {
                  long long bytes = 0;
                  if (!ParseIntValue(v, kMinStackSize, kMaxStackSize, bytes)) {
                    return Fail(e, "--stack-size", v, "a byte count between 65536 and 1073741824");
                  }
                  o.stack_size = static_cast<std::size_t>(bytes);
                  return true;
                }},
    ValueOption{"--verify-snapshots=", [](const std::string& v, CliOptions& o, std::ostream& e) {
                  long long level = 0;
                  if (!ParseIntValue(v, 0, INT_MAX, level)) {
                    return Fail(e, "--verify-snapshots", v, "a non-negative integer");
                  }
                  o.pipeline.verify_snapshots = static_cast<int>(level);
                  return true;
                }},
    ValueOption{"--print-vc=", [](const std::string& v, CliOptions& o, std::ostream&) {
                  o.pipeline.print_file = v;
                  return true;
                }},
    ValueOption{"--dump-dir=", [](const std::string& v, CliOptions& o, std::ostream&) {
                  o.pipeline.dump_dir = v;
                  return true;
                }},
    ValueOption{"--compile=", [](const std::string& v, CliOptions& o, std::ostream& e) {
                  return ParseFlag(v, "--compile", o.pipeline.compile, e);
                }},
    ValueOption{"--spill=", [](const std::string& v, CliOptions& o, std::ostream& e) {
                  long long level = 0;
                  if (!ParseIntValue(v, 0, kMaxSpill, level)) {
                    return Fail(e, "--spill", v, "0, 1, 2 or 3");
                  }
                  o.pipeline.spill_target_code = static_cast<int>(level);
                  return true;
                }},
    ValueOption{"--proc=", [](const std::string& v, CliOptions& o, std::ostream&) {
                  o.pipeline.procs_to_check.push_back(v);
                  return true;
                }},
    ValueOption{"--target=", [](const std::string& v, CliOptions& o, std::ostream& e) {
                  const auto target = codegen::ParseTarget(v);
                  if (!target) {
                    return Fail(e, "--target", v, "cpp or js");
                  }
                  o.pipeline.target = *target;
                  return true;
                }},
    ValueOption{"--out=", [](const std::string& v, CliOptions& o, std::ostream&) {
                  o.pipeline.print_compiled_file = v;
                  return true;
                }},
    ValueOption{"--runtime-lib-dir=", [](const std::string& v, CliOptions& o, std::ostream&) {
                  o.pipeline.runtime_lib_dir = v;
                  return true;
                }},
    ValueOption{"--cxx=", [](const std::string& v, CliOptions& o, std::ostream&) {
                  o.pipeline.cxx = v;
                  return true;
                }},
    ValueOption{"--count-verification-errors=", [](const std::string& v, CliOptions& o, std::ostream& e) {
                  return ParseFlag(v, "--count-verification-errors", o.pipeline.count_verification_errors, e);
                }},
};

}  // namespace

auto HandleValueArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  for (const auto& option : kValueOptions) {
    if (!arg.starts_with(option.prefix)) {
      continue;
    }
    const std::string value = arg.substr(option.prefix.size());
    if (value.empty()) {
      err << "proofc: error: missing value after '" << option.prefix << "'" << '\n';
      return OptResult::Error;
    }
    return option.apply(value, dst, err) ? OptResult::Handled : OptResult::Error;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace proofc

/***
 * Name: proofc::driver::PrintUsage
 * Purpose: Print CLI usage information for proofc.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "proofc/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace proofc::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"proofc"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] file.prf... [file.cc|file.cpp|file.a|file.so...]" << '\n'
      << '\n'
      << "General:" << '\n'
      << "  -h, --help                   Print this help and exit" << '\n'
      << "  --toolchain=<plugin.so>      Toolchain plugin (default: $PROOFC_TOOLCHAIN)" << '\n'
      << "  --metrics[=json|text]        Print pipeline metrics (default: text)" << '\n'
      << "  --stack-size=<bytes>         Worker thread stack size (default: 256 MiB)" << '\n'
      << "  --diag-log=<file>            Also write error lines to <file>" << '\n'
      << "  --nologo                     Do not print the version banner" << '\n'
      << "  --show-env                   Echo the command line options" << '\n'
      << '\n'
      << "Verification:" << '\n'
      << "  --no-verify                  Skip translation and verification" << '\n'
      << "  --no-resolve, --no-typecheck Stop after parsing" << '\n'
      << "  --verify-separately          Verify each program file on its own" << '\n'
      << "  --verify-snapshots=<n>       Verify <stem>.v<k><ext> snapshots; n>1 reuses results" << '\n'
      << "  --separate-module-output     Report time and statistics per module" << '\n'
      << "  --print-vc=<file>            Write verification conditions to <file>" << '\n'
      << "  --dump-dir=<dir>             Directory for temporary artifacts" << '\n'
      << "  --proc=<name>                Only verify procedure <name> (repeatable)" << '\n'
      << "  --count-verification-errors=<0|1>  Non-zero exit code on failures (default: 1)" << '\n'
      << '\n'
      << "Compilation:" << '\n'
      << "  --compile=<0|1>              Compile verified programs (default: 1)" << '\n'
      << "  --force-compile              Compile even when verification fails" << '\n'
      << "  --run                        Run the compiled program" << '\n'
      << "  --spill=<0..3>               Write generated source (2: when verified, 3: always)" << '\n'
      << "  --target=<cpp|js>            Code generation target (default: cpp)" << '\n'
      << "  --out=<file>                 Name generated files after <file>" << '\n'
      << "  --optimize                   Optimized build with immutable collections" << '\n'
      << "  --runtime-lib                Link libproofc_runtime.a" << '\n'
      << "  --runtime-lib-dir=<dir>      Runtime library directory" << '\n'
      << "  --cxx=<compiler>             C++ compiler (default: clang++)" << '\n'
      << '\n'
      << "Reports:" << '\n'
      << "  --print-stats                Print program statistics" << '\n'
      << "  --print-call-graph           Print the function call graph" << '\n'
      << "  --                           End of options" << '\n';
}

}  // namespace proofc::driver

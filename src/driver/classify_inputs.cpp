/***
 * Name: proofc::driver::ClassifyInputs
 * Purpose: Split raw inputs into proof programs and auxiliary native files.
 * Inputs: inputs (command-line order), printer for error lines, snapshots (snapshot
 *   lookup enabled: the named program is only the lineage of its .v<k> versions)
 * Outputs: programs (.prf), others (.cc/.cpp sources, .a/.so libraries); false after
 *   printing an error for a missing program or an unsupported extension
 * Theory of Operation: Extension comparison is case-insensitive. Native files are
 *   only checked by the native toolchain when it reads them.
 */
#include "proofc/driver/app.h"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "proofc/pipeline/snapshots.h"
#include "proofc/support/fs.h"

namespace proofc::driver {

auto ClassifyInputs(const std::vector<std::string>& inputs, std::vector<pipeline::SourceDescriptor>& programs,
                    std::vector<pipeline::SourceDescriptor>& others, diag::Printer& printer,
                    bool snapshots) -> bool {
  for (const auto& input : inputs) {
    const std::string extension = support::LowerExtension(input);
    if (extension == ".prf") {
      std::error_code ec;
      const bool present = std::filesystem::exists(input, ec) ||
                           (snapshots && std::filesystem::exists(pipeline::SnapshotName(input, 0), ec));
      if (!present) {
        printer.ErrorWriteLine("*** Error: '" + input + "': file not found");
        return false;
      }
      programs.push_back(pipeline::SourceDescriptor{input, pipeline::SourceKind::Program});
    } else if (extension == ".cc" || extension == ".cpp") {
      others.push_back(pipeline::SourceDescriptor{input, pipeline::SourceKind::NativeSource});
    } else if (extension == ".a" || extension == ".so") {
      others.push_back(pipeline::SourceDescriptor{input, pipeline::SourceKind::NativeLibrary});
    } else {
      printer.ErrorWriteLine("*** Error: '" + input + "': Filename extension '" +
                             std::filesystem::path(input).extension().string() +
                             "' is not supported. Input files must be proof programs (.prf), "
                             "C++ sources (.cc, .cpp) or native libraries (.a, .so)");
      return false;
    }
  }
  return true;
}

}  // namespace proofc::driver

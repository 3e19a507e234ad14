/***
 * Name: proofc::toolchain (collaborator interfaces)
 * Purpose: Narrow interfaces for the external front end, translator, proof engine
 *   and code generators driven by the pipeline.
 * Inputs: N/A (declarations only)
 * Outputs: Abstract classes implemented by a toolchain plugin (or test fakes).
 * Theory of Operation: The pipeline never looks inside a Program or a VcProgram;
 *   it only sequences the operations declared here and interprets their results.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "proofc/codegen/target.h"
#include "proofc/diag/diagnostic.h"
#include "proofc/pipeline/outcome.h"
#include "proofc/pipeline/source.h"

namespace proofc {
namespace toolchain {

/***
 * Name: proofc::toolchain::Program
 * Purpose: Checked in-memory program plus the diagnostic sink it reports into.
 */
class Program {
 public:
  virtual ~Program() = default;
  virtual diag::DiagnosticSink& Reporter() = 0;
};

/*** VcProgram: Opaque verification-condition program owned by a VcUnit. */
class VcProgram {
 public:
  virtual ~VcProgram() = default;
};

struct VcUnit {
  std::string name;
  std::unique_ptr<VcProgram> program;
};

struct ParseCheckResult {
  std::unique_ptr<Program> program;
  std::optional<std::string> error;  // set when parsing/resolution of the sources failed
};

struct VerifyResult {
  pipeline::PipelineOutcome outcome{pipeline::PipelineOutcome::VerificationCompleted};
  pipeline::PipelineStatistics stats;
};

class Frontend {
 public:
  virtual ~Frontend() = default;
  /*** ParseCheck: Parse, resolve and type-check the source files. */
  virtual ParseCheckResult ParseCheck(const std::vector<pipeline::SourceDescriptor>& files,
                                      const std::string& program_name,
                                      diag::DiagnosticSink& reporter) = 0;
  virtual void PrintStats(const Program& program, std::ostream& out) = 0;
  virtual void PrintFunctionCallGraph(const Program& program, std::ostream& out) = 0;
};

class Translator {
 public:
  virtual ~Translator() = default;
  virtual std::size_t CountVerifiableModules(const Program& program) = 0;
  /*** Translate: One VcUnit per verifiable module, in module order. */
  virtual std::vector<VcUnit> Translate(Program& program) = 0;
};

class ProofEngine {
 public:
  virtual ~ProofEngine() = default;
  /*** ResolveAndTypecheck: Done, ResolutionError, TypeCheckingError or ResolvedAndTypeChecked. */
  virtual pipeline::PipelineOutcome ResolveAndTypecheck(VcProgram& program, const std::string& file_name,
                                                        diag::DiagnosticSink& sink) = 0;
  virtual void EliminateDeadVariables(VcProgram& program) = 0;
  virtual void CollectModSets(VcProgram& program) = 0;
  virtual void CoalesceBlocks(VcProgram& program) = 0;
  virtual void Inline(VcProgram& program) = 0;
  /*** InferAndVerify: Solve; program_id is the cache key when incremental reuse is on. */
  virtual VerifyResult InferAndVerify(VcProgram& program, const std::optional<std::string>& program_id,
                                      diag::DiagnosticSink& sink) = 0;
  /*** Print: Write the textual form of program to path. */
  virtual bool Print(const VcProgram& program, const std::string& path, std::string& err) = 0;
  /*** Parse: Read a program previously written by Print; nullptr on failure. */
  virtual std::unique_ptr<VcProgram> Parse(const std::string& path, diag::DiagnosticSink& sink) = 0;
};

class CodeGenerator {
 public:
  virtual ~CodeGenerator() = default;
  virtual bool HasMain(const Program& program) = 0;
  /*** Compile: Emit target source to out; failures are reported to program.Reporter(). */
  virtual void Compile(Program& program, std::ostream& out) = 0;
};

/***
 * Name: proofc::toolchain::Toolchain
 * Purpose: Bundle of collaborators supplied by one plugin.
 * Theory of Operation: Generator() returns nullptr for targets the toolchain lacks.
 */
class Toolchain {
 public:
  virtual ~Toolchain() = default;
  virtual Frontend& GetFrontend() = 0;
  virtual Translator& GetTranslator() = 0;
  virtual ProofEngine& GetProofEngine() = 0;
  virtual CodeGenerator* Generator(codegen::Target target) = 0;
};

}  // namespace toolchain
}  // namespace proofc

// Utility: scripted toolchain collaborators and a pipeline harness for tests
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include "proofc/backend/native_toolchain.h"
#include "proofc/codegen/target.h"
#include "proofc/diag/diagnostic.h"
#include "proofc/diag/printer.h"
#include "proofc/diag/realigning_sink.h"
#include "proofc/pipeline/config.h"
#include "proofc/pipeline/context.h"
#include "proofc/pipeline/outcome.h"
#include "proofc/pipeline/source.h"
#include "proofc/toolchain/toolchain.h"

namespace testutil {

using proofc::diag::Diagnostic;
using proofc::diag::DiagnosticSink;
using proofc::diag::Severity;
using proofc::pipeline::PipelineOutcome;
using proofc::pipeline::PipelineStatistics;

inline PipelineStatistics Stats(std::uint64_t verified, std::uint64_t errors) {
  PipelineStatistics stats;
  stats.verified = verified;
  stats.errors = errors;
  return stats;
}

class RecordingSink : public DiagnosticSink {
 public:
  void Report(const Diagnostic& diag) override { diags.push_back(diag); }
  std::size_t Count(Severity severity) const override {
    std::size_t n = 0;
    for (const auto& d : diags) {
      if (d.severity == severity) ++n;
    }
    return n;
  }
  std::vector<Diagnostic> diags;
};

// Ordered record of every collaborator call ("Resolve:A", "Build:/tmp/x.out", ...).
struct CallLog {
  std::vector<std::string> calls;
  void Add(const std::string& call) { calls.push_back(call); }
  std::size_t Count(const std::string& call) const {
    std::size_t n = 0;
    for (const auto& c : calls) {
      if (c == call) ++n;
    }
    return n;
  }
  std::size_t CountPrefix(const std::string& prefix) const {
    std::size_t n = 0;
    for (const auto& c : calls) {
      if (c.starts_with(prefix)) ++n;
    }
    return n;
  }
  // Position of the first matching call, or -1.
  int IndexOf(const std::string& call) const {
    for (std::size_t i = 0; i < calls.size(); ++i) {
      if (calls[i] == call) return static_cast<int>(i);
    }
    return -1;
  }
};

class FakeProgram : public proofc::toolchain::Program {
 public:
  FakeProgram(std::string name, DiagnosticSink& reporter) : name_(std::move(name)), reporter_(reporter) {}
  DiagnosticSink& Reporter() override { return reporter_; }
  const std::string& Name() const { return name_; }

 private:
  std::string name_;
  DiagnosticSink& reporter_;
};

// What the proof engine does with one unit.
struct UnitScript {
  std::string name;
  PipelineOutcome check{PipelineOutcome::ResolvedAndTypeChecked};
  PipelineOutcome verify{PipelineOutcome::VerificationCompleted};
  PipelineStatistics stats;
  std::optional<Diagnostic> diagnostic;  // reported while solving
};

inline UnitScript Unit(const std::string& name, std::uint64_t verified, std::uint64_t errors) {
  UnitScript script;
  script.name = name;
  script.stats = Stats(verified, errors);
  return script;
}

class FakeVcProgram : public proofc::toolchain::VcProgram {
 public:
  explicit FakeVcProgram(UnitScript s, bool from_disk = false) : script(std::move(s)), reparsed(from_disk) {}
  UnitScript script;
  bool reparsed;
};

class FakeFrontend : public proofc::toolchain::Frontend {
 public:
  explicit FakeFrontend(CallLog& log) : log_(log) {}

  proofc::toolchain::ParseCheckResult ParseCheck(const std::vector<proofc::pipeline::SourceDescriptor>& files,
                                                 const std::string& program_name,
                                                 DiagnosticSink& reporter) override {
    log_.Add("ParseCheck:" + program_name);
    std::vector<std::string> paths;
    for (const auto& f : files) paths.push_back(f.path);
    parsed.push_back(paths);
    proofc::toolchain::ParseCheckResult result;
    const auto it = errors_by_program.find(program_name);
    if (it != errors_by_program.end()) {
      result.error = it->second;
      return result;
    }
    if (error) {
      result.error = error;
      return result;
    }
    if (no_program) return result;
    result.program = std::make_unique<FakeProgram>(program_name, reporter);
    return result;
  }
  void PrintStats(const proofc::toolchain::Program&, std::ostream& out) override {
    log_.Add("PrintStats");
    out << "program statistics\n";
  }
  void PrintFunctionCallGraph(const proofc::toolchain::Program&, std::ostream& out) override {
    log_.Add("PrintFunctionCallGraph");
    out << "call graph\n";
  }

  std::optional<std::string> error;
  std::map<std::string, std::string> errors_by_program;
  bool no_program{false};
  std::vector<std::vector<std::string>> parsed;

 private:
  CallLog& log_;
};

class FakeTranslator : public proofc::toolchain::Translator {
 public:
  explicit FakeTranslator(CallLog& log) : log_(log) {}

  std::size_t CountVerifiableModules(const proofc::toolchain::Program& program) override {
    return UnitsFor(program).size();
  }
  std::vector<proofc::toolchain::VcUnit> Translate(proofc::toolchain::Program& program) override {
    log_.Add("Translate");
    std::vector<proofc::toolchain::VcUnit> out;
    for (const auto& script : UnitsFor(program)) {
      out.push_back(proofc::toolchain::VcUnit{script.name, std::make_unique<FakeVcProgram>(script)});
    }
    return out;
  }

  std::vector<UnitScript> units;
  std::map<std::string, std::vector<UnitScript>> units_by_program;

 private:
  const std::vector<UnitScript>& UnitsFor(const proofc::toolchain::Program& program) const {
    const auto& fake = dynamic_cast<const FakeProgram&>(program);
    const auto it = units_by_program.find(fake.Name());
    return it != units_by_program.end() ? it->second : units;
  }
  CallLog& log_;
};

class FakeProofEngine : public proofc::toolchain::ProofEngine {
 public:
  explicit FakeProofEngine(CallLog& log) : log_(log) {}

  PipelineOutcome ResolveAndTypecheck(proofc::toolchain::VcProgram& program, const std::string& file_name,
                                      DiagnosticSink&) override {
    auto& vc = AsFake(program);
    log_.Add((vc.reparsed ? "ResolveReparsed:" : "Resolve:") + vc.script.name);
    resolve_files.push_back(file_name);
    return vc.script.check;
  }
  void EliminateDeadVariables(proofc::toolchain::VcProgram& p) override {
    log_.Add("EliminateDeadVariables:" + AsFake(p).script.name);
  }
  void CollectModSets(proofc::toolchain::VcProgram& p) override { log_.Add("CollectModSets:" + AsFake(p).script.name); }
  void CoalesceBlocks(proofc::toolchain::VcProgram& p) override { log_.Add("CoalesceBlocks:" + AsFake(p).script.name); }
  void Inline(proofc::toolchain::VcProgram& p) override { log_.Add("Inline:" + AsFake(p).script.name); }

  proofc::toolchain::VerifyResult InferAndVerify(proofc::toolchain::VcProgram& p,
                                                 const std::optional<std::string>& program_id,
                                                 DiagnosticSink& sink) override {
    auto& vc = AsFake(p);
    log_.Add("InferAndVerify:" + vc.script.name);
    program_ids.push_back(program_id);
    if (vc.script.diagnostic) sink.Report(*vc.script.diagnostic);
    return proofc::toolchain::VerifyResult{vc.script.verify, vc.script.stats};
  }

  bool Print(const proofc::toolchain::VcProgram& p, const std::string& path, std::string& err) override {
    const auto& vc = dynamic_cast<const FakeVcProgram&>(p);
    log_.Add("Print:" + vc.script.name);
    printed_paths.push_back(path);
    if (fail_print) {
      err = "cannot write " + path;
      return false;
    }
    std::ofstream out(path);
    if (!out) {
      err = "cannot open " + path;
      return false;
    }
    out << vc.script.name << '\n';
    return true;
  }

  std::unique_ptr<proofc::toolchain::VcProgram> Parse(const std::string& path, DiagnosticSink&) override {
    log_.Add("Parse");
    std::ifstream in(path);
    std::string name;
    if (!in || !std::getline(in, name)) return nullptr;
    UnitScript script;
    script.name = name;
    script.check = PipelineOutcome::ResolutionError;
    return std::make_unique<FakeVcProgram>(script, true);
  }

  bool fail_print{false};
  std::vector<std::string> resolve_files;
  std::vector<std::string> printed_paths;
  std::vector<std::optional<std::string>> program_ids;

 private:
  static FakeVcProgram& AsFake(proofc::toolchain::VcProgram& p) { return dynamic_cast<FakeVcProgram&>(p); }
  CallLog& log_;
};

class FakeCodeGenerator : public proofc::toolchain::CodeGenerator {
 public:
  FakeCodeGenerator(CallLog& log, std::string label) : log_(log), label_(std::move(label)) {}

  bool HasMain(const proofc::toolchain::Program&) override { return has_main; }
  void Compile(proofc::toolchain::Program& program, std::ostream& out) override {
    log_.Add("Compile:" + label_);
    out << text;
    for (int i = 0; i < new_errors; ++i) {
      program.Reporter().Report(Diagnostic{Severity::Error, {}, "unsupported construct", "Compiler"});
    }
  }

  bool has_main{true};
  std::string text{"int main() { return 0; }\n"};
  int new_errors{0};

 private:
  CallLog& log_;
  std::string label_;
};

class FakeToolchain : public proofc::toolchain::Toolchain {
 public:
  proofc::toolchain::Frontend& GetFrontend() override { return frontend; }
  proofc::toolchain::Translator& GetTranslator() override { return translator; }
  proofc::toolchain::ProofEngine& GetProofEngine() override { return engine; }
  proofc::toolchain::CodeGenerator* Generator(proofc::codegen::Target target) override {
    if (target == proofc::codegen::Target::JavaScript) return js_enabled ? &js : nullptr;
    return &cpp;
  }

  CallLog log;
  FakeFrontend frontend{log};
  FakeTranslator translator{log};
  FakeProofEngine engine{log};
  FakeCodeGenerator cpp{log, "cpp"};
  FakeCodeGenerator js{log, "js"};
  bool js_enabled{true};
};

class FakeNativeToolchain : public proofc::backend::NativeToolchain {
 public:
  explicit FakeNativeToolchain(CallLog& log) : log_(log) {}

  proofc::backend::BuildResult Build(const proofc::backend::BuildRequest& request) override {
    log_.Add("Build");
    requests.push_back(request);
    proofc::backend::BuildResult result;
    result.ok = build_ok;
    if (!build_ok) result.errors = errors;
    if (build_ok) result.warnings = warnings;
    return result;
  }
  proofc::backend::RunResult Run(const std::string& artifact) override {
    log_.Add("Run");
    runs.push_back(artifact);
    return run_result;
  }

  bool build_ok{true};
  std::vector<std::string> errors{"undefined reference to 'missing'"};
  std::vector<std::string> warnings;
  proofc::backend::RunResult run_result;
  std::vector<proofc::backend::BuildRequest> requests;
  std::vector<std::string> runs;

 private:
  CallLog& log_;
};

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
 public:
  ScratchDir() {
    static std::atomic<int> counter{0};
    root_ = std::filesystem::temp_directory_path() /
            ("proofc_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  std::string Root() const { return root_.string(); }
  std::string Path(const std::string& name) const { return (root_ / name).string(); }
  std::string Write(const std::string& name, const std::string& content = "") const {
    const std::string path = Path(name);
    std::ofstream out(path);
    out << content;
    return path;
  }
  bool Exists(const std::string& name) const { return std::filesystem::exists(root_ / name); }
  std::string Read(const std::string& path) const {
    std::ifstream in(path);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
  }

 private:
  std::filesystem::path root_;
};

// Everything a pipeline call needs, wired to the fakes above.
struct Harness {
  Harness() { config.dump_dir = scratch.Root(); }

  proofc::pipeline::PipelineContext Context() {
    return proofc::pipeline::PipelineContext{config, toolchain, native, printer, reporter, engine_sink};
  }
  proofc::pipeline::SourceDescriptor ProgramFile(const std::string& name) {
    return proofc::pipeline::SourceDescriptor{scratch.Write(name, "// " + name + "\n"),
                                              proofc::pipeline::SourceKind::Program};
  }

  ScratchDir scratch;
  proofc::pipeline::Config config;
  FakeToolchain toolchain;
  FakeNativeToolchain native{toolchain.log};
  std::ostringstream out;
  std::ostringstream err;
  proofc::diag::Printer printer{out, err};
  RecordingSink reporter;
  proofc::diag::RealigningSink engine_sink{reporter};
};

}  // namespace testutil

/***
 * Name: proofc::pipeline::PipelineContext
 * Purpose: Everything one pipeline run needs besides its inputs.
 * Inputs: Config, toolchain collaborators, native toolchain, printer, sinks
 * Outputs: N/A (reference bundle)
 * Theory of Operation: Built once by the driver and passed by const reference into
 *   every recursion level; it owns nothing.
 */
#pragma once

#include "proofc/backend/native_toolchain.h"
#include "proofc/diag/diagnostic.h"
#include "proofc/diag/printer.h"
#include "proofc/pipeline/config.h"
#include "proofc/toolchain/toolchain.h"

namespace proofc {
namespace pipeline {

struct PipelineContext {
  const Config& config;
  toolchain::Toolchain& toolchain;
  backend::NativeToolchain& native;
  diag::Printer& printer;
  // Source-level sink handed to the front end.
  diag::DiagnosticSink& reporter;
  // Sink handed to the proof engine (realigns engine coordinates onto reporter).
  diag::DiagnosticSink& engine_sink;
};

}  // namespace pipeline
}  // namespace proofc

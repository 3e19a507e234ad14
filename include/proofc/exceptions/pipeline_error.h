/***
 * Name: proofc::exceptions::PipelineError
 * Purpose: Exception for inconsistent collaborator output seen by the pipeline.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from ProofcException.
 */
#pragma once

#include "proofc/exceptions/proofc_exception.h"

namespace proofc {
namespace exceptions {

class PipelineError : public ProofcException {
 public:
  using ProofcException::ProofcException;
};

}  // namespace exceptions
}  // namespace proofc

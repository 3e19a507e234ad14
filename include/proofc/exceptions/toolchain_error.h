/***
 * Name: proofc::exceptions::ToolchainError
 * Purpose: Exception for toolchain plugin load and binding failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from ProofcException.
 */
#pragma once

#include "proofc/exceptions/proofc_exception.h"

namespace proofc {
namespace exceptions {

class ToolchainError : public ProofcException {
 public:
  using ProofcException::ProofcException;
};

}  // namespace exceptions
}  // namespace proofc

/***
 * Name: proofc::exceptions::BackendError
 * Purpose: Exception for native toolchain failures that are not build results.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from ProofcException.
 */
#pragma once

#include "proofc/exceptions/proofc_exception.h"

namespace proofc {
namespace exceptions {

class BackendError : public ProofcException {
 public:
  using ProofcException::ProofcException;
};

}  // namespace exceptions
}  // namespace proofc

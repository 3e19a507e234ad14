/***
 * Name: proofc::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from ProofcException.
 */
#pragma once

#include "proofc/exceptions/proofc_exception.h"

namespace proofc {
namespace exceptions {

class ConfigError : public ProofcException {
 public:
  using ProofcException::ProofcException;
};

}  // namespace exceptions
}  // namespace proofc

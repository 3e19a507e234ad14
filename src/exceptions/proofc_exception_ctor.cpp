/***
 * Name: proofc::exceptions::ProofcException::ProofcException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "proofc/exceptions/proofc_exception.h"

#include <utility>

namespace proofc {
namespace exceptions {

ProofcException::ProofcException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace proofc

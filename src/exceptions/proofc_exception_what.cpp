/***
 * Name: proofc::exceptions::ProofcException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "proofc/exceptions/proofc_exception.h"

namespace proofc::exceptions {

const char* ProofcException::what() const noexcept { return message_.c_str(); }

}  // namespace proofc::exceptions

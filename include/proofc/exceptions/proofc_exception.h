/***
 * Name: proofc::exceptions::ProofcException
 * Purpose: Base class for all proofc exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in proofc must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace proofc {
namespace exceptions {

class ProofcException : public std::exception {
 public:
  explicit ProofcException(std::string msg) noexcept;
  virtual ~ProofcException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  std::string message_;
};

}  // namespace exceptions
}  // namespace proofc

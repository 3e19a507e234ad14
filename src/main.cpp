/***
 * Name: proofc::main
 * Purpose: Entry point for the proofc command line.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: Exit status code (see pipeline::ExitStatus).
 * Theory of Operation: Delegates to driver::Main with the process streams.
 */
#include <iostream>

#include "proofc/driver/app.h"

int main(int argc, char** argv) {
  return proofc::driver::Main(argc, const_cast<const char* const*>(argv), std::cout, std::cerr);  // NOLINT
}

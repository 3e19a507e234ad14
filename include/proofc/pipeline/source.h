/***
 * Name: proofc::pipeline::SourceDescriptor
 * Purpose: One resolved input reference: proof program, native source or native library.
 */
#pragma once

#include <string>
#include <vector>

namespace proofc {
namespace pipeline {

enum class SourceKind { Program, NativeSource, NativeLibrary };

struct SourceDescriptor {
  std::string path;
  SourceKind kind{SourceKind::Program};
};

/*** Paths: The path of every descriptor, in order. */
std::vector<std::string> Paths(const std::vector<SourceDescriptor>& files);

}  // namespace pipeline
}  // namespace proofc

/***
 * Name: proofc::support (fs)
 * Purpose: File IO and path helpers shared by the pipeline and the driver.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk; derived path strings
 * Theory of Operation: Thin wrappers over fstream and std::filesystem to centralize
 *   error handling and the path conventions used for artifacts.
 */
#pragma once

#include <string>

namespace proofc {
namespace support {

/*** WriteFile: Write entire string to path. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

/*** ChangeExtension: Replace (or append) the extension of path; empty ext strips it. */
std::string ChangeExtension(const std::string& path, const std::string& ext);

/*** FileName: Final path component of path. */
std::string FileName(const std::string& path);

/*** LowerExtension: Extension of path including the dot, lower-cased ("" if none). */
std::string LowerExtension(const std::string& path);

/*** TempDir: override when non-empty, otherwise the system temporary directory. */
std::string TempDir(const std::string& override_dir);

}  // namespace support
}  // namespace proofc

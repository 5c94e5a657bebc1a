#pragma once

#include <string>

// Writes `bytes` to a sibling temporary file and renames it over `path`, so
// readers see either the old file or the complete new one. On failure the
// temporary is removed and DestinationWriteError is thrown.
void write_file_atomic(const std::string& path, const std::string& bytes);

#pragma once

#include <string>
#include <boost/filesystem.hpp>

// Writes `<dir>/.<name>.tmp` and renames it over `path`, so readers only ever see a complete
// file. Throws std::runtime_error on failure; the previous file at `path` is left intact.
void write_file_atomically(const boost::filesystem::path& path, const std::string& contents);

// Whole file contents, or an empty string when the file does not exist.
std::string read_file(const boost::filesystem::path& path);

void ensure_directory(const boost::filesystem::path& dir);

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace relaycp {

// Caps checked before and while extracting a received archive.
struct ZipLimits {
    uint64_t max_uncompressed = 10ull * 1024 * 1024 * 1024;
    uint64_t max_ratio = 100; // uncompressed bytes per archive byte
};

// Writes dir into a new zip as <dirname>/..., the root entry first so an
// empty folder survives. Symbolic links and special files are skipped.
// Throws std::runtime_error on any I/O or archive error.
void zip_directory(const std::string& dir, const std::string& zip_path);

// Writes each path (file or directory) as <root>/<basename>/... into a new
// zip. Two paths with the same basename are an error.
void zip_paths(const std::vector<std::string>& paths, const std::string& root, const std::string& zip_path);

// Extracts into target_dir and returns the regular files written. With
// strip_root the first path component of every entry is dropped. Existing
// files are replaced only with overwrite. Entries that are absolute, escape
// target_dir or break the limits throw std::runtime_error; links and
// special files are not extracted.
std::vector<std::string> extract_zip(const std::string& zip_path,
                                     const std::string& target_dir,
                                     bool strip_root,
                                     bool overwrite,
                                     const ZipLimits& limits = ZipLimits{});

// target_dir/entry after normalization; throws when it would land outside
// target_dir.
std::string safe_extract_path(const std::string& target_dir, const std::string& entry);

// Regular files below dir, recursively.
size_t count_files(const std::string& dir);

} // namespace relaycp

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace dxsync {

bool file_exists(const std::string& path);
bool dir_exists(const std::string& path);

// Create dir and any missing parents (mode 0755).
bool make_dirs(const std::string& path, std::string& error_msg);

// Whole-file reads. Return false and set error_msg on failure.
bool read_file(const std::string& path, std::vector<uint8_t>& data,
               std::string& error_msg);
bool read_file_string(const std::string& path, std::string& text,
                      std::string& error_msg);

// Write to "<path>.tmp.<pid>" then rename over path, so readers never
// observe a partially written file.
bool write_file(const std::string& path, const uint8_t* data, size_t size,
                std::string& error_msg);
inline bool write_file(const std::string& path, const std::vector<uint8_t>& data,
                       std::string& error_msg) {
    return write_file(path, data.data(), data.size(), error_msg);
}
bool write_file_string(const std::string& path, const std::string& text,
                       std::string& error_msg);

// Modification time in nanoseconds since the epoch, 0 if missing.
int64_t file_mtime_ns(const std::string& path);

std::string join_path(const std::string& dir, const std::string& name);

// Remove a file or a directory tree. Missing paths are ignored.
void remove_recursive(const std::string& path);

} // namespace dxsync

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace peerwire {

// File existence and size
bool file_exists(const std::string& path);
int64_t get_file_size(const std::string& path);

// Whole-file text access, used for JSON documents
bool read_file_text(const std::string& path, std::string& out);
bool write_file_text(const std::string& path, const std::string& content);

// Whole-file binary access
bool read_file_binary(const std::string& path, std::vector<uint8_t>& out);

// Positioned access into an existing file
bool read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size);
bool write_file_chunk(const std::string& path, uint64_t offset, const void* data, size_t size);

// Create (or truncate) a file and extend it to size bytes
bool create_file_with_size(const std::string& path, uint64_t size);

bool delete_file(const std::string& path);

} // namespace peerwire

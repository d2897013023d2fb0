#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop {

// Existence checks
bool file_exists(const std::string& path);
bool directory_exists(const std::string& path);
bool is_file(const std::string& path);

// Writing
bool create_file(const std::string& path, const std::string& content);
bool create_file_binary(const std::string& path, const void* data, size_t size);

/**
 * Write a file from a sequence of byte segments, in order.
 * A partially written file is removed on failure.
 */
bool write_file_segments(const std::string& path, const std::vector<std::vector<uint8_t>>& segments);

// Reading
std::optional<std::string> read_file_text(const std::string& path);

/**
 * Read up to size bytes starting at offset.
 * @return Number of bytes read, or -1 if the file cannot be opened or positioned
 */
int64_t read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size);

// Directories
bool create_directories(const std::string& path);  // parents are created as needed

int64_t get_file_size(const std::string& path);     // -1 if missing

// Removes a file or an empty directory
bool delete_file(const std::string& path);

// Path utilities
std::string get_filename_from_path(const std::string& path);
std::string get_file_extension(const std::string& path);   // ".pdf", or "" when there is none
std::string get_file_stem(const std::string& path);        // file name without extension
std::string combine_paths(const std::string& base, const std::string& relative);

} // namespace peerdrop

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace middleman {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Parse a human-readable size ("512", "1KB", "1.5 mb") into bytes, 1024-based.
// Returns nullopt for anything that is not a non-negative size.
std::optional<uint64_t> parse_bytes(const std::string& text);

// Join a base URL and a request path so exactly one '/' separates them.
std::string url_join(const std::string& base, const std::string& path);

} // namespace middleman

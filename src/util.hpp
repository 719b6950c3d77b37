#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace paperscout {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// True if the trimmed text opens like a JSON object or array
bool looks_like_json(const std::string& s);

// Cut text to at most max_bytes without splitting a UTF-8 sequence,
// appending "..." when anything was removed
std::string truncate_display(const std::string& text, size_t max_bytes);

// Format a double with fixed precision (e.g. relevance scores)
std::string format_fixed(double value, int precision);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write file contents via a temp file + rename
bool atomic_write_file(const std::string& path, const std::string& content);

// Monotonic milliseconds since an arbitrary epoch
uint64_t monotonic_ms();

} // namespace paperscout

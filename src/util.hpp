#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace klaus {

// ISO 8601 timestamp (UTC) for the given epoch seconds
std::string timestamp_from_epoch(uint64_t epoch);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Lower-case copy. Folds ASCII and the Latin-1 letters (À-Þ) of UTF-8
// text; other multibyte sequences pass through unchanged.
std::string to_lower(const std::string& s);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// Truncate to at most max_len bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& s, size_t max_len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write a file via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace klaus

#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace memweave {

// ISO 8601 timestamp for the current time
std::string timestamp_now();

// Format epoch seconds as ISO 8601 UTC ("2024-01-02T03:04:05Z")
std::string format_iso8601(uint64_t epoch);

// Parse ISO 8601 UTC back to epoch seconds. Returns 0 on malformed input.
uint64_t parse_iso8601(const std::string& s);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase (multi-byte UTF-8 passes through unchanged)
std::string to_lower(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a half-written file.
// Creates parent directories. Returns false on I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read an entire file. Returns empty string if it cannot be opened.
std::string read_file(const std::string& path);

} // namespace memweave

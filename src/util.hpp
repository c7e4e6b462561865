#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace costgate {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Parse a strictly positive decimal integer. Rejects signs, junk and overflow.
std::optional<uint32_t> parse_positive_uint(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
bool atomic_write_file(const std::string& path, const std::string& content);

// True when COSTGATE_DEBUG is set to a non-empty value.
bool debug_enabled();

} // namespace costgate

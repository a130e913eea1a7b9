#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace trelay {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split into lines on \n, dropping a trailing \r from each line
std::vector<std::string> split_lines(const std::string& s);

// Replace ill-formed UTF-8 with U+FFFD, one per maximal invalid subpart
std::string sanitize_utf8(const std::string& s);

// Decimal digits only, within uint32_t range
std::optional<uint32_t> parse_uint32(const std::string& s);

// Random RFC 4122 version 4 UUID, lowercase hex
std::string generate_uuid();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace trelay

#pragma once
#include <string>
#include <optional>
#include <cstddef>

namespace trelay {

constexpr size_t kHeaderReadBytes = 8 * 1024;

// Session id from the leading {"type":"session","id":...} record of a
// JSONL transcript. Only the first max_bytes are read.
//
// Returns nullopt when the file can't be opened or is empty, when no
// session record appears in the prefix, or when a non-blank line fails to
// parse (the scan stops there). These are normal races with the writer,
// not errors; nothing is thrown. Ill-formed UTF-8 and unpaired surrogate
// escapes are replaced with U+FFFD before parsing, so they never stop the scan.
std::optional<std::string> read_session_id_from_transcript(
    const std::string& path, size_t max_bytes = kHeaderReadBytes);

// Same scan over an in-memory prefix.
std::optional<std::string> parse_session_header(const std::string& prefix);

} // namespace trelay

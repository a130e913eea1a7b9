#include "transcript_header.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <vector>

namespace trelay {

static int parse_hex4(const std::string& s, size_t pos) {
    if (pos + 4 > s.size()) return -1;
    int value = 0;
    for (size_t k = 0; k < 4; k++) {
        char c = s[pos + k];
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return -1;
        value = value * 16 + digit;
    }
    return value;
}

// nlohmann/json rejects \u escapes that encode an unpaired surrogate.
// Rewrite those as \uFFFD; paired surrogates and other escapes pass through.
static std::string replace_lone_surrogates(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        if (line[i] != '\\' || i + 1 >= line.size()) {
            out += line[i++];
            continue;
        }
        int unit = line[i + 1] == 'u' ? parse_hex4(line, i + 2) : -1;
        if (unit < 0xD800 || unit > 0xDFFF) {
            // Not a surrogate: copy the whole escape so "\\u" is not misread.
            size_t len = unit < 0 ? 2 : 6;
            out.append(line, i, len);
            i += len;
            continue;
        }
        if (unit <= 0xDBFF && i + 7 < line.size() &&
            line[i + 6] == '\\' && line[i + 7] == 'u') {
            int low = parse_hex4(line, i + 8);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                out.append(line, i, 12);
                i += 12;
                continue;
            }
        }
        out += "\\uFFFD";
        i += 6;
    }
    return out;
}

std::optional<std::string> parse_session_header(const std::string& prefix) {
    for (const auto& raw : split_lines(sanitize_utf8(prefix))) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        nlohmann::json record =
            nlohmann::json::parse(replace_lone_surrogates(line), nullptr, false);
        if (record.is_discarded()) return std::nullopt;

        if (!record.is_object()) continue;
        auto type = record.find("type");
        if (type == record.end() || !type->is_string() ||
            type->get<std::string>() != "session") {
            continue;
        }

        auto id = record.find("id");
        if (id == record.end() || !id->is_string()) continue;
        std::string session_id = trim(id->get<std::string>());
        if (!session_id.empty()) return session_id;
    }
    return std::nullopt;
}

std::optional<std::string> read_session_id_from_transcript(const std::string& path,
                                                           size_t max_bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;

    std::vector<char> buffer(max_bytes);
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize bytes_read = file.gcount();
    if (bytes_read <= 0) return std::nullopt;

    return parse_session_header(
        std::string(buffer.data(), static_cast<size_t>(bytes_read)));
}

} // namespace trelay

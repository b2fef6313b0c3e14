#pragma once
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>
#include "Logger.hpp"

// Flat-body field extraction for the small JSON messages the web client POSTs.
// Not a general parser: first match of "key" wins, no nesting/escapes.
namespace JSON {

// returns position right after the ':' following key (spaces skipped), npos if missing
inline std::size_t find_json_value(const std::string& body, const char* key) {
    const std::string quoted = std::string("\"") + key + "\"";
    auto p = body.find(quoted);
    if (p == std::string::npos) return std::string::npos;
    p = body.find(':', p + quoted.size());
    if (p == std::string::npos) return std::string::npos;
    ++p;
    while (p < body.size() && body[p] == ' ') ++p;
    return p;
}

inline bool extract_json_string(const std::string& body, const char* key, std::string& out) {
    auto p = find_json_value(body, key);
    if (p == std::string::npos || p >= body.size() || body[p] != '"') return false;
    auto q = body.find('"', p + 1);
    if (q == std::string::npos) return false;
    out = body.substr(p + 1, q - (p + 1));
    return true;
}

// whole number that fits an int, followed by a JSON delimiter; out-of-range values are rejected
inline bool extract_json_int(const std::string& body, const char* key, int& out) {
    auto p = find_json_value(body, key);
    if (p == std::string::npos || p >= body.size()) return false;

    const char* first = body.data() + p;
    const char* last = body.data() + body.size();
    int val = 0;
    auto [ptr, ec] = std::from_chars(first, last, val);
    if (ec != std::errc()) return false; // invalid_argument or result_out_of_range
    if (ptr != last && *ptr != ',' && *ptr != '}' && *ptr != ']' && !std::isspace((unsigned char)*ptr)) {
        return false; // "3.5", "12abc"
    }
    out = val;
    return true;
}

inline bool extract_json_float(const std::string& body, const char* key, float& out) {
    auto p = find_json_value(body, key);
    if (p == std::string::npos || p >= body.size()) return false;
    const char* begin = body.c_str() + p;
    char* end = nullptr;
    float val = std::strtof(begin, &end);
    if (end == begin) return false;
    out = val;
    return true;
}

inline bool extract_json_bool(const std::string& body, const char* key, bool& out) {
    auto p = find_json_value(body, key);
    if (p == std::string::npos) return false;
    if (body.compare(p, 4, "true") == 0) { out = true; return true; }
    if (body.compare(p, 5, "false") == 0) { out = false; return true; }
    return false;
}

inline void json_extract_fail(const char* context, const char* field)
{
    LOG_WARN("[JSON] extract failed | context="
             << context << " field=" << field);
}

}

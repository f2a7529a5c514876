#pragma once

#include <string>
#include <vector>

// Case folding and trimming are ASCII-only so they agree byte for byte with
// the canonical-name expression used in Postgres.
namespace util {
    bool is_ascii_space(char c);
    char ascii_lower(char c);
    char ascii_upper(char c);
    std::string trim(const std::string& str);
    std::string to_lower(const std::string& str);
    std::vector<std::string> split_whitespace(const std::string& str);
    std::string redact_dsn(const std::string& dsn);
}

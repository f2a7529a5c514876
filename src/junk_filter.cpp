#include "junk_filter.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace {

const std::unordered_set<std::string>& placeholder_tokens() {
    static const std::unordered_set<std::string> tokens = {
        "???",
        "---",
        "n/a",
        "na",
        "unknown",
        "none",
        "null",
        "tbd",
        "remove this ability",
    };
    return tokens;
}

} // namespace

bool JunkFilter::is_junk(const std::string& name) {
    std::string trimmed = util::trim(name);
    if (trimmed.empty()) {
        return true;
    }
    
    bool punctuation_only = std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) {
        return std::ispunct(c) || std::isspace(c);
    });
    if (punctuation_only) {
        return true;
    }
    
    return placeholder_tokens().count(util::to_lower(trimmed)) > 0;
}

#pragma once

#include <string>

class JunkFilter {
public:
    // True for empty, punctuation-only and placeholder names ("???", "N/A", ...).
    static bool is_junk(const std::string& name);
};

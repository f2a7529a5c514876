#pragma once

#include <string>

// Name cleanup shared by startup cleaning and creation.
// canonical_form is only ever used for matching; display_form is what gets stored.
class Normalizer {
public:
    static std::string correct(const std::string& name);
    static std::string canonical_form(const std::string& name);
    static std::string display_form(const std::string& name);
    
    // display_form(correct(name))
    static std::string clean(const std::string& name);
    // canonical_form(correct(name))
    static std::string key(const std::string& name);
};

#include "normalizer.hpp"
#include "util.hpp"
#include <unordered_map>

namespace {

// Known misspellings in the seed dataset, keyed by canonical form.
const std::unordered_map<std::string, std::string>& corrections() {
    static const std::unordered_map<std::string, std::string> table = {
        // pokemon
        {"pikuchu", "Pikachu"},
        {"pikachuu", "Pikachu"},
        {"charzard", "Charizard"},
        {"bulbasaurrr", "Bulbasaur"},
        {"bulbasuar", "Bulbasaur"},
        {"squirtel", "Squirtle"},
        {"charmanderr", "Charmander"},
        // types
        {"gras", "Grass"},
        {"eletric", "Electric"},
        {"psycic", "Psychic"},
        {"poisen", "Poison"},
        {"poision", "Poison"},
        // abilities, hyphenated the way PokeAPI names them
        {"overgroww", "Overgrow"},
        {"torrentt", "Torrent"},
        {"run away", "Run-away"},
        {"keen eye", "Keen-eye"},
        {"rock head", "Rock-head"},
        // trainers
        {"ashh", "Ash"},
    };
    return table;
}

} // namespace

std::string Normalizer::correct(const std::string& name) {
    const auto& table = corrections();
    auto it = table.find(canonical_form(name));
    if (it == table.end()) {
        return name;
    }
    return it->second;
}

std::string Normalizer::canonical_form(const std::string& name) {
    return util::to_lower(util::trim(name));
}

std::string Normalizer::display_form(const std::string& name) {
    std::string out = util::trim(name);
    bool word_start = true;
    for (auto& ch : out) {
        if (util::is_ascii_space(ch)) {
            word_start = true;
            continue;
        }
        ch = word_start ? util::ascii_upper(ch) : util::ascii_lower(ch);
        word_start = false;
    }
    return out;
}

std::string Normalizer::clean(const std::string& name) {
    return display_form(correct(name));
}

std::string Normalizer::key(const std::string& name) {
    return canonical_form(correct(name));
}

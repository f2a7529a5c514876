#include "random_source.hpp"

namespace {

uint64_t resolve_seed(uint64_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

} // namespace

SeededRandomSource::SeededRandomSource(uint64_t seed) : gen_(resolve_seed(seed)) {}

size_t SeededRandomSource::pick_index(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<size_t> dis(0, count - 1);
    return dis(gen_);
}

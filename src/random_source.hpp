#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

class RandomSource {
public:
    virtual ~RandomSource() = default;
    
    // Uniform index in [0, count). count must be > 0.
    virtual size_t pick_index(size_t count) = 0;
};

class SeededRandomSource : public RandomSource {
public:
    // seed 0 draws one from std::random_device
    explicit SeededRandomSource(uint64_t seed = 0);
    
    size_t pick_index(size_t count) override;
    
private:
    std::mutex mutex_;
    std::mt19937_64 gen_;
};

#pragma once

#include <random>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace herd {

// Every random draw in the simulation goes through one of these
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform real in [0, 1)
    virtual double uniform01() = 0;

    // Uniform integer [min, max]
    virtual int uniformInt(int min, int max) = 0;

    // Index drawn with probability proportional to weights[i]
    virtual size_t weightedIndex(const std::vector<double>& weights) = 0;
};

class Random : public RandomSource {
public:
    // seed == 0 picks a nondeterministic seed
    explicit Random(uint32_t seed = 0) {
        this->seed(seed);
    }

    // Set seed for reproducibility
    void seed(uint32_t s) {
        seed_ = s != 0 ? s : std::random_device{}();
        gen_.seed(seed_);
    }

    uint32_t getSeed() const { return seed_; }

    double uniform01() override {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(gen_);
    }

    int uniformInt(int min, int max) override {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }

    size_t weightedIndex(const std::vector<double>& weights) override {
        std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
        return dist(gen_);
    }

private:
    std::mt19937 gen_;
    uint32_t seed_ = 0;
};

} // namespace herd

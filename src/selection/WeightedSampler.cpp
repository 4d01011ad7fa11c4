#include "selection/WeightedSampler.h"

WeightedSampler::WeightedSampler() : rng(std::random_device{}()) {}

WeightedSampler::WeightedSampler(std::uint64_t seed) : rng(seed) {}

WeightedSampler WeightedSampler::fromOptionalSeed(const std::optional<std::uint64_t>& seed) {
    return seed ? WeightedSampler(*seed) : WeightedSampler();
}

size_t WeightedSampler::drawIndex(size_t poolSize) {
    std::uniform_int_distribution<size_t> dist(0, poolSize - 1);
    return dist(rng);
}

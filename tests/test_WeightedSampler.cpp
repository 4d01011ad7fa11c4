/**
 * WeightedSampler 单元测试：数量与去重、全零权重退化为均匀抽样、
 * 种子可复现、输入校验、权重偏置的统计性质。
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "selection/WeightedSampler.h"

namespace {

std::vector<std::string> makeItems(size_t n) {
    std::vector<std::string> items;
    for (size_t i = 0; i < n; ++i) items.push_back("file_" + std::to_string(i) + ".txt");
    return items;
}

void expectDistinctSubset(const std::vector<std::string>& picked, const std::vector<std::string>& items) {
    std::set<std::string> unique(picked.begin(), picked.end());
    EXPECT_EQ(unique.size(), picked.size());
    for (const auto& p : picked) {
        EXPECT_NE(std::find(items.begin(), items.end(), p), items.end()) << p;
    }
}

}

TEST(WeightedSampler, ReturnsMinOfKAndPoolSize) {
    auto items = makeItems(10);
    std::vector<double> weights = {0.1, 0.9, 0.5, 0.5, 0.3, 0.7, 0.2, 0.8, 0.4, 0.6};
    WeightedSampler sampler(7);
    for (size_t k = 0; k <= 13; ++k) {
        auto picked = sampler.sample(items, weights, k);
        EXPECT_EQ(picked.size(), std::min(k, items.size())) << "k=" << k;
        expectDistinctSubset(picked, items);
    }
}

TEST(WeightedSampler, EmptyPool) {
    WeightedSampler sampler(1);
    auto picked = sampler.sample(std::vector<int>{}, std::vector<double>{}, 5);
    EXPECT_TRUE(picked.empty());
}

TEST(WeightedSampler, AllZeroWeightsFallBackToUniform) {
    auto items = makeItems(8);
    std::vector<double> zeros(items.size(), 0.0);
    WeightedSampler sampler(99);
    for (size_t k : {1u, 4u, 8u, 20u}) {
        auto picked = sampler.sample(items, zeros, k);
        EXPECT_EQ(picked.size(), std::min<size_t>(k, items.size()));
        expectDistinctSubset(picked, items);
    }
}

TEST(WeightedSampler, ZeroWeightItemsWaitUntilPositivesAreGone) {
    std::vector<std::string> items = {"a", "b", "c", "d"};
    std::vector<double> weights = {0.0, 0.0, 1.0, 0.0};
    for (std::uint64_t seed = 0; seed < 50; ++seed) {
        WeightedSampler sampler(seed);
        auto picked = sampler.sample(items, weights, 2);
        ASSERT_EQ(picked.size(), 2u);
        EXPECT_EQ(picked[0], "c");
        EXPECT_NE(picked[1], "c");
    }
}

TEST(WeightedSampler, SameSeedSameSequence) {
    auto items = makeItems(50);
    std::vector<double> weights;
    for (size_t i = 0; i < items.size(); ++i) weights.push_back((i % 7) / 7.0);

    WeightedSampler first(42);
    WeightedSampler second(42);
    EXPECT_EQ(first.sample(items, weights, 25), second.sample(items, weights, 25));

    WeightedSampler third(42);
    WeightedSampler fourth(42);
    EXPECT_EQ(third.sampleUniform(items, 25), fourth.sampleUniform(items, 25));
}

TEST(WeightedSampler, OptionalSeedIsHonoured) {
    auto items = makeItems(30);
    auto a = WeightedSampler::fromOptionalSeed(std::uint64_t{5}).sampleUniform(items, 15);
    auto b = WeightedSampler::fromOptionalSeed(std::uint64_t{5}).sampleUniform(items, 15);
    EXPECT_EQ(a, b);

    auto unseeded = WeightedSampler::fromOptionalSeed(std::nullopt).sampleUniform(items, 15);
    EXPECT_EQ(unseeded.size(), 15u);
    expectDistinctSubset(unseeded, items);
}

TEST(WeightedSampler, MismatchedLengthsThrow) {
    WeightedSampler sampler(3);
    auto items = makeItems(3);
    EXPECT_THROW(sampler.sample(items, std::vector<double>{0.5, 0.5}, 1), std::invalid_argument);
}

TEST(WeightedSampler, NegativeWeightsThrow) {
    WeightedSampler sampler(3);
    auto items = makeItems(2);
    EXPECT_THROW(sampler.sample(items, std::vector<double>{0.5, -0.1}, 1), std::invalid_argument);
}

TEST(WeightedSampler, NonFiniteWeightsThrow) {
    WeightedSampler sampler(3);
    auto items = makeItems(3);
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(sampler.sample(items, std::vector<double>{inf, 0.5, 0.5}, 2), std::invalid_argument);
    EXPECT_THROW(sampler.sample(items, std::vector<double>{0.5, nan, 0.5}, 2), std::invalid_argument);
    // 每个权重都有限，但总和溢出
    EXPECT_THROW(sampler.sample(items, std::vector<double>{1e308, 1e308, 1e308}, 2), std::invalid_argument);
}

TEST(WeightedSampler, UniformSampleIsDistinct) {
    auto items = makeItems(12);
    WeightedSampler sampler(11);
    auto picked = sampler.sampleUniform(items, 6);
    EXPECT_EQ(picked.size(), 6u);
    expectDistinctSubset(picked, items);
    EXPECT_EQ(sampler.sampleUniform(items, 50).size(), items.size());
}

TEST(WeightedSampler, HeavyItemsAreChosenMoreOften) {
    auto items = makeItems(10);
    std::vector<double> weights(items.size(), 0.01);
    weights[0] = 0.99;
    weights[3] = 0.99;

    std::map<std::string, int> hits;
    const int trials = 2000;
    for (int t = 0; t < trials; ++t) {
        WeightedSampler sampler(static_cast<std::uint64_t>(t));
        for (const auto& picked : sampler.sample(items, weights, 5)) {
            ++hits[picked];
        }
    }

    int maxLight = 0;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i == 0 || i == 3) continue;
        maxLight = std::max(maxLight, hits[items[i]]);
    }
    EXPECT_GT(hits[items[0]], trials * 9 / 10);
    EXPECT_GT(hits[items[3]], trials * 9 / 10);
    EXPECT_GT(hits[items[0]], 2 * maxLight);
    EXPECT_GT(hits[items[3]], 2 * maxLight);
}

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief 不放回加权抽样
 *
 * 每次抽取前对剩余池求和，在 [0, sum) 上取均匀随机数，按累积权重线性扫描
 * 选中第一个累积值 >= 随机数的元素，然后把它移出池子。剩余权重全为 0 时
 * 退化为均匀抽取。
 *
 * 随机数流由对象持有；相同种子 + 相同输入顺序得到逐位相同的结果。
 * 非线程安全：同一实例不能被多个线程同时使用。
 */
class WeightedSampler {
public:
    WeightedSampler();
    explicit WeightedSampler(std::uint64_t seed);

    /** 有种子则可复现，否则使用 random_device */
    static WeightedSampler fromOptionalSeed(const std::optional<std::uint64_t>& seed);

    /**
     * @brief 加权抽取 min(k, items.size()) 个互不相同的元素
     * @return 按抽中顺序排列
     * @throws std::invalid_argument items/weights 长度不一致，或存在负数/NaN 权重
     */
    template <typename T>
    std::vector<T> sample(const std::vector<T>& items, const std::vector<double>& weights, size_t k);

    /** 均匀不放回抽样（没有权重配置时使用） */
    template <typename T>
    std::vector<T> sampleUniform(const std::vector<T>& items, size_t k);

private:
    std::mt19937_64 rng;

    size_t drawIndex(size_t poolSize);
};

template <typename T>
std::vector<T> WeightedSampler::sample(const std::vector<T>& items, const std::vector<double>& weights, size_t k) {
    if (items.size() != weights.size()) {
        throw std::invalid_argument("WeightedSampler::sample: " + std::to_string(items.size()) +
                                    " items but " + std::to_string(weights.size()) + " weights");
    }
    double sum = 0.0;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            throw std::invalid_argument("WeightedSampler::sample: weights must be finite non-negative numbers");
        }
        sum += w;
    }
    if (!std::isfinite(sum)) {
        throw std::invalid_argument("WeightedSampler::sample: sum of weights overflows");
    }

    std::vector<size_t> pool(items.size());
    for (size_t i = 0; i < pool.size(); ++i) pool[i] = i;

    std::vector<T> selected;
    selected.reserve(std::min(k, items.size()));

    while (selected.size() < k && !pool.empty()) {
        double total = 0.0;
        for (size_t idx : pool) total += weights[idx];

        size_t pick = 0;
        if (total == 0.0) {
            pick = drawIndex(pool.size());
        } else {
            std::uniform_real_distribution<double> dist(0.0, total);
            double r = dist(rng);
            double cumulative = 0.0;
            // 浮点累加误差导致扫描越过末尾时，pick 停在最后一个正权重元素
            for (size_t i = 0; i < pool.size(); ++i) {
                double w = weights[pool[i]];
                if (w == 0.0) continue;
                cumulative += w;
                pick = i;
                if (cumulative >= r) break;
            }
        }

        selected.push_back(items[pool[pick]]);
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(pick));
    }

    return selected;
}

template <typename T>
std::vector<T> WeightedSampler::sampleUniform(const std::vector<T>& items, size_t k) {
    std::vector<size_t> pool(items.size());
    for (size_t i = 0; i < pool.size(); ++i) pool[i] = i;

    std::vector<T> selected;
    selected.reserve(std::min(k, items.size()));
    while (selected.size() < k && !pool.empty()) {
        size_t pick = drawIndex(pool.size());
        selected.push_back(items[pool[pick]]);
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(pick));
    }
    return selected;
}

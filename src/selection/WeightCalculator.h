#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "selection/Candidate.h"

namespace fs = std::filesystem;

/**
 * @brief 数值区间 [min, max)，max 缺省表示无上界
 */
struct ValueRange {
    double min = 0.0;
    std::optional<double> max;

    bool contains(double x) const {
        return x >= min && (!max || x < *max);
    }
};

/**
 * @brief 解析区间选择器
 *
 * "7-30" -> [7, 30)，"30+" 或 "30-" -> [30, +inf)。
 * 其它形式返回 std::nullopt（永不匹配）。
 */
std::optional<ValueRange> parseRange(const std::string& selector);

/**
 * @brief 权重配置（.balancerc.json 中的 "weights" 对象）
 *
 * 每张子表保持文件中的顺序，区间表按顺序取第一个命中项。
 */
struct WeightConfig {
    using Table = std::vector<std::pair<std::string, double>>;

    Table byExtension;
    Table byAgeDays;
    Table bySizeMb;

    bool empty() const {
        return byExtension.empty() && byAgeDays.empty() && bySizeMb.empty();
    }

    /**
     * @brief 从 "weights" 对象构建
     *
     * 非数值项跳过并告警；超出 [0,1] 的值截断并告警。
     */
    static WeightConfig fromJson(const nlohmann::ordered_json& weights);
};

/**
 * @brief 计算单个候选文件的淘汰权重 ∈ [0,1]
 *
 * 各子表命中值取算术平均；没有任何命中时返回 0.5。
 * 某张子表需要的元数据读取失败时，该子表不参与计算。
 */
class WeightCalculator {
public:
    static constexpr double kNeutralWeight = 0.5;

    explicit WeightCalculator(WeightConfig config,
                              fs::file_time_type referenceTime = fs::file_time_type::clock::now());

    double weight(const Candidate& candidate) const;

    bool isEnabled() const { return !config.empty(); }

    const WeightConfig& getConfig() const { return config; }

private:
    struct RangeRule {
        std::string selector;
        std::optional<ValueRange> range;
        double weight;
    };

    WeightConfig config;
    fs::file_time_type referenceTime;
    std::vector<RangeRule> ageRules;
    std::vector<RangeRule> sizeRules;

    static std::vector<RangeRule> compileRules(const WeightConfig::Table& table);
    static std::optional<double> firstMatch(const std::vector<RangeRule>& rules, double value);
};

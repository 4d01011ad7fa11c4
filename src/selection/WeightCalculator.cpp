#include "selection/WeightCalculator.h"
#include "utils/Logger.h"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace {

constexpr double kSecondsPerDay = 86400.0;
constexpr double kBytesPerMb = 1048576.0;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::optional<double> parseNumber(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || std::isnan(value)) return std::nullopt;
    return value;
}

WeightConfig::Table readTable(const nlohmann::ordered_json& weights, const char* key) {
    WeightConfig::Table table;
    if (!weights.contains(key)) return table;

    const auto& section = weights.at(key);
    if (!section.is_object()) {
        Logger::getInstance().warn(std::string("weights.") + key + " is not an object, ignored");
        return table;
    }

    for (const auto& [selector, value] : section.items()) {
        if (!value.is_number()) {
            Logger::getInstance().warn(std::string("weights.") + key + "[\"" + selector + "\"] is not a number, ignored");
            continue;
        }
        double w = value.get<double>();
        if (std::isnan(w)) continue;
        if (w < 0.0 || w > 1.0) {
            double clamped = w < 0.0 ? 0.0 : 1.0;
            std::ostringstream oss;
            oss << "weights." << key << "[\"" << selector << "\"] = " << w
                << " is outside [0,1], clamped to " << clamped;
            Logger::getInstance().warn(oss.str());
            w = clamped;
        }
        table.emplace_back(selector, w);
    }
    return table;
}

}

std::optional<ValueRange> parseRange(const std::string& selector) {
    std::string s = trim(selector);
    if (s.empty()) return std::nullopt;

    // "30+" / "30-"：开区间上界
    if (s.back() == '+' || s.back() == '-') {
        auto min = parseNumber(s.substr(0, s.size() - 1));
        if (!min) return std::nullopt;
        return ValueRange{*min, std::nullopt};
    }

    size_t dash = s.find('-');
    if (dash == std::string::npos || s.find('-', dash + 1) != std::string::npos) {
        return std::nullopt;
    }

    auto min = parseNumber(s.substr(0, dash));
    auto max = parseNumber(s.substr(dash + 1));
    if (!min || !max) return std::nullopt;
    return ValueRange{*min, *max};
}

WeightConfig WeightConfig::fromJson(const nlohmann::ordered_json& weights) {
    WeightConfig cfg;
    if (weights.is_null()) return cfg;
    if (!weights.is_object()) {
        Logger::getInstance().warn("\"weights\" is not an object, weighted selection disabled");
        return cfg;
    }
    cfg.byExtension = readTable(weights, "by_extension");
    cfg.byAgeDays = readTable(weights, "by_age_days");
    cfg.bySizeMb = readTable(weights, "by_size_mb");
    return cfg;
}

WeightCalculator::WeightCalculator(WeightConfig config, fs::file_time_type referenceTime)
    : config(std::move(config)), referenceTime(referenceTime) {
    ageRules = compileRules(this->config.byAgeDays);
    sizeRules = compileRules(this->config.bySizeMb);
}

std::vector<WeightCalculator::RangeRule> WeightCalculator::compileRules(const WeightConfig::Table& table) {
    std::vector<RangeRule> rules;
    rules.reserve(table.size());
    for (const auto& [selector, w] : table) {
        auto range = parseRange(selector);
        if (!range) {
            Logger::getInstance().debug("Range selector \"" + selector + "\" is malformed and will never match");
        }
        rules.push_back({selector, range, w});
    }
    return rules;
}

std::optional<double> WeightCalculator::firstMatch(const std::vector<RangeRule>& rules, double value) {
    for (const auto& rule : rules) {
        if (rule.range && rule.range->contains(value)) return rule.weight;
    }
    return std::nullopt;
}

double WeightCalculator::weight(const Candidate& candidate) const {
    if (config.empty()) return kNeutralWeight;

    std::vector<double> contributions;

    if (!config.byExtension.empty()) {
        const std::string ext = candidate.getExtension();
        for (const auto& [selector, w] : config.byExtension) {
            if (selector == ext) {
                contributions.push_back(w);
                break;
            }
        }
    }

    if (!ageRules.empty()) {
        if (auto mtime = candidate.getLastModified()) {
            using Seconds = std::chrono::duration<double>;
            double ageDays = std::chrono::duration_cast<Seconds>(referenceTime - *mtime).count() / kSecondsPerDay;
            if (auto w = firstMatch(ageRules, ageDays)) contributions.push_back(*w);
        }
    }

    if (!sizeRules.empty()) {
        if (auto size = candidate.getSizeBytes()) {
            double sizeMb = static_cast<double>(*size) / kBytesPerMb;
            if (auto w = firstMatch(sizeRules, sizeMb)) contributions.push_back(*w);
        }
    }

    if (contributions.empty()) return kNeutralWeight;

    double sum = 0.0;
    for (double w : contributions) sum += w;
    return sum / static_cast<double>(contributions.size());
}

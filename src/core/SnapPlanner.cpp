#include "core/SnapPlanner.h"
#include "core/ConfigManager.h"
#include "FileScanner.h"
#include "selection/Candidate.h"
#include "selection/WeightCalculator.h"
#include "selection/WeightedSampler.h"
#include "utils/Logger.h"
#include "utils/ProtectionRules.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <system_error>
#include <utility>

SnapPlan SnapPlanner::plan(const SnapOptions& options) const {
    auto& logger = Logger::getInstance();
    SnapPlan result;

    FileScanner scanner(options.directory, options.recursive);
    result.allFiles = scanner.listFiles();

    std::error_code ec;
    result.baseDirectory = fs::weakly_canonical(fs::absolute(scanner.getRoot(), ec), ec);
    if (ec) result.baseDirectory = scanner.getRoot();

    std::vector<std::string> patterns;
    if (!options.noProtect) {
        Config::IgnoreFile ignore = Config::loadIgnoreFile(options.directory);
        if (!ignore.patterns.empty()) {
            patterns = std::move(ignore.patterns);
            result.ignoreFile = ignore.path;
            result.patternCount = patterns.size();
            // 自定义忽略文件替换默认规则，但自身状态文件始终受保护
            patterns.push_back(Config::kIgnoreFileName);
            patterns.push_back(Config::kWeightsFileName);
        } else {
            patterns = ProtectionRules::defaultPatterns();
            result.usingDefaultProtections = true;
            result.patternCount = patterns.size();
        }
        result.protectionEnabled = true;
    }
    ProtectionRules rules(patterns);

    Config::WeightsFile weightsFile = Config::loadWeights(options.directory);
    WeightCalculator calculator(weightsFile.weights);
    result.weighted = calculator.isEnabled();
    result.weightsFile = weightsFile.path;

    for (const auto& file : result.allFiles) {
        if (result.protectionEnabled && rules.isProtected(file, result.baseDirectory)) {
            result.protectedFiles.push_back(file);
        } else {
            result.eligibleFiles.push_back(file);
        }
    }

    if (result.eligibleFiles.size() <= 1) {
        return result;
    }

    const size_t toEliminate = result.eligibleFiles.size() / 2;
    WeightedSampler sampler = WeightedSampler::fromOptionalSeed(options.seed);

    if (result.weighted) {
        std::vector<double> weights;
        weights.reserve(result.eligibleFiles.size());
        for (const auto& file : result.eligibleFiles) {
            double w = calculator.weight(Candidate(file));
            if (logger.isDebugEnabled()) {
                std::ostringstream oss;
                oss << "weight " << w << " " << file.u8string();
                logger.debug(oss.str());
            }
            weights.push_back(w);
        }
        result.eliminated = sampler.sample(result.eligibleFiles, weights, toEliminate);
    } else {
        result.eliminated = sampler.sampleUniform(result.eligibleFiles, toEliminate);
    }

    return result;
}

SnapResult SnapPlanner::execute(const SnapPlan& plan) const {
    auto& logger = Logger::getInstance();
    SnapResult result;

    for (const auto& file : plan.eliminated) {
        std::error_code ec;
        bool removed = fs::remove(file, ec);
        if (ec || !removed) {
            std::string reason = ec ? ec.message() : "file no longer exists";
            result.failures.push_back(file.u8string() + ": " + reason);
            ++result.failedCount;
            logger.error("Failed: " + file.u8string() + " - " + reason);
            continue;
        }
        ++result.eliminatedCount;
        logger.success("Eliminated: " + file.u8string());
    }
    return result;
}

bool SnapPlanner::isConfirmation(const std::string& input) {
    size_t start = input.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return false;
    size_t end = input.find_last_not_of(" \t\r\n");
    std::string answer = input.substr(start, end - start + 1);
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "snap";
}

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <istream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "selection/WeightCalculator.h"

namespace fs = std::filesystem;

struct Config {
    static constexpr const char* kIgnoreFileName = ".balanceignore";
    static constexpr const char* kWeightsFileName = ".balancerc.json";
    // 从目标目录开始向上最多查找的层数（含目标目录本身）
    static constexpr int kSearchLevels = 5;

    struct IgnoreFile {
        std::vector<std::string> patterns;  // 去重，保持文件顺序
        std::optional<fs::path> path;
    };

    struct WeightsFile {
        WeightConfig weights;
        std::optional<fs::path> path;
    };

    struct ExampleFile {
        fs::path path;
        bool created = false;  // false: 已存在，未覆盖
    };

    /**
     * @brief 在 directory 及其父目录中查找 filename，离目标目录最近者优先
     */
    static std::optional<fs::path> findConfigFile(const fs::path& directory, const std::string& filename);

    /** 一行一个模式；空行与 # 注释跳过 */
    static std::vector<std::string> parseIgnoreText(std::istream& in);

    static IgnoreFile loadIgnoreFile(const fs::path& directory);

    /**
     * @brief 读取 .balancerc.json 中的 "weights"
     * @throws std::runtime_error 文件无法读取或 JSON 解析失败
     */
    static WeightsFile loadWeights(const fs::path& directory);

    /** `balance init`：写出示例 .balanceignore / .balancerc.json，已有文件不覆盖 */
    static std::vector<ExampleFile> writeExampleFiles(const fs::path& directory);

    static nlohmann::ordered_json exampleWeights();
};

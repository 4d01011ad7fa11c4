#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct SnapOptions {
    std::string directory = ".";
    bool recursive = false;
    bool noProtect = false;
    std::optional<std::uint64_t> seed;
};

/**
 * @brief 一次 snap 的完整计划：枚举 -> 保护过滤 -> 权重 -> 抽样
 */
struct SnapPlan {
    fs::path baseDirectory;
    std::vector<fs::path> allFiles;
    std::vector<fs::path> protectedFiles;
    std::vector<fs::path> eligibleFiles;
    std::vector<fs::path> eliminated;

    bool protectionEnabled = false;
    bool usingDefaultProtections = false;
    size_t patternCount = 0;
    std::optional<fs::path> ignoreFile;

    bool weighted = false;
    std::optional<fs::path> weightsFile;

    size_t survivors() const { return eligibleFiles.size() - eliminated.size(); }
};

struct SnapResult {
    size_t eliminatedCount = 0;
    size_t failedCount = 0;
    std::vector<std::string> failures;  // "path: reason"
};

class SnapPlanner {
public:
    /**
     * @brief 生成计划，不触碰任何文件
     * @throws std::runtime_error 目录不存在/不是目录，或权重配置无法解析
     */
    SnapPlan plan(const SnapOptions& options) const;

    /**
     * @brief 删除计划中选中的文件；单个文件失败不影响其余文件
     */
    SnapResult execute(const SnapPlan& plan) const;

    // 交互确认：输入 "snap"（大小写不敏感，忽略首尾空白）才继续
    static bool isConfirmation(const std::string& input);
};

#pragma once
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

class FileScanner {
public:
    FileScanner(const std::string& rootPath, bool recursive = false);

    // 列出所有普通文件（按路径排序，保证同一种子可复现）
    // 目录不存在或不是目录时抛 std::runtime_error
    std::vector<fs::path> listFiles() const;

    const fs::path& getRoot() const { return rootPath; }

private:
    fs::path rootPath;
    bool recursive;
};

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief 候选文件：路径 + 惰性读取的元数据
 *
 * 元数据只在第一次访问时读取并缓存；读取失败（文件被并发删除、无权限）
 * 返回 std::nullopt，不抛异常。
 */
class Candidate {
public:
    explicit Candidate(fs::path path);

    const fs::path& getPath() const { return path; }

    /** 扩展名（含点），无扩展名时为空串；".env" 这类点文件没有扩展名 */
    std::string getExtension() const;

    std::optional<std::uintmax_t> getSizeBytes() const;
    std::optional<fs::file_time_type> getLastModified() const;

private:
    fs::path path;

    mutable bool sizeRead = false;
    mutable std::optional<std::uintmax_t> sizeBytes;
    mutable bool mtimeRead = false;
    mutable std::optional<fs::file_time_type> lastModified;
};

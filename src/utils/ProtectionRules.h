#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// 保护规则：gitignore 风格的模式子集，判定某路径是否禁止参与 snap。
// - "name/"    目录模式：该目录及其下所有内容，任意深度。
// - "**"       双星模式：匹配任意层中间目录，如 "**/*.pyc"、"node_modules/**"。
// - "*.log"    通配模式：只对最后一段（文件名）做单段匹配。
// - ".env"     精确模式：任意一段等于该名字，或整个相对路径等于该模式。
// 以 "/" 开头的模式锚定在 base 目录。
//
// 空模式集合表示关闭保护；base 之外（或无法解析）的路径一律视为受保护。
// 模式在构造时一次性编译。
class ProtectionRules {
public:
    explicit ProtectionRules(std::vector<std::string> patterns);
    ~ProtectionRules();

    ProtectionRules(ProtectionRules&&) noexcept;
    ProtectionRules& operator=(ProtectionRules&&) noexcept;

    bool isProtected(const fs::path& path, const fs::path& base, bool isDirectory = false) const;

    /** 对已相对化的路径段做匹配（不做 base 检查） */
    bool matchesRelative(const std::vector<std::string>& segments, bool isDirectory = false) const;

    bool empty() const;
    size_t size() const;

    static std::vector<std::string> defaultPatterns();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/** Convenience wrapper: compiles `patterns` and answers a single query. */
bool isProtected(const fs::path& path, const fs::path& base, const std::vector<std::string>& patterns);

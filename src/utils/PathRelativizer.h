#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * 路径归属判定结果：三态，调用方必须显式处理 Outside / Unresolved（均按受保护处理）。
 */
enum class Containment {
    Inside,
    Outside,
    Unresolved
};

struct RelativePath {
    Containment containment = Containment::Unresolved;
    std::vector<std::string> segments;  // 仅 Inside 时有效，base 自身为空

    bool isInside() const { return containment == Containment::Inside; }
};

/**
 * Computes `path` relative to `base`. Both sides go through the same
 * canonicalization (weakly_canonical, so missing tails are allowed) before the
 * component-wise prefix check.
 */
RelativePath relativize(const fs::path& path, const fs::path& base);

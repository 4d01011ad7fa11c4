#include "utils/ProtectionRules.h"
#include "utils/PathRelativizer.h"
#include <optional>

namespace {

enum class PatternKind {
    Directory,
    DoubleStar,
    Wildcard,
    Exact
};

struct CompiledPattern {
    PatternKind kind = PatternKind::Exact;
    std::vector<std::string> segments;
    bool anchored = false;
};

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitSegments(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) slash = s.size();
        std::string seg = s.substr(start, slash - start);
        if (!seg.empty() && seg != ".") out.push_back(seg);
        start = slash + 1;
    }
    return out;
}

std::optional<CompiledPattern> compilePattern(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) return std::nullopt;

    CompiledPattern p;
    if (s.front() == '/') {
        p.anchored = true;
        s.erase(0, s.find_first_not_of('/'));
    }

    if (!s.empty() && s.back() == '/') {
        p.kind = PatternKind::Directory;
    } else if (s.find("**") != std::string::npos) {
        p.kind = PatternKind::DoubleStar;
    } else if (s.find('*') != std::string::npos) {
        p.kind = PatternKind::Wildcard;
    } else {
        p.kind = PatternKind::Exact;
    }

    p.segments = splitSegments(s);
    if (p.segments.empty()) return std::nullopt;

    // 带内部 "/" 的模式按整段路径匹配；"**" 本身负责跨层
    if (p.kind != PatternKind::Directory && (p.segments.size() > 1 || p.kind == PatternKind::DoubleStar)) {
        p.anchored = true;
    }
    return p;
}

// 单段 glob：'*' 匹配段内任意字符序列
bool globMatch(const std::string& pattern, const std::string& text) {
    size_t p = 0, t = 0;
    size_t starP = std::string::npos, starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

// Matches pattern[pi..] against segs[si..end). A "**" segment consumes any number
// of path segments; a trailing "**" needs at least one.
bool matchRun(const std::vector<std::string>& pattern, size_t pi,
              const std::vector<std::string>& segs, size_t si, size_t end) {
    if (pi == pattern.size()) return si == end;

    if (pattern[pi] == "**") {
        bool trailing = (pi + 1 == pattern.size());
        for (size_t k = si + (trailing ? 1 : 0); k <= end; ++k) {
            if (matchRun(pattern, pi + 1, segs, k, end)) return true;
        }
        return false;
    }

    if (si == end) return false;
    return globMatch(pattern[pi], segs[si]) && matchRun(pattern, pi + 1, segs, si + 1, end);
}

bool patternMatches(const CompiledPattern& p, const std::vector<std::string>& segs, bool isDirectory) {
    const size_t n = segs.size();
    if (n == 0) return false;

    if (p.kind == PatternKind::Directory) {
        // 只有目录段参与匹配；命中任一祖先目录即整棵子树受保护
        const size_t dirCount = isDirectory ? n : n - 1;
        for (size_t end = 1; end <= dirCount; ++end) {
            const size_t lastStart = p.anchored ? 0 : end - 1;
            for (size_t start = 0; start <= lastStart; ++start) {
                if (matchRun(p.segments, 0, segs, start, end)) return true;
            }
        }
        return false;
    }

    if (p.anchored) {
        // 每个前缀都是祖先目录，匹配即覆盖整棵子树
        for (size_t end = 1; end <= n; ++end) {
            if (matchRun(p.segments, 0, segs, 0, end)) return true;
        }
        return false;
    }

    const std::string& name = p.segments.front();
    if (p.kind == PatternKind::Wildcard) {
        return globMatch(name, segs.back());
    }
    for (const auto& seg : segs) {
        if (seg == name) return true;
    }
    return false;
}

}

struct ProtectionRules::Impl {
    std::vector<CompiledPattern> compiled;
};

ProtectionRules::ProtectionRules(std::vector<std::string> patterns)
    : impl_(std::make_unique<Impl>()) {
    for (const auto& raw : patterns) {
        if (auto compiled = compilePattern(raw)) {
            impl_->compiled.push_back(std::move(*compiled));
        }
    }
}

ProtectionRules::~ProtectionRules() = default;
ProtectionRules::ProtectionRules(ProtectionRules&&) noexcept = default;
ProtectionRules& ProtectionRules::operator=(ProtectionRules&&) noexcept = default;

bool ProtectionRules::empty() const {
    return impl_->compiled.empty();
}

size_t ProtectionRules::size() const {
    return impl_->compiled.size();
}

bool ProtectionRules::isProtected(const fs::path& path, const fs::path& base, bool isDirectory) const {
    if (impl_->compiled.empty()) return false;

    RelativePath rel = relativize(path, base);
    if (!rel.isInside()) return true;

    return matchesRelative(rel.segments, isDirectory);
}

bool ProtectionRules::matchesRelative(const std::vector<std::string>& segments, bool isDirectory) const {
    for (const auto& p : impl_->compiled) {
        if (patternMatches(p, segments, isDirectory)) return true;
    }
    return false;
}

std::vector<std::string> ProtectionRules::defaultPatterns() {
    return {
        // Version control
        ".git", ".git/", ".gitignore", ".gitattributes", ".svn", ".hg",
        // Virtual environments / dependency trees
        "venv/", ".venv/", "env/", ".env.local/", "__pycache__/", "node_modules/",
        "*.pyc", "*.pyo",
        // Secrets and config
        ".env", ".env.*", "*.config", "config.yml", "config.yaml",
        // Lock files
        "package-lock.json", "yarn.lock", "pnpm-lock.yaml", "Cargo.lock",
        "Pipfile.lock", "poetry.lock", "Gemfile.lock", "uv.lock",
        // Our own state
        ".balanceignore", ".balancerc.json",
        // IDEs
        ".vscode/", ".idea/",
        // Databases
        "*.db", "*.sqlite",
    };
}

bool isProtected(const fs::path& path, const fs::path& base, const std::vector<std::string>& patterns) {
    return ProtectionRules(patterns).isProtected(path, base);
}

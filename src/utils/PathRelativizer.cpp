#include "utils/PathRelativizer.h"
#include <system_error>

namespace {

bool canonicalize(const fs::path& p, fs::path& out) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) return false;
    out = fs::weakly_canonical(abs, ec);
    if (ec) return false;
    return true;
}

}

RelativePath relativize(const fs::path& path, const fs::path& base) {
    RelativePath result;

    fs::path canonicalPath;
    fs::path canonicalBase;
    if (!canonicalize(path, canonicalPath) || !canonicalize(base, canonicalBase)) {
        result.containment = Containment::Unresolved;
        return result;
    }

    auto pathIt = canonicalPath.begin();
    for (auto baseIt = canonicalBase.begin(); baseIt != canonicalBase.end(); ++baseIt) {
        // weakly_canonical 可能保留末尾的空段（"dir/"），忽略即可
        if (baseIt->empty()) continue;
        if (pathIt == canonicalPath.end() || *pathIt != *baseIt) {
            result.containment = Containment::Outside;
            return result;
        }
        ++pathIt;
    }

    for (; pathIt != canonicalPath.end(); ++pathIt) {
        std::string seg = pathIt->string();
        if (seg.empty() || seg == ".") continue;
        result.segments.push_back(seg);
    }
    result.containment = Containment::Inside;
    return result;
}

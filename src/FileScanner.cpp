#include "FileScanner.h"
#include "utils/Logger.h"
#include <algorithm>
#include <stdexcept>
#include <system_error>

FileScanner::FileScanner(const std::string& rootPath, bool recursive)
    : rootPath(fs::u8path(rootPath)), recursive(recursive) {}

std::vector<fs::path> FileScanner::listFiles() const {
    std::error_code ec;
    bool found = fs::exists(rootPath, ec);
    if (ec) {
        throw std::runtime_error("Cannot access " + rootPath.u8string() + ": " + ec.message());
    }
    if (!found) {
        throw std::runtime_error("Directory not found: " + rootPath.u8string());
    }
    if (!fs::is_directory(rootPath, ec)) {
        throw std::runtime_error("Not a directory: " + rootPath.u8string());
    }

    std::vector<fs::path> files;
    auto collect = [&files](const fs::directory_entry& entry) {
        std::error_code entryEc;
        if (entry.is_regular_file(entryEc)) {
            files.push_back(entry.path());
        }
    };

    if (recursive) {
        fs::recursive_directory_iterator it(rootPath, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw std::runtime_error("Cannot read directory " + rootPath.u8string() + ": " + ec.message());
        }
        for (auto end = fs::recursive_directory_iterator(); it != end;) {
            collect(*it);
            it.increment(ec);
            if (ec) {
                Logger::getInstance().warn("Stopped scanning " + rootPath.u8string() + ": " + ec.message());
                break;
            }
        }
    } else {
        fs::directory_iterator it(rootPath, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw std::runtime_error("Cannot read directory " + rootPath.u8string() + ": " + ec.message());
        }
        for (auto end = fs::directory_iterator(); it != end;) {
            collect(*it);
            it.increment(ec);
            if (ec) {
                Logger::getInstance().warn("Stopped scanning " + rootPath.u8string() + ": " + ec.message());
                break;
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

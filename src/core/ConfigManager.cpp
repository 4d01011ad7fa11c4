#include "core/ConfigManager.h"
#include "utils/Logger.h"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace {

const char* kExampleIgnore = R"(# Balance Ignore File
# Patterns listed here are protected from elimination

# Large folders that would otherwise soak up the whole snap
node_modules/**
venv/**
.venv/**
__pycache__/**

# Important directories
important/**
backup/**
docs/**

# Database files
*.db
*.sqlite

# System & Config
.env
.git/**
.vscode/**
.idea/**

# Important data files
*-important.*
*-backup.*
)";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

}

std::optional<fs::path> Config::findConfigFile(const fs::path& directory, const std::string& filename) {
    std::error_code ec;
    fs::path current = fs::weakly_canonical(fs::absolute(directory, ec), ec);
    if (ec) {
        Logger::getInstance().debug("Cannot resolve " + directory.u8string() + ": " + ec.message());
        return std::nullopt;
    }

    for (int level = 0; level < kSearchLevels; ++level) {
        fs::path candidate = current / filename;
        if (fs::exists(candidate, ec)) {
            return candidate;
        }

        fs::path parent = current.parent_path();
        if (parent == current) break;  // 到达文件系统根
        current = parent;
    }
    return std::nullopt;
}

std::vector<std::string> Config::parseIgnoreText(std::istream& in) {
    std::vector<std::string> patterns;
    std::unordered_set<std::string> seen;
    std::string line;
    while (std::getline(in, line)) {
        std::string pattern = trim(line);
        if (pattern.empty() || pattern[0] == '#') continue;
        if (seen.insert(pattern).second) {
            patterns.push_back(pattern);
        }
    }
    return patterns;
}

Config::IgnoreFile Config::loadIgnoreFile(const fs::path& directory) {
    IgnoreFile result;
    auto path = findConfigFile(directory, kIgnoreFileName);
    if (!path) return result;

    std::ifstream f(*path);
    if (!f.is_open()) {
        Logger::getInstance().warn("Could not open ignore file: " + path->u8string());
        return result;
    }
    result.patterns = parseIgnoreText(f);
    result.path = path;
    return result;
}

Config::WeightsFile Config::loadWeights(const fs::path& directory) {
    WeightsFile result;
    auto path = findConfigFile(directory, kWeightsFileName);
    if (!path) return result;

    std::ifstream f(*path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path->u8string());
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    f.close();

    // ordered_json：保留子表在文件中的顺序（区间表按顺序取首个命中）
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("JSON Parse Error in " + path->u8string() + ": " + e.what());
    }

    result.path = path;
    if (!j.is_object()) {
        Logger::getInstance().warn(path->u8string() + " is not a JSON object, ignored");
        return result;
    }
    if (j.contains("weights")) {
        result.weights = WeightConfig::fromJson(j.at("weights"));
    }
    return result;
}

nlohmann::ordered_json Config::exampleWeights() {
    nlohmann::ordered_json byExtension = {
        {".log", 0.9},
        {".tmp", 0.95},
        {".cache", 0.95},
        {".bak", 0.8},
        {".old", 0.8},
        {".py", 0.3},
        {".js", 0.3},
        {".db", 0.1},
        {".json", 0.2},
    };
    nlohmann::ordered_json root;
    root["weights"]["by_extension"] = byExtension;
    return root;
}

std::vector<Config::ExampleFile> Config::writeExampleFiles(const fs::path& directory) {
    std::vector<ExampleFile> results;

    auto writeIfMissing = [&results](const fs::path& path, const std::string& content) {
        ExampleFile file{path, false};
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            std::ofstream out(path);
            if (!out.is_open()) {
                throw std::runtime_error("Could not write " + path.u8string());
            }
            out << content;
            file.created = true;
        }
        results.push_back(file);
    };

    writeIfMissing(directory / kIgnoreFileName, kExampleIgnore);
    writeIfMissing(directory / kWeightsFileName, exampleWeights().dump(2) + "\n");
    return results;
}

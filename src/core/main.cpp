#include <iostream>
#include <string>
#include <vector>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include "core/ConfigManager.h"
#include "core/SnapPlanner.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string YELLOW = "\033[38;5;226m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

namespace {

constexpr size_t kMaxListed = 20;
constexpr size_t kMaxProtectedListed = 10;

struct CliArgs {
    std::string command;
    SnapOptions snap;
    bool dryRun = false;
    bool assumeYes = false;
    bool verbose = false;
    std::string logFile;
    bool help = false;
};

void printUsage() {
    std::cout << BOLD << "balance" << RESET << " - eliminate half of all files with a snap.\n\n"
              << "Usage:\n"
              << "  balance snap [DIR] [options]   Select half of the eligible files and delete them\n"
              << "  balance init [DIR]             Create example .balanceignore and .balancerc.json\n\n"
              << "Snap options:\n"
              << "  -r, --recursive       Include subdirectories\n"
              << "  -d, --dry-run         Preview without deleting\n"
              << "  -s, --seed N          Random seed for reproducibility\n"
              << "      --no-protect      Disable all protections (DANGEROUS!)\n"
              << "  -y, --yes             Skip the confirmation prompt\n"
              << "  -v, --verbose         Debug logging (per-file weights)\n"
              << "      --log-file PATH   Append log records to PATH\n"
              << "  -h, --help            Show this help" << std::endl;
}

std::uint64_t parseSeed(const std::string& text) {
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid seed: " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("Invalid seed: " + text);
    }
    return static_cast<std::uint64_t>(value);
}

CliArgs parseArgs(int argc, char* argv[]) {
    CliArgs args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto requireValue = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + flag);
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-r" || arg == "--recursive") {
            args.snap.recursive = true;
        } else if (arg == "-d" || arg == "--dry-run") {
            args.dryRun = true;
        } else if (arg == "-s" || arg == "--seed") {
            args.snap.seed = parseSeed(requireValue(arg));
        } else if (arg == "--no-protect") {
            args.snap.noProtect = true;
        } else if (arg == "-y" || arg == "--yes") {
            args.assumeYes = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--log-file") {
            args.logFile = requireValue(arg);
        } else if (arg.size() > 1 && arg[0] == '-' && !std::isdigit(static_cast<unsigned char>(arg[1]))) {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (!positional.empty()) {
        args.command = positional[0];
    }
    if (positional.size() >= 2) {
        args.snap.directory = positional[1];
    }
    if (positional.size() > 2) {
        throw std::invalid_argument("Unexpected argument: " + positional[2]);
    }
    return args;
}

void printFileList(const std::vector<fs::path>& files) {
    size_t shown = std::min(files.size(), kMaxListed);
    for (size_t i = 0; i < shown; ++i) {
        std::cout << "   " << RED << "💀" << RESET << " " << files[i].u8string() << std::endl;
    }
    if (files.size() > kMaxListed) {
        std::cout << "   " << GRAY << "... and " << (files.size() - kMaxListed) << " more files" << RESET << std::endl;
    }
}

void printAssessment(const SnapPlan& plan) {
    auto row = [](const std::string& label, const std::string& color, size_t value) {
        std::cout << "  " << CYAN << std::left << std::setw(22) << label << RESET
                  << color << BOLD << std::right << std::setw(8) << value << RESET << std::endl;
    };
    std::cout << "\n" << BOLD << "📊 Balance Assessment" << RESET << std::endl;
    row("Total files found", "", plan.allFiles.size());
    row("Protected files", GREEN, plan.protectedFiles.size());
    row("Eligible files", "", plan.eligibleFiles.size());
    row("Files to eliminate", RED, plan.eliminated.size());
    row("Survivors", GREEN, plan.survivors());
    std::cout << std::endl;
}

int runInit(const CliArgs& args) {
    auto& logger = Logger::getInstance();
    for (const auto& file : Config::writeExampleFiles(fs::u8path(args.snap.directory))) {
        if (file.created) {
            logger.success("Created " + file.path.u8string());
        } else {
            logger.warn(file.path.u8string() + " already exists");
        }
    }
    std::cout << "\n" << GREEN << BOLD << "✨ Initialization complete!" << RESET << "\n"
              << GRAY << "Run 'balance snap -d' to test your configuration." << RESET << std::endl;
    return 0;
}

int runSnap(const CliArgs& args) {
    auto& logger = Logger::getInstance();

    std::cout << "\n" << YELLOW << BOLD << "🫰 THE SNAP" << RESET << "\n"
              << GRAY << "Perfectly balanced, as all things should be" << RESET << "\n" << std::endl;

    if (args.snap.seed) {
        logger.info("Using random seed: " + std::to_string(static_cast<long long>(*args.snap.seed)));
    }

    SnapPlanner planner;
    SnapPlan plan = planner.plan(args.snap);

    if (!plan.protectionEnabled) {
        logger.warn("WARNING: All file protections disabled!");
    } else if (plan.ignoreFile) {
        logger.success("Loaded " + std::to_string(plan.patternCount) + " patterns from " + plan.ignoreFile->u8string());
    } else {
        logger.success("Default protections enabled");
    }
    if (plan.weighted && plan.weightsFile) {
        logger.success("Weighted selection enabled from " + plan.weightsFile->u8string());
    }

    if (plan.eligibleFiles.size() <= 1) {
        std::cout << "\n" << YELLOW << "No eligible files found." << RESET << "\n"
                  << "The universe is empty (or fully protected)." << std::endl;
        return 0;
    }

    printAssessment(plan);

    if (args.dryRun) {
        std::cout << YELLOW << BOLD << "🔍 DRY RUN MODE" << RESET << "\nThese files would be eliminated:\n" << std::endl;
        printFileList(plan.eliminated);

        if (!plan.protectedFiles.empty() && plan.protectedFiles.size() <= kMaxProtectedListed) {
            std::cout << "\n" << GREEN << "🛡️  Protected files:" << RESET << std::endl;
            for (const auto& file : plan.protectedFiles) {
                std::cout << "   " << GREEN << "✓" << RESET << " " << file.u8string() << std::endl;
            }
        }

        std::cout << "\n" << BOLD << "This was a dry run. No files were harmed." << RESET << std::endl;
        if (args.snap.seed) {
            std::cout << GRAY << "Run with --seed " << static_cast<long long>(*args.snap.seed)
                      << " to delete these exact files" << RESET << std::endl;
        } else {
            std::cout << GRAY << "Use --seed <number> to get reproducible results" << RESET << std::endl;
        }
        return 0;
    }

    std::cout << RED << BOLD << "📋 Files selected for elimination:" << RESET << "\n" << std::endl;
    printFileList(plan.eliminated);

    if (!args.assumeYes) {
        std::cout << "\n" << RED << BOLD << "WARNING: This will permanently delete the files listed above!" << RESET << "\n"
                  << YELLOW << "There is no undo. Files will be gone forever." << RESET << "\n" << std::endl;
        std::cout << BOLD << "Type 'snap' to proceed: " << RESET << std::flush;

        std::string confirm;
        std::getline(std::cin, confirm);
        if (!SnapPlanner::isConfirmation(confirm)) {
            std::cout << "\n" << YELLOW << "Snap cancelled." << RESET << "\nThe universe remains unchanged." << std::endl;
            return 0;
        }
    }

    std::cout << "\n" << YELLOW << BOLD << "💥 Snapping..." << RESET << "\n" << std::endl;
    SnapResult result = planner.execute(plan);

    std::cout << "\n" << GREEN << BOLD << "✨ The snap is complete." << RESET << "\n\n"
              << GREEN << "Eliminated: " << RESET << result.eliminatedCount << " files\n"
              << RED << "Failed: " << RESET << result.failedCount << " files\n\n"
              << GRAY << "Perfectly balanced, as all things should be." << RESET << std::endl;
    return result.failedCount == 0 ? 0 : 1;
}

}

int main(int argc, char* argv[]) {
    auto& logger = Logger::getInstance();

    CliArgs args;
    try {
        args = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        logger.error(e.what());
        printUsage();
        return 2;
    }

    if (args.help || args.command.empty()) {
        printUsage();
        return 0;
    }

    logger.setDebugEnabled(args.verbose);
    if (!args.logFile.empty()) {
        logger.setLogFile(args.logFile);
    }

    // Global exception handler: report and exit non-zero instead of crashing
    try {
        if (args.command == "snap") {
            return runSnap(args);
        }
        if (args.command == "init") {
            return runInit(args);
        }
        logger.error("Unknown command: " + args.command);
        printUsage();
        return 2;
    } catch (const std::exception& e) {
        logger.error(std::string("Error: ") + e.what());
        return 1;
    }
}

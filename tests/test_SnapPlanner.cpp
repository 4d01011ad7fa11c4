/**
 * SnapPlanner 端到端测试：在临时目录中构造文件树，验证淘汰数量（eligible / 2）、
 * 默认保护 / .balanceignore / --no-protect、种子可复现、权重偏置以及删除失败不中断。
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>

#include "core/SnapPlanner.h"

namespace fs = std::filesystem;

namespace {

class SnapPlannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() / (std::string("balance_snap_") + info->name());
        std::error_code ec;
        fs::remove_all(root, ec);
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void createFile(const fs::path& rel, const std::string& content = "content") {
        fs::path p = root / rel;
        fs::create_directories(p.parent_path());
        std::ofstream f(p);
        ASSERT_TRUE(f.is_open()) << "create " << p.u8string();
        f << content;
    }

    void createNumbered(int count, const std::string& ext = ".txt") {
        for (int i = 0; i < count; ++i) {
            createFile("file_" + std::to_string(i) + ext, "Content " + std::to_string(i));
        }
    }

    SnapOptions options(bool noProtect = false, bool recursive = false) const {
        SnapOptions opts;
        opts.directory = root.u8string();
        opts.noProtect = noProtect;
        opts.recursive = recursive;
        opts.seed = 42;
        return opts;
    }

    size_t countFiles() const {
        size_t n = 0;
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            if (entry.is_regular_file()) ++n;
        }
        return n;
    }

    static std::set<std::string> names(const std::vector<fs::path>& files) {
        std::set<std::string> out;
        for (const auto& f : files) out.insert(f.filename().u8string());
        return out;
    }

    fs::path root;
    SnapPlanner planner;
};

}

TEST_F(SnapPlannerTest, EmptyDirectoryPlansNothing) {
    SnapPlan plan = planner.plan(options(true));
    EXPECT_TRUE(plan.allFiles.empty());
    EXPECT_TRUE(plan.eliminated.empty());
}

TEST_F(SnapPlannerTest, EliminatesHalfWithoutProtection) {
    createNumbered(10);
    SnapPlan plan = planner.plan(options(true));
    EXPECT_FALSE(plan.protectionEnabled);
    EXPECT_EQ(plan.eligibleFiles.size(), 10u);
    EXPECT_EQ(plan.eliminated.size(), 5u);
    EXPECT_EQ(plan.survivors(), 5u);

    SnapResult result = planner.execute(plan);
    EXPECT_EQ(result.eliminatedCount, 5u);
    EXPECT_EQ(result.failedCount, 0u);
    EXPECT_EQ(countFiles(), 5u);
}

TEST_F(SnapPlannerTest, OddCountRoundsDown) {
    createNumbered(11);
    SnapPlan plan = planner.plan(options(true));
    EXPECT_EQ(plan.eliminated.size(), 5u);
    planner.execute(plan);
    EXPECT_EQ(countFiles(), 6u);
}

TEST_F(SnapPlannerTest, SingleFileSurvives) {
    createFile("lonely.txt", "alone");
    SnapPlan plan = planner.plan(options(true));
    EXPECT_EQ(plan.eligibleFiles.size(), 1u);
    EXPECT_TRUE(plan.eliminated.empty());
}

TEST_F(SnapPlannerTest, TwoFilesLoseOne) {
    createNumbered(2);
    SnapPlan plan = planner.plan(options(true));
    EXPECT_EQ(plan.eliminated.size(), 1u);
}

TEST_F(SnapPlannerTest, DefaultProtectionsShieldProjectFiles) {
    createNumbered(5);
    createFile(".env", "SECRET=value");
    createFile(".git/config", "git config");
    createFile("node_modules/package.json", "{}");
    createFile(".venv/bin/python", "#!/usr/bin/python");

    SnapPlan plan = planner.plan(options(false, true));
    EXPECT_TRUE(plan.protectionEnabled);
    EXPECT_TRUE(plan.usingDefaultProtections);
    EXPECT_EQ(plan.allFiles.size(), 9u);
    EXPECT_EQ(plan.protectedFiles.size(), 4u);
    EXPECT_EQ(plan.eligibleFiles.size(), 5u);
    EXPECT_EQ(plan.eliminated.size(), 2u);

    planner.execute(plan);
    EXPECT_TRUE(fs::exists(root / ".env"));
    EXPECT_TRUE(fs::exists(root / ".git" / "config"));
    EXPECT_TRUE(fs::exists(root / "node_modules" / "package.json"));
    EXPECT_TRUE(fs::exists(root / ".venv" / "bin" / "python"));
}

TEST_F(SnapPlannerTest, IgnoreFileReplacesDefaults) {
    createNumbered(4);
    createFile("keep.txt", "keep");
    createFile("important/data.txt", "data");
    createFile(".env", "not protected by the custom file");
    createFile(".balanceignore", "keep.txt\nimportant/\n");

    SnapPlan plan = planner.plan(options(false, true));
    EXPECT_FALSE(plan.usingDefaultProtections);
    ASSERT_TRUE(plan.ignoreFile);
    EXPECT_EQ(plan.patternCount, 2u);

    auto protectedNames = names(plan.protectedFiles);
    EXPECT_EQ(protectedNames, (std::set<std::string>{"keep.txt", "data.txt", ".balanceignore"}));
    EXPECT_EQ(plan.eligibleFiles.size(), 5u);

    planner.execute(plan);
    EXPECT_TRUE(fs::exists(root / "keep.txt"));
    EXPECT_TRUE(fs::exists(root / "important" / "data.txt"));
    EXPECT_TRUE(fs::exists(root / ".balanceignore"));
}

TEST_F(SnapPlannerTest, NonRecursiveIgnoresSubdirectories) {
    createNumbered(6);
    createFile("subdir/a.txt");
    createFile("subdir/b.txt");
    SnapPlan plan = planner.plan(options(true, false));
    EXPECT_EQ(plan.allFiles.size(), 6u);
    EXPECT_EQ(plan.eliminated.size(), 3u);
}

TEST_F(SnapPlannerTest, SameSeedSameSelection) {
    createNumbered(10);
    SnapPlan first = planner.plan(options(true));
    SnapPlan second = planner.plan(options(true));
    EXPECT_EQ(first.eliminated, second.eliminated);

    SnapOptions negative = options(true);
    negative.seed = static_cast<std::uint64_t>(-7LL);
    EXPECT_EQ(planner.plan(negative).eliminated, planner.plan(negative).eliminated);
}

TEST_F(SnapPlannerTest, DryRunPlanTouchesNothing) {
    createNumbered(10);
    SnapPlan plan = planner.plan(options(true));
    EXPECT_EQ(plan.eliminated.size(), 5u);
    EXPECT_EQ(countFiles(), 10u);
}

TEST_F(SnapPlannerTest, WeightsBiasSelection) {
    std::map<std::string, int> eliminatedByExt;
    for (std::uint64_t seed = 0; seed < 200; ++seed) {
        fs::remove_all(root);
        fs::create_directories(root);
        createFile(".balancerc.json", R"({"weights": {"by_extension": {".tmp": 0.99, ".py": 0.01}}})");
        for (int i = 0; i < 5; ++i) {
            createFile("cache_" + std::to_string(i) + ".tmp");
            createFile("module_" + std::to_string(i) + ".py");
        }

        SnapOptions opts = options(false);
        opts.seed = seed;
        SnapPlan plan = planner.plan(opts);
        ASSERT_TRUE(plan.weighted);
        ASSERT_EQ(plan.eligibleFiles.size(), 10u);
        ASSERT_EQ(plan.eliminated.size(), 5u);
        for (const auto& f : plan.eliminated) {
            ++eliminatedByExt[f.extension().u8string()];
        }
    }
    EXPECT_GT(eliminatedByExt[".tmp"], 4 * eliminatedByExt[".py"]);
}

TEST_F(SnapPlannerTest, FailedRemovalDoesNotStopTheRest) {
    createNumbered(10);
    SnapPlan plan = planner.plan(options(true));
    ASSERT_EQ(plan.eliminated.size(), 5u);

    fs::remove(plan.eliminated.front());
    SnapResult result = planner.execute(plan);
    EXPECT_EQ(result.failedCount, 1u);
    EXPECT_EQ(result.eliminatedCount, 4u);
    EXPECT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(countFiles(), 5u);
}

TEST(SnapConfirmation, OnlySnapProceeds) {
    EXPECT_TRUE(SnapPlanner::isConfirmation("snap"));
    EXPECT_TRUE(SnapPlanner::isConfirmation("SNAP"));
    EXPECT_TRUE(SnapPlanner::isConfirmation("  Snap\r"));
    EXPECT_FALSE(SnapPlanner::isConfirmation(""));
    EXPECT_FALSE(SnapPlanner::isConfirmation("y"));
    EXPECT_FALSE(SnapPlanner::isConfirmation("snapshot"));
    // 非 ASCII 字节（UTF-8 "snäp"）不能被当作确认
    EXPECT_FALSE(SnapPlanner::isConfirmation("sn\xC3\xA4p"));
    EXPECT_FALSE(SnapPlanner::isConfirmation("\xFF\xFEsnap"));
}

TEST_F(SnapPlannerTest, MissingDirectoryThrows) {
    SnapOptions opts = options(true);
    opts.directory = (root / "nope").u8string();
    EXPECT_THROW(planner.plan(opts), std::runtime_error);
}

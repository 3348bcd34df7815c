#include <gtest/gtest.h>
#include "exec/Executor.hpp"
#include "plan/Planner.hpp"

#include <fstream>

using namespace sn::exec;
using namespace sn::plan;
using namespace sn::plan::model;
using namespace sn::sanitize;

class ExecutorTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        // Per-test directory
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("safename_executor_test_") + info->name());
        fs::remove_all(test_dir);
        fs::create_directory(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void touch(const fs::path& rel, const std::string& content = "x") const {
        fs::create_directories((test_dir / rel).parent_path());
        std::ofstream out(test_dir / rel);
        out << content;
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static RenamePlan plan(const fs::path& root) {
        return Planner::build(root, {Options::withReplacement(U'_'), false});
    }
};

TEST_F(ExecutorTest, AppliesNestedPlanBottomUp) {
    touch("bad:dir/inner*file", "payload");
    touch("bad:dir/sub?/leaf|");

    const auto results = Executor::run(plan(test_dir));
    ASSERT_EQ(results.size(), 4u);
    for (const auto& r : results) EXPECT_TRUE(r.success) << r.errorMessage.value_or("");

    EXPECT_FALSE(fs::exists(test_dir / "bad:dir"));
    EXPECT_EQ(readFile(test_dir / "bad_dir" / "inner_file"), "payload");
    EXPECT_TRUE(fs::exists(test_dir / "bad_dir" / "sub_" / "leaf_"));
}

TEST_F(ExecutorTest, TreeIsCleanAfterwards) {
    touch("x:y/CON.txt");
    touch("x:y/trailing.");
    Executor::run(plan(test_dir));
    EXPECT_FALSE(plan(test_dir).hasChanges());
}

TEST_F(ExecutorTest, VanishedSourceIsReportedAndOthersContinue) {
    touch("gone:file");
    touch("kept:file");

    const auto p = plan(test_dir);
    fs::remove(test_dir / "gone:file");

    const auto results = Executor::run(p);
    ASSERT_EQ(results.size(), 2u);

    EXPECT_FALSE(results[0].success);
    ASSERT_TRUE(results[0].errorMessage.has_value());
    EXPECT_EQ(results[0].errorMessage->rfind("Source no longer exists: ", 0), 0u);

    EXPECT_TRUE(results[1].success);
    EXPECT_TRUE(fs::exists(test_dir / "kept_file"));
}

TEST_F(ExecutorTest, ExistingDestinationIsNeverOverwritten) {
    touch("a:b", "original");

    const auto p = plan(test_dir);
    touch("a_b", "newcomer");

    const auto results = Executor::run(p);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].errorMessage->rfind("Destination already exists: ", 0), 0u);
    EXPECT_EQ(readFile(test_dir / "a_b"), "newcomer");
    EXPECT_EQ(readFile(test_dir / "a:b"), "original");
}

TEST_F(ExecutorTest, DanglingSymlinkCountsAsOccupied) {
    touch("a:b");
    const auto p = plan(test_dir);
    fs::create_symlink(test_dir / "nowhere", test_dir / "a_b");

    const auto results = Executor::run(p);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].success);
}

TEST_F(ExecutorTest, ActionsNotNeedingRenameAreSkipped) {
    touch("fine");
    RenamePlan p;
    p.root = test_dir;
    p.actions.push_back(RenameAction{test_dir / "fine", test_dir / "fine", EntryKind::File, "fine", "fine", {}, false});

    EXPECT_TRUE(Executor::run(p).empty());
    EXPECT_TRUE(fs::exists(test_dir / "fine"));
}

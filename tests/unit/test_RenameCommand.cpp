#include <gtest/gtest.h>
#include "shell/Parser.hpp"
#include "shell/commands/rename.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace sn::shell;
using namespace sn::shell::commands;

class RenameCommandTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path tree;
    fs::path log_file;

    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;

    void SetUp() override {
        // Per-test directory
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("safename_rename_cmd_test_") + info->name());
        fs::remove_all(test_dir);
        tree = test_dir / "tree";
        log_file = test_dir / "logs" / "run.json";
        fs::create_directories(tree);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void touch(const std::string& name) const {
        std::ofstream f(tree / name);
        f << "x";
    }

    int run(std::vector<std::string> args, const std::string& input = "") {
        in.str(input);
        in.clear();
        auto call = parseTokens(tokenize(args), renameFlags());
        call.name = "safename";
        StreamIO io{in, out, err};
        return runRename(call, io);
    }
};

TEST_F(RenameCommandTest, HelpPrintsUsage) {
    EXPECT_EQ(run({"--help"}), Success);
    EXPECT_NE(out.str().find("usage: safename PATH"), std::string::npos);
}

TEST_F(RenameCommandTest, CleanTreeReportsNothingToDo) {
    touch("fine.txt");
    EXPECT_EQ(run({tree.string()}), Success);
    EXPECT_NE(out.str().find("No renames needed. All filenames are already portable."), std::string::npos);
}

TEST_F(RenameCommandTest, DryRunChangesNothing) {
    touch("a:b.txt");
    EXPECT_EQ(run({tree.string(), "--replace-char", "_", "-v"}), Success);

    EXPECT_NE(out.str().find("[file] a:b.txt -> a_b.txt"), std::string::npos);
    EXPECT_NE(out.str().find("* Replaced forbidden characters [':']"), std::string::npos);
    EXPECT_NE(out.str().find("Dry-run mode. Use --write to apply changes."), std::string::npos);
    EXPECT_TRUE(fs::exists(tree / "a:b.txt"));
    EXPECT_FALSE(fs::exists(log_file));
}

TEST_F(RenameCommandTest, WriteWithYesRenamesAndLogs) {
    touch("a:b.txt");
    touch("CON");

    const auto rc = run({tree.string(), "--write", "-y", "--replace-char=_", "--log-file", log_file.string()});
    EXPECT_EQ(rc, Success) << err.str();

    EXPECT_TRUE(fs::exists(tree / "a_b.txt"));
    EXPECT_TRUE(fs::exists(tree / "_CON"));
    EXPECT_NE(out.str().find("Done: 2 renamed, 0 errors."), std::string::npos);
    EXPECT_NE(out.str().find("Log written to: " + log_file.string()), std::string::npos);

    std::ifstream f(log_file);
    const auto j = nlohmann::json::parse(f);
    EXPECT_EQ(j.at("total_renames"), 2);
}

TEST_F(RenameCommandTest, PromptAcceptsYes) {
    touch("q?.txt");
    EXPECT_EQ(run({tree.string(), "--write", "--log-file", log_file.string()}, "yes\n"), Success);
    EXPECT_NE(out.str().find("Rename 1 entries? [y/N]"), std::string::npos);
    EXPECT_FALSE(fs::exists(tree / "q?.txt"));
}

TEST_F(RenameCommandTest, PromptDeclinedCancels) {
    touch("q?.txt");
    EXPECT_EQ(run({tree.string(), "--write", "--log-file", log_file.string()}, "n\n"), Cancelled);
    EXPECT_NE(out.str().find("Cancelled."), std::string::npos);
    EXPECT_TRUE(fs::exists(tree / "q?.txt"));
    EXPECT_FALSE(fs::exists(log_file));
}

TEST_F(RenameCommandTest, EndOfInputCancels) {
    touch("q?.txt");
    EXPECT_EQ(run({tree.string(), "--write"}, ""), Cancelled);
    EXPECT_TRUE(fs::exists(tree / "q?.txt"));
}

TEST_F(RenameCommandTest, BadArgumentsFail) {
    EXPECT_EQ(run({}), Failure);
    EXPECT_EQ(run({tree.string(), tree.string()}), Failure);
    EXPECT_EQ(run({(tree / "missing").string()}), Failure);
    EXPECT_EQ(run({tree.string(), "--replace-char", ":"}), Failure);
    EXPECT_EQ(run({tree.string(), "--replace-char", "ab"}), Failure);
    EXPECT_EQ(run({tree.string(), "--replace-char="}), Failure);
    EXPECT_EQ(run({tree.string(), "--log-file="}), Failure);
    EXPECT_EQ(run({tree.string(), "--max-length", "0"}), Failure);
    EXPECT_EQ(run({tree.string(), "--max-length", "ten"}), Failure);
    EXPECT_EQ(run({tree.string(), "--bogus"}), Failure);
    EXPECT_EQ(run({tree.string(), "--write=yes"}), Failure);
    EXPECT_NE(err.str().find("Error: "), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(RenameCommandTest, EmptyReplaceCharDoesNotFallBackToUnicode) {
    const auto call = parseTokens(tokenize({tree.string(), "--replace-char="}), renameFlags());
    EXPECT_THROW(resolveOptions(call), std::invalid_argument);

    touch("a:b");
    EXPECT_EQ(run({tree.string(), "--replace-char=", "--write", "-y", "--log-file", log_file.string()}), Failure);
    EXPECT_TRUE(fs::exists(tree / "a:b"));
    EXPECT_NE(err.str().find("--replace-char requires a value"), std::string::npos);
}

TEST_F(RenameCommandTest, ResolveOptionsMergesOverrides) {
    const auto call = parseTokens(tokenize({tree.string(), "--max-length", "40", "--follow-symlinks", "-v"}),
                                  renameFlags());
    const auto opts = resolveOptions(call);
    EXPECT_EQ(opts.root, tree);
    EXPECT_EQ(opts.scan.sanitize.maxLength, 40u);
    EXPECT_EQ(opts.scan.sanitize.mode, sn::sanitize::Mode::Unicode);
    EXPECT_TRUE(opts.scan.followSymlinks);
    EXPECT_TRUE(opts.verbose);
    EXPECT_FALSE(opts.write);
    EXPECT_FALSE(opts.logFile.has_value());
}

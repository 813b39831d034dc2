#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "cli_commands.hpp"

namespace fs = std::filesystem;
using namespace useless::cli;

class ConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            (std::string("useless_config_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path test_dir;

    fs::path writeFile(const fs::path& rel, const std::string& content) {
        fs::path filepath = test_dir / rel;
        fs::create_directories(filepath.parent_path());
        std::ofstream file(filepath);
        file << content;
        file.close();
        return filepath;
    }
};

TEST_F(ConfigTest, ParsesAllKeys) {
    auto path = writeFile("useless.json",
        R"({ "name": "demo", "entry": "main.upl", "seed": 42, "tick_ms": 5,
             "default_timeout_ms": 250, "mischief": true, "trace": false })");

    ProjectConfig cfg = parse_config(path.string());
    EXPECT_TRUE(cfg.is_valid);
    EXPECT_EQ(cfg.name, "demo");
    EXPECT_EQ(cfg.entry, "main.upl");
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 42u);
    EXPECT_EQ(cfg.tick_ms.value_or(0), 5u);
    EXPECT_EQ(cfg.default_timeout_ms.value_or(0), 250u);
    EXPECT_EQ(cfg.mischief.value_or(false), true);
    EXPECT_EQ(cfg.trace.value_or(true), false);
    EXPECT_EQ(fs::path(cfg.root), fs::absolute(test_dir));
}

TEST_F(ConfigTest, AllKeysAreOptional) {
    auto path = writeFile("useless.json", "{}");
    ProjectConfig cfg = parse_config(path.string());
    EXPECT_TRUE(cfg.is_valid);
    EXPECT_TRUE(cfg.entry.empty());
    EXPECT_FALSE(cfg.seed.has_value());
    EXPECT_FALSE(cfg.mischief.has_value());
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    auto path = writeFile("useless.json", "{ \"seed\": ");
    EXPECT_THROW(parse_config(path.string()), std::runtime_error);
}

TEST_F(ConfigTest, WrongTypesThrow) {
    auto a = writeFile("a/useless.json", R"({ "seed": "forty-two" })");
    auto b = writeFile("b/useless.json", R"({ "mischief": 1 })");
    auto c = writeFile("c/useless.json", R"({ "seed": -3 })");
    auto d = writeFile("d/useless.json", R"([1, 2, 3])");
    auto e = writeFile("e/useless.json", R"({ "entry": 7 })");
    EXPECT_THROW(parse_config(a.string()), std::runtime_error);
    EXPECT_THROW(parse_config(b.string()), std::runtime_error);
    EXPECT_THROW(parse_config(c.string()), std::runtime_error);
    EXPECT_THROW(parse_config(d.string()), std::runtime_error);
    EXPECT_THROW(parse_config(e.string()), std::runtime_error);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(parse_config((test_dir / "nope.json").string()), std::runtime_error);
}

TEST_F(ConfigTest, FindsConfigInParentDirectory) {
    writeFile("useless.json", R"({ "name": "outer" })");
    writeFile("src/deep/main.upl", "let x = 1;\n");

    auto found = find_and_parse_config((test_dir / "src" / "deep").string());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "outer");
    EXPECT_EQ(get_project_root((test_dir / "src").string()), fs::absolute(test_dir).string());
}

TEST_F(ConfigTest, CommandLineWins) {
    ProjectConfig project;
    project.seed = 1;
    project.tick_ms = 20;
    project.mischief = false;
    project.trace = true;

    CliOptions cli;
    cli.seed = 99;
    cli.mischief = true;

    RuntimeOptions opts = merge_options(cli, project);
    EXPECT_EQ(opts.seed.value_or(0), 99u);
    EXPECT_EQ(opts.tick_ms, 20u);
    EXPECT_EQ(opts.default_timeout_ms, 1000u);
    EXPECT_TRUE(opts.mischief);
    EXPECT_TRUE(opts.trace);
}

TEST_F(ConfigTest, DefaultsWithoutProject) {
    RuntimeOptions opts = merge_options(CliOptions(), std::nullopt);
    EXPECT_FALSE(opts.seed.has_value());
    EXPECT_EQ(opts.tick_ms, 10u);
    EXPECT_FALSE(opts.mischief);
    EXPECT_FALSE(opts.trace);
}

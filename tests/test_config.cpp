#include <gtest/gtest.h>
#include "oncourt/config.hpp"
#include <cstdlib>
#include <fstream>
#include <filesystem>

namespace {

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path test_env_path = "test_oncourt.env";

    void SetUp() override {
        ::unsetenv("ONCOURT_DATA_DIR");
        ::unsetenv("ONCOURT_FORMAT");
    }

    void TearDown() override {
        std::filesystem::remove(test_env_path);
        ::unsetenv("ONCOURT_DATA_DIR");
        ::unsetenv("ONCOURT_FORMAT");
    }

    void write_env(const std::string& content) {
        std::ofstream f(test_env_path);
        f << content;
    }
};

} // namespace

TEST_F(ConfigTest, ParsesKeyValueLines) {
    write_env("# local overrides\n\nONCOURT_DATA_DIR = /srv/nba \nONCOURT_FORMAT=\"csv\"\n");
    auto vars = oncourt::load_env(test_env_path);
    EXPECT_EQ(vars.size(), 2u);
    EXPECT_EQ(vars["ONCOURT_DATA_DIR"], "/srv/nba");
    EXPECT_EQ(vars["ONCOURT_FORMAT"], "csv");
}

TEST_F(ConfigTest, AcceptsExportPrefix) {
    write_env("export ONCOURT_FORMAT='json'\n");
    auto vars = oncourt::load_env(test_env_path);
    EXPECT_EQ(vars["ONCOURT_FORMAT"], "json");
}

TEST_F(ConfigTest, SkipsLinesWithoutKey) {
    write_env("=orphan\nnot a pair\nKEY=val\n");
    auto vars = oncourt::load_env(test_env_path);
    EXPECT_EQ(vars.size(), 1u);
    ::unsetenv("KEY");
}

TEST_F(ConfigTest, MissingFileReturnsEmpty) {
    EXPECT_TRUE(oncourt::load_env("nonexistent.env").empty());
}

TEST_F(ConfigTest, DoesNotOverwriteExistingEnv) {
    ::setenv("ONCOURT_DATA_DIR", "/from/shell", 1);
    write_env("ONCOURT_DATA_DIR=/from/file\n");
    oncourt::load_env(test_env_path);
    EXPECT_EQ(std::string(::getenv("ONCOURT_DATA_DIR")), "/from/shell");
}

TEST_F(ConfigTest, GetEnv) {
    ::setenv("ONCOURT_FORMAT", "table", 1);
    EXPECT_EQ(oncourt::get_env("ONCOURT_FORMAT"), "table");
    EXPECT_FALSE(oncourt::get_env("DEFINITELY_NOT_SET_12345").has_value());
}

TEST_F(ConfigTest, ParseFormat) {
    EXPECT_EQ(oncourt::parse_format("table"), oncourt::OutputFormat::Table);
    EXPECT_EQ(oncourt::parse_format("csv"), oncourt::OutputFormat::Csv);
    EXPECT_EQ(oncourt::parse_format("json"), oncourt::OutputFormat::Json);
    EXPECT_FALSE(oncourt::parse_format("JSON").has_value());
    EXPECT_FALSE(oncourt::parse_format("").has_value());
}

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    auto config = oncourt::config_from_env();
    EXPECT_EQ(config.data_dir, std::filesystem::path("data"));
    EXPECT_EQ(config.format, oncourt::OutputFormat::Table);
}

TEST_F(ConfigTest, EnvFileFeedsConfig) {
    write_env("ONCOURT_DATA_DIR=/srv/nba\nONCOURT_FORMAT=json\n");
    oncourt::load_env(test_env_path);
    auto config = oncourt::config_from_env();
    EXPECT_EQ(config.data_dir, std::filesystem::path("/srv/nba"));
    EXPECT_EQ(config.format, oncourt::OutputFormat::Json);
}

TEST_F(ConfigTest, UnknownFormatKeepsDefault) {
    ::setenv("ONCOURT_FORMAT", "xml", 1);
    ::setenv("ONCOURT_DATA_DIR", "", 1);
    auto config = oncourt::config_from_env();
    EXPECT_EQ(config.format, oncourt::OutputFormat::Table);
    EXPECT_EQ(config.data_dir, std::filesystem::path("data"));
}

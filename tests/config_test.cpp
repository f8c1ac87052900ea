#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>
#include "../src/core/config.hpp"

using namespace income_api;

namespace {

std::string write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() /
                (name + "_" + std::to_string(::getpid()));
    std::ofstream out(path);
    out << content;
    return path.string();
}

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("API_KEY");
        ::unsetenv("INCOME_API_TEST_VAR");
        ::unsetenv("INCOME_API_QUOTED");
    }
    void TearDown() override {
        ::unsetenv("API_KEY");
        ::unsetenv("INCOME_API_TEST_VAR");
        ::unsetenv("INCOME_API_QUOTED");
        for (const auto& p : files_) std::filesystem::remove(p);
    }
    std::string temp_file(const std::string& name, const std::string& content) {
        files_.push_back(write_temp(name, content));
        return files_.back();
    }
    std::vector<std::string> files_;
};

} // namespace

TEST_F(ConfigTest, DefaultsWhenFileMissing) {
    Config cfg;
    load_config(cfg, "/nonexistent/settings.json");
    EXPECT_EQ(cfg.services.port, 5000);
    EXPECT_EQ(cfg.services.bind_address, "0.0.0.0");
    EXPECT_EQ(cfg.upstream.base_url, "https://financialmodelingprep.com");
    EXPECT_TRUE(cfg.upstream.api_key.empty());
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST_F(ConfigTest, ReadsFileAndKeepsUnsetDefaults) {
    auto path = temp_file("settings.json", R"({
        // comments are allowed
        "services": {"port": 8080},
        "upstream": {"base_url": "http://127.0.0.1:9999", "api_key": "from-file"},
        "logging": {"level": "debug"}
    })");
    Config cfg;
    load_config(cfg, path);
    EXPECT_EQ(cfg.services.port, 8080);
    EXPECT_EQ(cfg.services.bind_address, "0.0.0.0");
    EXPECT_EQ(cfg.upstream.base_url, "http://127.0.0.1:9999");
    EXPECT_EQ(cfg.upstream.api_key, "from-file");
    EXPECT_EQ(cfg.logging.level, "debug");
}

TEST_F(ConfigTest, InvalidJsonThrows) {
    auto path = temp_file("broken.json", "{\"services\": ");
    Config cfg;
    EXPECT_THROW(load_config(cfg, path), nlohmann::json::parse_error);
}

TEST_F(ConfigTest, EnvironmentKeyOverridesFile) {
    Config cfg;
    cfg.upstream.api_key = "from-file";
    ::setenv("API_KEY", "from-env", 1);
    apply_env(cfg);
    EXPECT_EQ(cfg.upstream.api_key, "from-env");
}

TEST_F(ConfigTest, EmptyEnvironmentKeyIsIgnored) {
    Config cfg;
    cfg.upstream.api_key = "from-file";
    ::setenv("API_KEY", "", 1);
    apply_env(cfg);
    EXPECT_EQ(cfg.upstream.api_key, "from-file");
}

TEST_F(ConfigTest, DotenvSeedsEnvironment) {
    auto path = temp_file("dotenv", "# provider credentials\n"
                                    "API_KEY=abc123\n"
                                    "\n"
                                    "export INCOME_API_TEST_VAR = spaced \n"
                                    "INCOME_API_QUOTED=\"a b\"\n"
                                    "not a pair\n");
    EXPECT_EQ(load_dotenv(path), 3);
    EXPECT_STREQ(std::getenv("API_KEY"), "abc123");
    EXPECT_STREQ(std::getenv("INCOME_API_TEST_VAR"), "spaced");
    EXPECT_STREQ(std::getenv("INCOME_API_QUOTED"), "a b");

    Config cfg;
    apply_env(cfg);
    EXPECT_EQ(cfg.upstream.api_key, "abc123");
}

TEST_F(ConfigTest, DotenvDoesNotOverrideExisting) {
    ::setenv("API_KEY", "already-set", 1);
    auto path = temp_file("dotenv", "API_KEY=from-dotenv\n");
    EXPECT_EQ(load_dotenv(path), 0);
    EXPECT_STREQ(std::getenv("API_KEY"), "already-set");
}

TEST_F(ConfigTest, MissingDotenvIsNotAnError) {
    EXPECT_EQ(load_dotenv("/nonexistent/.env"), 0);
}

TEST_F(ConfigTest, KnownLogLevelsResolve) {
    EXPECT_EQ(log_level_from_string("debug"), spdlog::level::debug);
    EXPECT_EQ(log_level_from_string("warn"), spdlog::level::warn);
    EXPECT_EQ(log_level_from_string("off"), spdlog::level::off);
}

TEST_F(ConfigTest, UnknownLogLevelFallsBackToInfo) {
    EXPECT_EQ(log_level_from_string("verbose"), spdlog::level::info);
    EXPECT_EQ(log_level_from_string(""), spdlog::level::info);
}

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/config/settings.hpp"
#include "core/errors/pilot_errors.hpp"

namespace {

using deploypilot::core::config::ClientConfig;
using deploypilot::core::config::ServerConfig;
using deploypilot::core::config::apply_environment;
using deploypilot::core::config::env_value;
using deploypilot::core::config::load_env_file;
using deploypilot::core::errors::get_error;
using deploypilot::core::errors::get_value;
using deploypilot::core::errors::is_error;
using deploypilot::core::logging::LogLevel;

class TempEnvFile {
public:
    explicit TempEnvFile(const std::string& content) {
        path_ = std::filesystem::current_path() /
                (".tmp_settings_" + deploypilot::core::config::generate_token() + ".env");
        std::ofstream out(path_);
        out << content;
    }

    ~TempEnvFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Restores a variable to unset when the test ends.
class ScopedUnset {
public:
    explicit ScopedUnset(std::string key) : key_(std::move(key)) { unsetenv(key_.c_str()); }
    ~ScopedUnset() { unsetenv(key_.c_str()); }

private:
    std::string key_;
};

TEST(SettingsTest, MissingEnvFileIsInputError) {
    auto result = load_env_file(std::filesystem::current_path() / "__no_such_file__.env");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "env_file_not_found");
}

TEST(SettingsTest, LoadsKeyValueLines) {
    ScopedUnset a("DEPLOYPILOT_TEST_ALPHA");
    ScopedUnset b("DEPLOYPILOT_TEST_BETA");
    ScopedUnset c("DEPLOYPILOT_TEST_GAMMA");
    TempEnvFile file(
        "# comment\n"
        "\n"
        "DEPLOYPILOT_TEST_ALPHA=one\n"
        "export DEPLOYPILOT_TEST_BETA = \"two words\"\n"
        "DEPLOYPILOT_TEST_GAMMA='three'\n"
        "not a pair\n");

    auto result = load_env_file(file.path());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 3u);
    EXPECT_EQ(env_value("DEPLOYPILOT_TEST_ALPHA").value_or(""), "one");
    EXPECT_EQ(env_value("DEPLOYPILOT_TEST_BETA").value_or(""), "two words");
    EXPECT_EQ(env_value("DEPLOYPILOT_TEST_GAMMA").value_or(""), "three");
}

TEST(SettingsTest, ExistingEnvironmentWins) {
    ScopedUnset guard("DEPLOYPILOT_TEST_DELTA");
    setenv("DEPLOYPILOT_TEST_DELTA", "from-shell", 1);
    TempEnvFile file("DEPLOYPILOT_TEST_DELTA=from-file\n");

    auto result = load_env_file(file.path());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(env_value("DEPLOYPILOT_TEST_DELTA").value_or(""), "from-shell");
}

TEST(SettingsTest, EmptyVariableIsTreatedAsUnset) {
    ScopedUnset guard("DEPLOYPILOT_TEST_EMPTY");
    setenv("DEPLOYPILOT_TEST_EMPTY", "", 1);
    EXPECT_FALSE(env_value("DEPLOYPILOT_TEST_EMPTY").has_value());
}

TEST(SettingsTest, ClientEnvironmentOverlay) {
    ScopedUnset key("ANTHROPIC_API_KEY");
    ScopedUnset model("DEPLOYPILOT_MODEL");
    ScopedUnset level("DEPLOYPILOT_LOG_LEVEL");
    setenv("ANTHROPIC_API_KEY", "sk-test", 1);
    setenv("DEPLOYPILOT_MODEL", "claude-test", 1);
    setenv("DEPLOYPILOT_LOG_LEVEL", "warn", 1);

    ClientConfig config;
    apply_environment(config);
    EXPECT_EQ(config.api_key, "sk-test");
    EXPECT_EQ(config.model, "claude-test");
    EXPECT_EQ(config.log_level, LogLevel::WARN);
}

TEST(SettingsTest, ServerEnvironmentOverlay) {
    ScopedUnset compose("DEPLOYPILOT_COMPOSE_COMMAND");
    ScopedUnset level("DEPLOYPILOT_LOG_LEVEL");
    setenv("DEPLOYPILOT_COMPOSE_COMMAND", "docker-compose", 1);
    setenv("DEPLOYPILOT_LOG_LEVEL", "nonsense", 1);

    ServerConfig config;
    apply_environment(config);
    EXPECT_EQ(config.compose_command, "docker-compose");
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST(SettingsTest, DefaultsMatchDocumentedValues) {
    ServerConfig server;
    EXPECT_EQ(server.preview_grace_ms, 3000u);
    EXPECT_EQ(server.compose_command, "docker compose");

    ClientConfig client;
    EXPECT_EQ(client.max_tokens, 4000u);
    EXPECT_EQ(client.max_rounds, 10u);
    EXPECT_EQ(client.api_url, "https://api.anthropic.com/v1/messages");
}

}  // namespace

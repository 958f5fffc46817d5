#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/settings.hpp"
#include "core/errors/pilot_errors.hpp"

namespace {

using deploypilot::app::cli::ClientCommandLine;
using deploypilot::app::cli::ServerCommandLine;
using deploypilot::core::errors::ErrorCategory;
using deploypilot::core::errors::get_error;
using deploypilot::core::errors::get_value;
using deploypilot::core::errors::is_error;
using deploypilot::core::logging::LogLevel;

// Builds a mutable argv whose first entry is the program name.
class Argv {
public:
    Argv(const std::string& program, const std::vector<std::string>& tokens) {
        owned_.reserve(tokens.size() + 1);
        owned_.push_back(program);
        for (const auto& token : tokens) {
            owned_.push_back(token);
        }
        for (auto& arg : owned_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> owned_;
    std::vector<char*> pointers_;
};

deploypilot::core::errors::Result<ClientCommandLine> parse_client(
    const std::vector<std::string>& tokens) {
    Argv args("deploypilot_client", tokens);
    return deploypilot::app::cli::parse_client_command_line(args.argc(), args.argv());
}

deploypilot::core::errors::Result<ServerCommandLine> parse_server(
    const std::vector<std::string>& tokens) {
    Argv args("deploypilot_server", tokens);
    return deploypilot::app::cli::parse_server_command_line(args.argc(), args.argv());
}

TEST(CliParserTest, ClientFailsWhenServerMissing) {
    auto result = parse_client({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, ClientHelpSkipsRequiredFlags) {
    auto result = parse_client({"--help"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).show_help);
}

TEST(CliParserTest, FailsWhenArgumentUnknown) {
    auto result = parse_client({"--server", "srv.py", "--verbose"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_client({"--server"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenMaxTokensNotNumeric) {
    auto result = parse_client({"--server", "srv.py", "--max-tokens", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxRoundsHasTrailingCharacters) {
    auto result = parse_client({"--server", "srv.py", "--max-rounds", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxRoundsOutOfBounds) {
    auto result = parse_client({"--server", "srv.py", "--max-rounds", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenLogLevelUnknown) {
    auto result = parse_client({"--server", "srv.py", "--log-level", "chatty"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_value");
}

TEST(CliParserTest, FailsWhenArgsWithoutCall) {
    auto result = parse_client({"--server", "srv.py", "--args", "{}"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenArgsNotAnObject) {
    auto result = parse_client({"--server", "srv.py", "--call", "calculate", "--args", "[1, 2]"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_value");
}

TEST(CliParserTest, ParsesValidClientRequest) {
    auto result = parse_client({"--server", "build/deploypilot_server", "--model", "claude-test",
                                "--max-tokens", "512", "--max-rounds", "3", "--log-level",
                                "debug"});
    ASSERT_FALSE(is_error(result));

    const auto& cmd = get_value(result);
    EXPECT_EQ(cmd.server, "build/deploypilot_server");
    ASSERT_TRUE(cmd.model.has_value());
    EXPECT_EQ(cmd.model.value(), "claude-test");
    EXPECT_EQ(cmd.max_tokens.value_or(0), 512u);
    EXPECT_EQ(cmd.max_rounds.value_or(0), 3u);
    ASSERT_TRUE(cmd.log_level.has_value());
    EXPECT_EQ(cmd.log_level.value(), LogLevel::DEBUG);
    EXPECT_FALSE(cmd.call_tool.has_value());
}

TEST(CliParserTest, ParsesSingleToolCall) {
    auto result = parse_client({"--server", "srv", "--call", "calculate", "--args",
                                "{\"expression\": \"add(3, 4)\"}"});
    ASSERT_FALSE(is_error(result));

    const auto& cmd = get_value(result);
    ASSERT_TRUE(cmd.call_tool.has_value());
    EXPECT_EQ(cmd.call_tool.value(), "calculate");
    ASSERT_TRUE(cmd.call_arguments.has_value());
    EXPECT_EQ(cmd.call_arguments->at("expression"), "add(3, 4)");
}

TEST(CliParserTest, CallWithoutArgsDefaultsToEmptyObject) {
    auto result = parse_client({"--server", "srv", "--call", "get_time"});
    ASSERT_FALSE(is_error(result));
    const auto& cmd = get_value(result);
    ASSERT_TRUE(cmd.call_arguments.has_value());
    EXPECT_TRUE(cmd.call_arguments->is_object());
    EXPECT_TRUE(cmd.call_arguments->empty());
}

TEST(CliParserTest, ClientFlagsOverrideConfig) {
    auto result = parse_client({"--server", "srv", "--model", "m2", "--max-rounds", "4",
                                "--call", "get_time"});
    ASSERT_FALSE(is_error(result));

    deploypilot::core::config::ClientConfig config;
    config.model = "m1";
    deploypilot::app::cli::apply(get_value(result), config);
    EXPECT_EQ(config.server_command, "srv");
    EXPECT_EQ(config.model, "m2");
    EXPECT_EQ(config.max_rounds, 4u);
    EXPECT_EQ(config.max_tokens, 4000u);
    ASSERT_TRUE(config.call_tool.has_value());
    EXPECT_EQ(*config.call_tool, "get_time");
    EXPECT_EQ(config.call_arguments, "{}");
}

TEST(CliParserTest, ServerAcceptsNoArguments) {
    auto result = parse_server({});
    ASSERT_FALSE(is_error(result));
    const auto& cmd = get_value(result);
    EXPECT_FALSE(cmd.show_help);
    EXPECT_FALSE(cmd.log_level.has_value());
    EXPECT_FALSE(cmd.preview_grace_ms.has_value());
}

TEST(CliParserTest, ServerParsesTimings) {
    auto result = parse_server({"--preview-grace-ms", "0", "--stop-timeout-ms", "250"});
    ASSERT_FALSE(is_error(result));

    deploypilot::core::config::ServerConfig config;
    deploypilot::app::cli::apply(get_value(result), config);
    EXPECT_EQ(config.preview_grace_ms, 0u);
    EXPECT_EQ(config.stop_timeout_ms, 250u);
}

TEST(CliParserTest, ServerRejectsZeroStopTimeout) {
    auto result = parse_server({"--stop-timeout-ms", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, ServerRejectsClientFlags) {
    auto result = parse_server({"--server", "srv"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

}  // namespace

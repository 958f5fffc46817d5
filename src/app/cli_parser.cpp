#include "app/cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace deploypilot::app::cli {

    using namespace deploypilot::core::errors;
    using deploypilot::core::logging::LogLevel;

    namespace {

        // 1. Raw Options Structs (Internal only)
        struct RawServerOptions {
            std::optional<std::string> log_level;
            std::optional<std::string> env_file;
            std::optional<std::string> preview_grace_ms;
            std::optional<std::string> stop_timeout_ms;
            bool help = false;
        };

        struct RawClientOptions {
            std::optional<std::string> server;
            std::optional<std::string> log_level;
            std::optional<std::string> env_file;
            std::optional<std::string> model;
            std::optional<std::string> max_tokens;
            std::optional<std::string> max_rounds;
            std::optional<std::string> call;
            std::optional<std::string> args;
            bool help = false;
        };

        std::vector<std::string> collect_args(int argc, char* argv[]) {
            std::vector<std::string> args;
            for (int i = 1; i < argc; ++i) { // Skip program name
                args.push_back(argv[i]);
            }
            return args;
        }

        // Reads the value following a flag.
        std::optional<PilotError> take_value(const std::vector<std::string>& args, size_t& i,
                                             std::optional<std::string>& slot) {
            if (i + 1 < args.size()) {
                slot = args[++i];
                return std::nullopt;
            }
            return PilotError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
        }

        // Exception-free integer parsing with inclusive bounds
        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint32_t min, std::uint32_t max) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc() || ptr != end) {
                return PilotError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer",
                                  "Provide a non-negative integer."};
            }
            if (value < min || value > max) {
                return PilotError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

        Result<LogLevel> parse_level(const std::string& text) {
            const auto level = core::logging::parse_log_level(text);
            if (!level) {
                return PilotError{ErrorCategory::Input, "Invalid value for --log-level: " + text, "invalid_value",
                                  "Use one of debug, info, warn, error."};
            }
            return *level;
        }

    } // namespace

    Result<ServerCommandLine> parse_server_command_line(int argc, char* argv[]) {
        RawServerOptions raw;
        const std::vector<std::string> args = collect_args(argc, argv);

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<PilotError> missing;
            if (args[i] == "--log-level") {
                missing = take_value(args, i, raw.log_level);
            } else if (args[i] == "--env-file") {
                missing = take_value(args, i, raw.env_file);
            } else if (args[i] == "--preview-grace-ms") {
                missing = take_value(args, i, raw.preview_grace_ms);
            } else if (args[i] == "--stop-timeout-ms") {
                missing = take_value(args, i, raw.stop_timeout_ms);
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else {
                return PilotError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                  server_usage()};
            }
            if (missing) {
                return *missing;
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerCommandLine out;
        out.show_help = raw.help;
        if (raw.log_level) {
            auto level = parse_level(*raw.log_level);
            if (is_error(level)) return get_error(level);
            out.log_level = get_value(level);
        }
        if (raw.env_file) {
            out.env_file = std::filesystem::path(*raw.env_file);
        }
        if (raw.preview_grace_ms) {
            auto grace = parse_bounded("--preview-grace-ms", *raw.preview_grace_ms, 0, 600000);
            if (is_error(grace)) return get_error(grace);
            out.preview_grace_ms = get_value(grace);
        }
        if (raw.stop_timeout_ms) {
            auto timeout = parse_bounded("--stop-timeout-ms", *raw.stop_timeout_ms, 1, 600000);
            if (is_error(timeout)) return get_error(timeout);
            out.stop_timeout_ms = get_value(timeout);
        }
        return out;
    }

    Result<ClientCommandLine> parse_client_command_line(int argc, char* argv[]) {
        RawClientOptions raw;
        const std::vector<std::string> args = collect_args(argc, argv);

        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<PilotError> missing;
            if (args[i] == "--server") {
                missing = take_value(args, i, raw.server);
            } else if (args[i] == "--log-level") {
                missing = take_value(args, i, raw.log_level);
            } else if (args[i] == "--env-file") {
                missing = take_value(args, i, raw.env_file);
            } else if (args[i] == "--model") {
                missing = take_value(args, i, raw.model);
            } else if (args[i] == "--max-tokens") {
                missing = take_value(args, i, raw.max_tokens);
            } else if (args[i] == "--max-rounds") {
                missing = take_value(args, i, raw.max_rounds);
            } else if (args[i] == "--call") {
                missing = take_value(args, i, raw.call);
            } else if (args[i] == "--args") {
                missing = take_value(args, i, raw.args);
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else {
                return PilotError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument",
                                  client_usage()};
            }
            if (missing) {
                return *missing;
            }
        }

        ClientCommandLine out;
        out.show_help = raw.help;
        if (raw.help) {
            return out;
        }

        if (!raw.server.has_value() || raw.server->empty()) {
            return PilotError{ErrorCategory::Input, "Must provide --server", "missing_required_flag",
                              "Usage: deploypilot_client --server PATH"};
        }
        out.server = raw.server.value();

        if (raw.log_level) {
            auto level = parse_level(*raw.log_level);
            if (is_error(level)) return get_error(level);
            out.log_level = get_value(level);
        }
        if (raw.env_file) out.env_file = std::filesystem::path(*raw.env_file);
        if (raw.model) out.model = raw.model.value();

        if (raw.max_tokens) {
            auto tokens = parse_bounded("--max-tokens", *raw.max_tokens, 1, 200000);
            if (is_error(tokens)) return get_error(tokens);
            out.max_tokens = get_value(tokens);
        }
        if (raw.max_rounds) {
            auto rounds = parse_bounded("--max-rounds", *raw.max_rounds, 1, 100);
            if (is_error(rounds)) return get_error(rounds);
            out.max_rounds = get_value(rounds);
        }

        if (raw.args.has_value() && !raw.call.has_value()) {
            return PilotError{ErrorCategory::Input, "--args requires --call", "conflicting_flags"};
        }
        if (raw.call) {
            out.call_tool = raw.call.value();
            auto arguments = nlohmann::json::parse(raw.args.value_or("{}"), nullptr, false);
            if (!arguments.is_object()) {
                return PilotError{ErrorCategory::Input, "--args must be a JSON object", "invalid_value",
                                  "Example: --args '{\"expression\": \"add(3, 4)\"}'"};
            }
            out.call_arguments.emplace(std::move(arguments));
        }
        return out;
    }

    void apply(const ServerCommandLine& command_line, core::config::ServerConfig& config) {
        if (command_line.log_level) config.log_level = *command_line.log_level;
        if (command_line.env_file) config.env_file = *command_line.env_file;
        if (command_line.preview_grace_ms) config.preview_grace_ms = *command_line.preview_grace_ms;
        if (command_line.stop_timeout_ms) config.stop_timeout_ms = *command_line.stop_timeout_ms;
    }

    void apply(const ClientCommandLine& command_line, core::config::ClientConfig& config) {
        config.server_command = command_line.server;
        if (command_line.log_level) config.log_level = *command_line.log_level;
        if (command_line.env_file) config.env_file = *command_line.env_file;
        if (command_line.model) config.model = *command_line.model;
        if (command_line.max_tokens) config.max_tokens = *command_line.max_tokens;
        if (command_line.max_rounds) config.max_rounds = *command_line.max_rounds;
        if (command_line.call_tool) {
            config.call_tool = command_line.call_tool;
            config.call_arguments = command_line.call_arguments.value_or(nlohmann::json::object()).dump();
        }
    }

    std::string server_usage() {
        return "Usage: deploypilot_server [--log-level debug|info|warn|error] [--env-file PATH] "
               "[--preview-grace-ms N] [--stop-timeout-ms N]";
    }

    std::string client_usage() {
        return "Usage: deploypilot_client --server PATH [--log-level LEVEL] [--env-file PATH] "
               "[--model NAME] [--max-tokens N] [--max-rounds N] [--call TOOL [--args JSON]]";
    }

} // namespace deploypilot::app::cli

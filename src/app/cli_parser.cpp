#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace conductor::app::cli {

    using namespace conductor::core::errors;
    using conductor::protocol::Backend;
    using conductor::protocol::CliCommand;
    using conductor::protocol::RunRequest;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> topology;
        std::optional<std::string> input;
        std::optional<std::string> rounds;
        std::optional<std::string> catalog;
        std::optional<std::string> state_dir;
        std::optional<std::string> backend;
        std::optional<std::string> agent_command;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> run_id;
        std::optional<std::string> request_id;
        std::optional<std::string> verdict;
        std::optional<std::string> note;
        bool verbose = false;
    };

    const char* kUsage =
        "Usage: conductor_cli run --topology <sequential|human-in-the-loop|round-robin> "
        "--input \"...\" | status --run-id ID | decide --run-id ID --request-id ID "
        "--verdict <approve|reject|more-info> | cancel --run-id ID";

    std::optional<CliCommand> parse_command(const std::string& command) {
        if (command == "run") return CliCommand::Run;
        if (command == "status") return CliCommand::Status;
        if (command == "decide") return CliCommand::Decide;
        if (command == "cancel") return CliCommand::Cancel;
        return std::nullopt;
    }

    ConductorError not_applicable(const std::string& flag, const std::string& command) {
        return ConductorError{ErrorCategory::Input, flag + " does not apply to '" + command + "'",
                              "flag_not_applicable"};
    }

    } // namespace

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ConductorError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command_text = argv[1];
        const auto command = parse_command(command_text);
        if (!command.has_value()) {
            return ConductorError{ErrorCategory::Input, "Unknown command: " + command_text, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued_flags = {
            {"--topology", &raw.topology},
            {"--input", &raw.input},
            {"--rounds", &raw.rounds},
            {"--catalog", &raw.catalog},
            {"--state-dir", &raw.state_dir},
            {"--backend", &raw.backend},
            {"--agent-command", &raw.agent_command},
            {"--timeout-ms", &raw.timeout_ms},
            {"--run-id", &raw.run_id},
            {"--request-id", &raw.request_id},
            {"--verdict", &raw.verdict},
            {"--note", &raw.note}};

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, slot] : valued_flags) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return ConductorError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return ConductorError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        RunRequest req;
        req.command = command.value();
        req.verbose = raw.verbose;
        if (raw.state_dir) req.state_dir = std::filesystem::path(raw.state_dir.value());

        const bool runs_agents = req.command == CliCommand::Run || req.command == CliCommand::Decide;
        if (!runs_agents) {
            if (raw.backend) return not_applicable("--backend", command_text);
            if (raw.agent_command) return not_applicable("--agent-command", command_text);
            if (raw.timeout_ms) return not_applicable("--timeout-ms", command_text);
            if (raw.catalog) return not_applicable("--catalog", command_text);
        }
        if (req.command != CliCommand::Run) {
            if (raw.topology) return not_applicable("--topology", command_text);
            if (raw.input) return not_applicable("--input", command_text);
            if (raw.rounds) return not_applicable("--rounds", command_text);
        }
        if (req.command != CliCommand::Decide) {
            if (raw.request_id) return not_applicable("--request-id", command_text);
            if (raw.verdict) return not_applicable("--verdict", command_text);
            if (raw.note) return not_applicable("--note", command_text);
        }

        if (req.command == CliCommand::Run) {
            if (!raw.topology.has_value()) {
                return ConductorError{ErrorCategory::Input, "Must provide --topology", "missing_required_flag", kUsage};
            }
            if (!raw.input.has_value() || raw.input->empty()) {
                return ConductorError{ErrorCategory::Input, "Must provide a non-empty --input", "missing_required_flag"};
            }
            auto topology = conductor::protocol::parse_topology(raw.topology.value());
            if (is_error(topology)) {
                auto err = get_error(topology);
                err.category = ErrorCategory::Input;
                return err;
            }
            req.topology = get_value(topology);
            req.input = raw.input.value();
        } else if (!raw.run_id.has_value()) {
            return ConductorError{ErrorCategory::Input, "Must provide --run-id", "missing_required_flag"};
        } else {
            req.run_id = raw.run_id.value();
        }

        if (req.command == CliCommand::Run && raw.run_id) {
            return not_applicable("--run-id", command_text);
        }

        if (req.command == CliCommand::Decide) {
            if (!raw.request_id.has_value() || !raw.verdict.has_value()) {
                return ConductorError{ErrorCategory::Input, "decide needs --request-id and --verdict", "missing_required_flag"};
            }
            auto verdict = conductor::protocol::parse_verdict(raw.verdict.value());
            if (is_error(verdict)) {
                return get_error(verdict);
            }
            req.request_id = raw.request_id.value();
            req.verdict = get_value(verdict);
            req.note = raw.note;
        }

        // Exception-free integer parsing. Range checks on the round count
        // belong to the workflow runner.
        if (raw.rounds) {
            if (req.topology != conductor::protocol::Topology::RoundRobin) {
                return ConductorError{ErrorCategory::Input, "--rounds only applies to round-robin", "flag_not_applicable"};
            }
            int rounds = 0;
            const char* begin = raw.rounds->data();
            const char* end = raw.rounds->data() + raw.rounds->size();
            auto [ptr, ec] = std::from_chars(begin, end, rounds);
            if (ec != std::errc() || ptr != end) {
                return ConductorError{ErrorCategory::Input, "Invalid number for --rounds", "invalid_integer", "Provide a positive integer."};
            }
            req.round_count = rounds;
        }

        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return ConductorError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide milliseconds, 0 for no limit."};
            }
            req.timeout_ms = timeout;
        }

        if (raw.backend) {
            if (raw.backend.value() == "deterministic") {
                req.backend = Backend::Deterministic;
            } else if (raw.backend.value() == "command") {
                req.backend = Backend::Command;
            } else {
                return ConductorError{ErrorCategory::Input, "Unknown backend: " + raw.backend.value(), "unknown_backend", "Use deterministic or command."};
            }
        }
        if (req.backend == Backend::Command) {
            if (!raw.agent_command.has_value() || raw.agent_command->empty()) {
                return ConductorError{ErrorCategory::Input, "--backend command needs --agent-command", "missing_required_flag"};
            }
            req.agent_command = raw.agent_command.value();
        } else if (raw.agent_command) {
            return ConductorError{ErrorCategory::Input, "--agent-command needs --backend command", "conflicting_flags"};
        }

        // Path validation
        if (raw.catalog) {
            std::filesystem::path p(raw.catalog.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return ConductorError{ErrorCategory::Input, "Catalog file does not exist: " + p.string(), "invalid_path"};
            }
            req.catalog_file = p;
        }

        return req;
    }

} // namespace conductor::app::cli

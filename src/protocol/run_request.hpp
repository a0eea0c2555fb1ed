#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "protocol/workflow_contract.hpp"

namespace conductor::protocol {

    enum class CliCommand {
        Run,
        Status,
        Decide,
        Cancel
    };

    enum class Backend {
        Deterministic,
        Command
    };

    // Validated command-line input. Fields only apply to the commands that
    // use them.
    struct RunRequest {
        CliCommand command = CliCommand::Run;

        // run
        Topology topology = Topology::Sequential;
        std::string input;
        std::optional<int> round_count;
        std::optional<std::filesystem::path> catalog_file;
        Backend backend = Backend::Deterministic;
        std::string agent_command;
        std::optional<std::uint32_t> timeout_ms;

        // status / decide / cancel
        std::string run_id;
        std::string request_id;
        Verdict verdict = Verdict::Approve;
        std::optional<std::string> note;

        std::filesystem::path state_dir = std::filesystem::current_path() / ".conductor_runs";
        bool verbose = false;
    };

} // namespace conductor::protocol

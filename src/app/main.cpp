#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/connection_settings.hpp"
#include "core/config/workflow_catalog.hpp"
#include "core/errors/conductor_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"
#include "protocol/run_request.hpp"
#include "protocol/workflow_contract.hpp"
#include "runtime/agent_invoker.hpp"
#include "runtime/command_agent_invoker.hpp"
#include "runtime/deterministic_agent_invoker.hpp"
#include "session/run_store.hpp"
#include "session/workflow_runner.hpp"

namespace {

using conductor::core::errors::ConductorError;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::protocol::CliCommand;
using conductor::protocol::RunStatus;

// Exit codes: 0 ok, 1 run failed, 2 input/invalid configuration,
// 3 configuration, 4 invalid transition, 6 persistence.
int exit_code_for(const ConductorError& err) {
    switch (err.category) {
        case ErrorCategory::Input:
        case ErrorCategory::InvalidConfiguration:
            return 2;
        case ErrorCategory::Configuration:
            return 3;
        case ErrorCategory::InvalidTransition:
            return 4;
        case ErrorCategory::Internal:
            return 6;
        default:
            return 1;
    }
}

int report(const ConductorError& err, const std::string& what) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return exit_code_for(err);
}

int print_snapshot(const conductor::protocol::WorkflowRunSnapshot& snapshot) {
    std::cout << conductor::protocol::to_json(snapshot).dump(
                     2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    LOG_INFO("Run " + snapshot.run_id + " is " + conductor::protocol::to_string(snapshot.status));
    if (snapshot.pending_request.has_value()) {
        LOG_INFO("Awaiting decision on request " + snapshot.pending_request->id + ": " +
                 snapshot.pending_request->prompt);
    }
    return snapshot.status == RunStatus::Failed ? 1 : 0;
}

conductor::core::errors::Result<std::shared_ptr<conductor::runtime::AgentInvoker>> make_invoker(
    const conductor::protocol::RunRequest& req) {
    if (req.backend == conductor::protocol::Backend::Deterministic) {
        return std::shared_ptr<conductor::runtime::AgentInvoker>(
            std::make_shared<conductor::runtime::DeterministicAgentInvoker>());
    }

    auto connection = conductor::core::config::load_connection_from_env();
    if (is_error(connection)) {
        return get_error(connection);
    }
    conductor::runtime::CommandInvokerOptions options;
    options.command = req.agent_command;
    options.connection = get_value(connection);
    return std::shared_ptr<conductor::runtime::AgentInvoker>(
        std::make_shared<conductor::runtime::CommandAgentInvoker>(options));
}

}  // namespace

int main(int argc, char* argv[]) {
    // Logs go to stderr so stdout carries only the run snapshot JSON.
    conductor::core::logging::Logger::get().set_stream(std::cerr);

    // 1. Parse CLI input and return normalized input errors
    auto parsed = conductor::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        return report(get_error(parsed), "Input error");
    }
    const auto& req = get_value(parsed);
    if (req.verbose) {
        conductor::core::logging::Logger::get().set_min_level(
            conductor::core::logging::LogLevel::DEBUG);
    }

    // 2. Configuration: catalog file or built-in line-ups
    auto catalog = req.catalog_file.has_value()
                       ? conductor::core::config::load_catalog(req.catalog_file.value())
                       : conductor::core::errors::Result<conductor::core::config::WorkflowCatalog>(
                             conductor::core::config::default_catalog());
    if (is_error(catalog)) {
        return report(get_error(catalog), "Configuration error");
    }

    conductor::session::RunnerOptions options;
    options.catalog = get_value(catalog);
    if (req.timeout_ms.has_value()) {
        options.catalog.timeout_ms = req.timeout_ms.value();
    }
    options.store = std::make_shared<conductor::session::RunStore>(req.state_dir);
    options.on_event = [](const conductor::protocol::WorkflowEvent& event) {
        LOG_DEBUG("event " + conductor::protocol::to_json(event).dump(
                                 -1, ' ', false, nlohmann::json::error_handler_t::replace));
    };

    // 3. Agent backend (only commands that drive agents need one)
    std::shared_ptr<conductor::runtime::AgentInvoker> invoker;
    if (req.command == CliCommand::Run || req.command == CliCommand::Decide) {
        auto made = make_invoker(req);
        if (is_error(made)) {
            return report(get_error(made), "Configuration error");
        }
        invoker = get_value(made);
    }

    conductor::session::WorkflowRunner runner(invoker, options);

    switch (req.command) {
        case CliCommand::Run: {
            conductor::protocol::StartOptions start_options;
            start_options.round_count = req.round_count;
            auto started = runner.start(req.topology, req.input, start_options);
            if (is_error(started)) {
                return report(get_error(started), "Failed to start run");
            }
            auto status = runner.get_status(get_value(started));
            if (is_error(status)) {
                return report(get_error(status), "Failed to fetch run status");
            }
            return print_snapshot(get_value(status));
        }
        case CliCommand::Status: {
            auto status = runner.get_status(req.run_id);
            if (is_error(status)) {
                return report(get_error(status), "Failed to fetch run status");
            }
            return print_snapshot(get_value(status));
        }
        case CliCommand::Decide: {
            auto decided = runner.submit_decision(req.run_id, req.request_id, req.verdict, req.note);
            if (is_error(decided)) {
                return report(get_error(decided), "Decision rejected");
            }
            return print_snapshot(get_value(decided));
        }
        case CliCommand::Cancel: {
            auto cancelled = runner.cancel(req.run_id);
            if (is_error(cancelled)) {
                return report(get_error(cancelled), "Cancel failed");
            }
            auto status = runner.get_status(req.run_id);
            if (is_error(status)) {
                return report(get_error(status), "Failed to fetch run status");
            }
            print_snapshot(get_value(status));
            return 0;
        }
    }
    return 2;
}

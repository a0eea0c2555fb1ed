#pragma once

#include <optional>
#include <string>
#include "core/errors/conductor_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "runtime/agent_executor.hpp"
#include "session/workflow_run.hpp"

namespace conductor::runtime {

// Shared plumbing for the orchestrators: one agent turn, status transitions
// and event emission. Holds no run state of its own.
class TurnDriver {
public:
    TurnDriver(const AgentExecutor& executor, protocol::EventSink sink,
               std::string component, session::Checkpoint checkpoint = {});

    // Invokes the agent against the current transcript, appends the reply and
    // checkpoints. The transcript is left untouched when the call fails.
    core::errors::Result<protocol::Message> take_turn(
        session::WorkflowRun& run, const protocol::AgentSpec& agent, int round = 0,
        const std::string& extra_instructions = "") const;

    // Runs each agent once, in order. Returns the first error, if any.
    std::optional<core::errors::ConductorError> run_segment(
        session::WorkflowRun& run, const protocol::AgentList& agents) const;

    std::optional<core::errors::ConductorError> checkpoint(
        const session::WorkflowRun& run) const;

    void transition(session::WorkflowRun& run, protocol::RunStatus next) const;
    void fail(session::WorkflowRun& run,
              const core::errors::ConductorError& error) const;
    void complete(session::WorkflowRun& run) const;

    void emit(const session::WorkflowRun& run, protocol::EventType type,
              const std::string& agent = "", int round = 0,
              const std::string& content = "") const;

private:
    const AgentExecutor& executor_;
    protocol::EventSink sink_;
    std::string component_;
    session::Checkpoint checkpoint_;
};

}  // namespace conductor::runtime

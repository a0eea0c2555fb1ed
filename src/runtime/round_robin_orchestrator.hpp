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

// Bounded discussion: round_count rounds over the participants in list
// order, then one synthesis turn. The run completes only after the
// synthesis message is appended.
class RoundRobinOrchestrator {
public:
    explicit RoundRobinOrchestrator(const AgentExecutor& executor,
                                    protocol::EventSink sink = {},
                                    session::Checkpoint checkpoint = {});

    // Rejects an empty participant list or round_count < 1.
    static std::optional<core::errors::ConductorError> validate(
        const protocol::WorkflowDefinition& definition);

    // Seed message content for the discussion. Returns the topic unchanged
    // when framing is disabled.
    static std::string frame_topic(const protocol::WorkflowDefinition& definition,
                                   const std::string& topic);

    // The explicit synthesis agent, or the last participant.
    static const protocol::AgentSpec& synthesis_agent(
        const protocol::WorkflowDefinition& definition);

    protocol::RunStatus run(session::WorkflowRun& run) const;

private:
    const AgentExecutor& executor_;
    protocol::EventSink sink_;
    session::Checkpoint checkpoint_;
};

}  // namespace conductor::runtime

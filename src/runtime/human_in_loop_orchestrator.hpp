#pragma once

#include <optional>
#include "core/errors/conductor_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "runtime/agent_executor.hpp"
#include "session/workflow_run.hpp"

namespace conductor::runtime {

// Pre-gate agents, then a durable pause (PAUSED_AWAITING_INPUT plus one
// PendingRequest), then the post-gate agents once a matching decision comes
// in. The pause is plain run state, so resume() may be called on a run that
// was reloaded from disk by another process.
class HumanInLoopOrchestrator {
public:
    static constexpr const char* kGateStep = "human-gate";
    static constexpr const char* kHumanAuthor = "human";

    explicit HumanInLoopOrchestrator(const AgentExecutor& executor,
                                     protocol::EventSink sink = {},
                                     session::Checkpoint checkpoint = {});

    static std::optional<core::errors::ConductorError> validate(
        const protocol::WorkflowDefinition& definition);

    // Runs the pre-gate segment and pauses. Errors returned here are caller
    // errors and leave the run untouched; agent failures are recorded on the
    // run instead.
    core::errors::Result<protocol::RunStatus> start(session::WorkflowRun& run) const;

    // Applies a decision to a paused run. A wrong request id, a run that is
    // not paused, or a decision that was already applied yields
    // InvalidTransition without mutating the run.
    core::errors::Result<protocol::RunStatus> resume(
        session::WorkflowRun& run, const protocol::HumanDecision& decision) const;

    static std::string render_decision(const protocol::HumanDecision& decision);

private:
    const AgentExecutor& executor_;
    protocol::EventSink sink_;
    session::Checkpoint checkpoint_;
};

}  // namespace conductor::runtime

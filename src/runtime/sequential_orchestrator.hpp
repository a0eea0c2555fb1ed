#pragma once

#include <optional>
#include "core/errors/conductor_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/workflow_contract.hpp"
#include "runtime/agent_executor.hpp"
#include "session/workflow_run.hpp"

namespace conductor::runtime {

// Fixed pipeline: every agent once, in list order, each seeing the full
// transcript so far. Fails fast on the first error.
class SequentialOrchestrator {
public:
    explicit SequentialOrchestrator(const AgentExecutor& executor,
                                    protocol::EventSink sink = {},
                                    session::Checkpoint checkpoint = {});

    static std::optional<core::errors::ConductorError> validate(
        const protocol::WorkflowDefinition& definition);

    // Expects the run to hold its initial input message. Returns the final
    // status; failures are recorded on the run, not returned.
    protocol::RunStatus run(session::WorkflowRun& run) const;

private:
    const AgentExecutor& executor_;
    protocol::EventSink sink_;
    session::Checkpoint checkpoint_;
};

}  // namespace conductor::runtime

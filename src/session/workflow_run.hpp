#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/conductor_errors.hpp"
#include "protocol/workflow_contract.hpp"
#include "session/conversation_state.hpp"

namespace conductor::session {

// Mutable state of one run. Owned by the WorkflowRunner registry and only
// modified by the orchestrator currently driving it.
struct WorkflowRun {
    std::string id;
    protocol::Topology topology = protocol::Topology::Sequential;
    protocol::RunStatus status = protocol::RunStatus::Running;
    ConversationState transcript;
    std::optional<protocol::PendingRequest> pending_request;
    std::optional<std::string> error;
    protocol::WorkflowDefinition definition;
    std::shared_ptr<std::atomic_bool> cancel_token =
        std::make_shared<std::atomic_bool>(false);

    protocol::WorkflowRunSnapshot snapshot() const {
        protocol::WorkflowRunSnapshot out;
        out.run_id = id;
        out.topology = topology;
        out.status = status;
        out.transcript = transcript.messages();
        out.pending_request = pending_request;
        out.error = error;
        return out;
    }
};

// Durably records the run's current state. Orchestrators call it at points
// that must survive a crash or be visible to other processes.
using Checkpoint =
    std::function<std::optional<core::errors::ConductorError>(const WorkflowRun&)>;

}  // namespace conductor::session

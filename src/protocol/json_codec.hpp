#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/conductor_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/workflow_contract.hpp"

namespace conductor::protocol {

// JSON forms shared by the run store, the workflow catalog, the command
// invoker and the CLI. Decoders report malformed input as errors of the
// given category instead of throwing.

nlohmann::json to_json(const Message& message);
nlohmann::json to_json(const AgentSpec& agent);
nlohmann::json to_json(const PendingRequest& request);
nlohmann::json to_json(const WorkflowDefinition& definition);
nlohmann::json to_json(const WorkflowRunSnapshot& snapshot);
nlohmann::json to_json(const WorkflowEvent& event);

core::errors::Result<Message> message_from_json(const nlohmann::json& payload);
core::errors::Result<AgentSpec> agent_from_json(
    const nlohmann::json& payload,
    core::errors::ErrorCategory category = core::errors::ErrorCategory::Internal);
core::errors::Result<AgentList> agents_from_json(
    const nlohmann::json& payload,
    core::errors::ErrorCategory category = core::errors::ErrorCategory::Internal);
core::errors::Result<PendingRequest> pending_request_from_json(
    const nlohmann::json& payload);
core::errors::Result<WorkflowDefinition> definition_from_json(
    const nlohmann::json& payload);
core::errors::Result<WorkflowRunSnapshot> snapshot_from_json(
    const nlohmann::json& payload);

}  // namespace conductor::protocol

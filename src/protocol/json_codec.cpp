#include "protocol/json_codec.hpp"

#include <string>
#include <utility>

namespace conductor::protocol {

using core::errors::ConductorError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

ConductorError malformed(const ErrorCategory category, const std::string& what) {
    return ConductorError{category, "Malformed JSON: " + what, "malformed_json"};
}

// Reads a required string member.
core::errors::Result<std::string> require_string(const json& payload,
                                                 const char* key,
                                                 const ErrorCategory category) {
    if (!payload.is_object()) {
        return malformed(category, "expected an object");
    }
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return malformed(category, std::string("missing string field '") + key + "'");
    }
    return it->get<std::string>();
}

std::string optional_string(const json& payload, const char* key) {
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

json to_json(const Message& message) {
    json payload;
    payload["index"] = message.index;
    payload["author"] = message.author;
    payload["role"] = to_string(message.role);
    payload["content"] = message.content;
    return payload;
}

json to_json(const AgentSpec& agent) {
    json payload;
    payload["name"] = agent.name;
    payload["role_description"] = agent.role_description;
    payload["instructions"] = agent.instructions;
    return payload;
}

json to_json(const PendingRequest& request) {
    json payload;
    payload["id"] = request.id;
    payload["step"] = request.step;
    payload["prompt"] = request.prompt;
    payload["options"] = request.options;
    payload["analysis_summary"] = request.analysis_summary;
    payload["created_at"] = request.created_at_unix_ms;
    return payload;
}

json to_json(const WorkflowDefinition& definition) {
    json payload;
    payload["agents"] = json::array();
    for (const auto& agent : definition.agents) {
        payload["agents"].push_back(to_json(agent));
    }
    payload["post_gate_agents"] = json::array();
    for (const auto& agent : definition.post_gate_agents) {
        payload["post_gate_agents"].push_back(to_json(agent));
    }
    payload["gate_prompt"] = definition.gate_prompt;
    payload["synthesis_agent"] = definition.synthesis_agent.has_value()
                                     ? to_json(definition.synthesis_agent.value())
                                     : json(nullptr);
    payload["synthesis_prompt"] = definition.synthesis_prompt;
    payload["round_count"] = definition.round_count;
    payload["frame_topic"] = definition.frame_topic;
    return payload;
}

json to_json(const WorkflowRunSnapshot& snapshot) {
    json payload;
    payload["run_id"] = snapshot.run_id;
    payload["topology"] = to_string(snapshot.topology);
    payload["status"] = to_string(snapshot.status);
    payload["transcript"] = json::array();
    for (const auto& message : snapshot.transcript) {
        payload["transcript"].push_back(to_json(message));
    }
    if (snapshot.pending_request.has_value()) {
        payload["pending_request"] = to_json(snapshot.pending_request.value());
    }
    if (snapshot.error.has_value()) {
        payload["error"] = snapshot.error.value();
    }
    return payload;
}

json to_json(const WorkflowEvent& event) {
    json payload;
    payload["run_id"] = event.run_id;
    payload["type"] = to_string(event.type);
    payload["agent"] = event.agent;
    payload["round"] = event.round;
    payload["content"] = event.content;
    return payload;
}

core::errors::Result<Message> message_from_json(const json& payload) {
    const auto category = ErrorCategory::Internal;
    auto author = require_string(payload, "author", category);
    if (core::errors::is_error(author)) {
        return core::errors::get_error(author);
    }
    auto content = require_string(payload, "content", category);
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }
    const auto index = payload.find("index");
    if (index == payload.end() || !index->is_number_unsigned()) {
        return malformed(category, "message index must be a non-negative integer");
    }

    Message message;
    message.index = index->get<std::uint64_t>();
    message.author = core::errors::get_value(author);
    message.content = core::errors::get_value(content);

    const std::string role_text = optional_string(payload, "role");
    if (role_text.empty()) {
        message.role = message.index == 0 ? Role::User : Role::Agent;
    } else {
        const auto role = role_from_string(role_text);
        if (!role.has_value()) {
            return malformed(category, "unknown role '" + role_text + "'");
        }
        message.role = role.value();
    }
    return message;
}

core::errors::Result<AgentSpec> agent_from_json(const json& payload,
                                                const ErrorCategory category) {
    auto name = require_string(payload, "name", category);
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }
    if (core::errors::get_value(name).empty()) {
        return malformed(category, "agent name cannot be empty");
    }

    AgentSpec agent;
    agent.name = core::errors::get_value(name);
    agent.role_description = optional_string(payload, "role_description");
    agent.instructions = optional_string(payload, "instructions");
    return agent;
}

core::errors::Result<AgentList> agents_from_json(const json& payload,
                                                 const ErrorCategory category) {
    if (!payload.is_array()) {
        return malformed(category, "agent list must be an array");
    }
    AgentList agents;
    for (const auto& entry : payload) {
        auto agent = agent_from_json(entry, category);
        if (core::errors::is_error(agent)) {
            return core::errors::get_error(agent);
        }
        agents.push_back(core::errors::get_value(agent));
    }
    return agents;
}

core::errors::Result<PendingRequest> pending_request_from_json(const json& payload) {
    const auto category = ErrorCategory::Internal;
    auto id = require_string(payload, "id", category);
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }

    PendingRequest request;
    request.id = core::errors::get_value(id);
    request.step = optional_string(payload, "step");
    request.prompt = optional_string(payload, "prompt");
    request.analysis_summary = optional_string(payload, "analysis_summary");
    const auto options = payload.find("options");
    if (options != payload.end()) {
        if (!options->is_array()) {
            return malformed(category, "pending_request.options must be an array");
        }
        for (const auto& option : *options) {
            if (!option.is_string()) {
                return malformed(category, "pending_request.options must hold strings");
            }
            request.options.push_back(option.get<std::string>());
        }
    }
    const auto created = payload.find("created_at");
    if (created != payload.end() && created->is_number_integer()) {
        request.created_at_unix_ms = created->get<std::int64_t>();
    }
    return request;
}

core::errors::Result<WorkflowDefinition> definition_from_json(const json& payload) {
    const auto category = ErrorCategory::Internal;
    if (!payload.is_object()) {
        return malformed(category, "definition must be an object");
    }

    WorkflowDefinition definition;
    if (payload.contains("agents")) {
        auto agents = agents_from_json(payload.at("agents"), category);
        if (core::errors::is_error(agents)) {
            return core::errors::get_error(agents);
        }
        definition.agents = core::errors::get_value(agents);
    }
    if (payload.contains("post_gate_agents")) {
        auto agents = agents_from_json(payload.at("post_gate_agents"), category);
        if (core::errors::is_error(agents)) {
            return core::errors::get_error(agents);
        }
        definition.post_gate_agents = core::errors::get_value(agents);
    }
    if (payload.contains("synthesis_agent") && !payload.at("synthesis_agent").is_null()) {
        auto agent = agent_from_json(payload.at("synthesis_agent"), category);
        if (core::errors::is_error(agent)) {
            return core::errors::get_error(agent);
        }
        definition.synthesis_agent = core::errors::get_value(agent);
    }
    if (payload.contains("gate_prompt")) {
        definition.gate_prompt = optional_string(payload, "gate_prompt");
    }
    definition.synthesis_prompt = optional_string(payload, "synthesis_prompt");
    const auto rounds = payload.find("round_count");
    if (rounds != payload.end()) {
        if (!rounds->is_number_integer()) {
            return malformed(category, "round_count must be an integer");
        }
        definition.round_count = rounds->get<int>();
    }
    const auto frame = payload.find("frame_topic");
    if (frame != payload.end() && frame->is_boolean()) {
        definition.frame_topic = frame->get<bool>();
    }
    return definition;
}

core::errors::Result<WorkflowRunSnapshot> snapshot_from_json(const json& payload) {
    const auto category = ErrorCategory::Internal;
    auto run_id = require_string(payload, "run_id", category);
    if (core::errors::is_error(run_id)) {
        return core::errors::get_error(run_id);
    }
    auto topology_text = require_string(payload, "topology", category);
    if (core::errors::is_error(topology_text)) {
        return core::errors::get_error(topology_text);
    }
    auto status_text = require_string(payload, "status", category);
    if (core::errors::is_error(status_text)) {
        return core::errors::get_error(status_text);
    }

    auto topology = parse_topology(core::errors::get_value(topology_text));
    if (core::errors::is_error(topology)) {
        return malformed(category, core::errors::get_error(topology).message);
    }
    auto status = parse_run_status(core::errors::get_value(status_text));
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }

    WorkflowRunSnapshot snapshot;
    snapshot.run_id = core::errors::get_value(run_id);
    snapshot.topology = core::errors::get_value(topology);
    snapshot.status = core::errors::get_value(status);

    const auto transcript = payload.find("transcript");
    if (transcript == payload.end() || !transcript->is_array()) {
        return malformed(category, "transcript must be an array");
    }
    for (const auto& entry : *transcript) {
        auto message = message_from_json(entry);
        if (core::errors::is_error(message)) {
            return core::errors::get_error(message);
        }
        snapshot.transcript.push_back(core::errors::get_value(message));
    }

    const auto pending = payload.find("pending_request");
    if (pending != payload.end() && !pending->is_null()) {
        auto request = pending_request_from_json(*pending);
        if (core::errors::is_error(request)) {
            return core::errors::get_error(request);
        }
        snapshot.pending_request = core::errors::get_value(request);
    }

    const auto error = payload.find("error");
    if (error != payload.end() && error->is_string()) {
        snapshot.error = error->get<std::string>();
    }
    return snapshot;
}

}  // namespace conductor::protocol

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/conductor_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/message_contract.hpp"

namespace conductor::protocol {

enum class Topology {
    Sequential,
    HumanInLoop,
    RoundRobin
};

enum class RunStatus {
    Running,
    PausedAwaitingInput,
    Completed,
    Failed
};

enum class Verdict {
    Approve,
    Reject,
    MoreInfo
};

struct PendingRequest {
    std::string id;
    std::string step;
    std::string prompt;
    // Verdicts the caller may submit, rendered with to_string(Verdict).
    std::vector<std::string> options;
    // Last pre-gate message, so a form can be drawn from the status alone.
    std::string analysis_summary;
    std::int64_t created_at_unix_ms = 0;
};

struct HumanDecision {
    std::string request_id;
    Verdict verdict = Verdict::Approve;
    std::optional<std::string> note;
};

// Everything an orchestrator needs to drive (or later resume) one run.
struct WorkflowDefinition {
    // Sequential: the pipeline. Human-in-the-loop: the pre-gate segment.
    // Round-robin: the discussion participants.
    AgentList agents;
    AgentList post_gate_agents;
    std::string gate_prompt =
        "Please review the analysis above and provide your decision.";
    std::optional<AgentSpec> synthesis_agent;
    std::string synthesis_prompt;
    int round_count = 1;
    bool frame_topic = true;
};

struct StartOptions {
    std::optional<int> round_count;
};

struct WorkflowRunSnapshot {
    std::string run_id;
    Topology topology = Topology::Sequential;
    RunStatus status = RunStatus::Running;
    std::vector<Message> transcript;
    std::optional<PendingRequest> pending_request;
    std::optional<std::string> error;
};

inline bool is_terminal(const RunStatus status) {
    return status == RunStatus::Completed || status == RunStatus::Failed;
}

inline std::string to_string(const Topology topology) {
    switch (topology) {
        case Topology::Sequential:
            return "sequential";
        case Topology::HumanInLoop:
            return "human-in-the-loop";
        case Topology::RoundRobin:
            return "round-robin";
        default:
            return "unknown";
    }
}

inline std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Running:
            return "RUNNING";
        case RunStatus::PausedAwaitingInput:
            return "PAUSED_AWAITING_INPUT";
        case RunStatus::Completed:
            return "COMPLETED";
        case RunStatus::Failed:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

inline std::string to_string(const Verdict verdict) {
    switch (verdict) {
        case Verdict::Approve:
            return "APPROVE";
        case Verdict::Reject:
            return "REJECT";
        case Verdict::MoreInfo:
            return "MORE_INFO";
        default:
            return "UNKNOWN";
    }
}

inline core::errors::Result<Topology> parse_topology(const std::string& value) {
    if (value == "sequential") return Topology::Sequential;
    if (value == "human-in-the-loop" || value == "hitl") return Topology::HumanInLoop;
    if (value == "round-robin" || value == "group-chat") return Topology::RoundRobin;
    return core::errors::ConductorError{
        core::errors::ErrorCategory::InvalidConfiguration,
        "Unknown topology: " + value, "unknown_topology",
        "Use sequential, human-in-the-loop or round-robin."};
}

inline core::errors::Result<RunStatus> parse_run_status(const std::string& value) {
    if (value == "RUNNING") return RunStatus::Running;
    if (value == "PAUSED_AWAITING_INPUT") return RunStatus::PausedAwaitingInput;
    if (value == "COMPLETED") return RunStatus::Completed;
    if (value == "FAILED") return RunStatus::Failed;
    return core::errors::ConductorError{core::errors::ErrorCategory::Internal,
                                        "Unknown run status: " + value,
                                        "invalid_run_status"};
}

// Accepts both the wire form (APPROVE) and the CLI form (approve, more-info).
inline core::errors::Result<Verdict> parse_verdict(const std::string& value) {
    if (value == "APPROVE" || value == "approve") return Verdict::Approve;
    if (value == "REJECT" || value == "reject") return Verdict::Reject;
    if (value == "MORE_INFO" || value == "more-info" || value == "more_info") {
        return Verdict::MoreInfo;
    }
    return core::errors::ConductorError{
        core::errors::ErrorCategory::Input, "Unknown verdict: " + value,
        "invalid_verdict", "Use approve, reject or more-info."};
}

}  // namespace conductor::protocol

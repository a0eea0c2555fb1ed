#include "runtime/human_in_loop_orchestrator.hpp"

#include <chrono>
#include <utility>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "runtime/turn_driver.hpp"

namespace conductor::runtime {

using core::errors::ConductorError;
using core::errors::ErrorCategory;
using protocol::EventType;
using protocol::RunStatus;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               now.time_since_epoch())
        .count();
}

}  // namespace

HumanInLoopOrchestrator::HumanInLoopOrchestrator(const AgentExecutor& executor,
                                                 protocol::EventSink sink,
                                                 session::Checkpoint checkpoint)
    : executor_(executor), sink_(std::move(sink)), checkpoint_(std::move(checkpoint)) {}

std::optional<ConductorError> HumanInLoopOrchestrator::validate(
    const protocol::WorkflowDefinition& definition) {
    if (definition.agents.empty()) {
        return ConductorError{ErrorCategory::InvalidConfiguration,
                              "Human-in-the-loop workflow needs a pre-gate agent.",
                              "empty_agent_list"};
    }
    if (definition.post_gate_agents.empty()) {
        return ConductorError{ErrorCategory::InvalidConfiguration,
                              "Human-in-the-loop workflow needs a post-gate agent.",
                              "empty_agent_list"};
    }
    return std::nullopt;
}

std::string HumanInLoopOrchestrator::render_decision(
    const protocol::HumanDecision& decision) {
    std::string text = "Manager decision: " + protocol::to_string(decision.verdict);
    if (decision.note.has_value() && !decision.note->empty()) {
        text += " - " + decision.note.value();
    }
    return text;
}

core::errors::Result<RunStatus> HumanInLoopOrchestrator::start(
    session::WorkflowRun& run) const {
    if (run.pending_request.has_value()) {
        return ConductorError{ErrorCategory::InvalidConfiguration,
                              "Run " + run.id + " already has pending request " +
                                  run.pending_request->id + ".",
                              "pending_request_exists"};
    }
    if (run.status != RunStatus::Running) {
        return ConductorError{ErrorCategory::InvalidTransition,
                              "Run " + run.id + " cannot start from " +
                                  protocol::to_string(run.status) + ".",
                              "invalid_state_transition"};
    }
    if (auto invalid = validate(run.definition)) {
        return *invalid;
    }

    const TurnDriver driver(executor_, sink_, "HumanInLoopOrchestrator", checkpoint_);
    if (auto error = driver.run_segment(run, run.definition.agents)) {
        driver.fail(run, *error);
        return run.status;
    }

    if (run.cancel_token && run.cancel_token->load()) {
        driver.fail(run, ConductorError{ErrorCategory::Cancelled,
                                        "Run cancelled before the gate.",
                                        "run_cancelled"});
        return run.status;
    }

    protocol::PendingRequest request;
    request.id = core::config::generate_request_id();
    request.step = kGateStep;
    request.prompt = run.definition.gate_prompt;
    request.options = {protocol::to_string(protocol::Verdict::Approve),
                       protocol::to_string(protocol::Verdict::Reject),
                       protocol::to_string(protocol::Verdict::MoreInfo)};
    const auto& messages = run.transcript.messages();
    if (!messages.empty()) {
        request.analysis_summary = messages.back().content;
    }
    request.created_at_unix_ms = now_unix_ms();
    run.pending_request = request;
    driver.transition(run, RunStatus::PausedAwaitingInput);
    driver.emit(run, EventType::Paused, kGateStep, 0, request.prompt);
    return run.status;
}

core::errors::Result<RunStatus> HumanInLoopOrchestrator::resume(
    session::WorkflowRun& run, const protocol::HumanDecision& decision) const {
    if (protocol::is_terminal(run.status)) {
        return ConductorError{ErrorCategory::InvalidTransition,
                              "Run " + run.id + " is already " +
                                  protocol::to_string(run.status) + ".",
                              "run_terminal"};
    }
    if (run.status != RunStatus::PausedAwaitingInput ||
        !run.pending_request.has_value()) {
        return ConductorError{ErrorCategory::InvalidTransition,
                              "Run " + run.id + " is not awaiting input.",
                              "run_not_paused"};
    }
    if (run.pending_request->id != decision.request_id) {
        return ConductorError{ErrorCategory::InvalidTransition,
                              "Request id " + decision.request_id +
                                  " does not match pending request " +
                                  run.pending_request->id + ".",
                              "request_id_mismatch",
                              "Fetch the run status for the current request id."};
    }

    const TurnDriver driver(executor_, sink_, "HumanInLoopOrchestrator", checkpoint_);
    const std::string decision_text = render_decision(decision);
    auto appended =
        run.transcript.append(kHumanAuthor, protocol::Role::Human, decision_text);
    if (core::errors::is_error(appended)) {
        return core::errors::get_error(appended);
    }
    run.pending_request.reset();
    driver.transition(run, RunStatus::Running);
    // The consumed decision must be on disk before any post-gate agent runs,
    // otherwise another process could still accept the same request id.
    if (auto error = driver.checkpoint(run)) {
        driver.fail(run, *error);
        return run.status;
    }
    driver.emit(run, EventType::Decision, kHumanAuthor, 0, decision_text);

    if (auto error = driver.run_segment(run, run.definition.post_gate_agents)) {
        driver.fail(run, *error);
        return run.status;
    }

    driver.complete(run);
    return run.status;
}

}  // namespace conductor::runtime

#include "runtime/round_robin_orchestrator.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/turn_driver.hpp"

namespace conductor::runtime {

using core::errors::ConductorError;
using core::errors::ErrorCategory;
using protocol::RunStatus;

RoundRobinOrchestrator::RoundRobinOrchestrator(const AgentExecutor& executor,
                                               protocol::EventSink sink,
                                               session::Checkpoint checkpoint)
    : executor_(executor), sink_(std::move(sink)), checkpoint_(std::move(checkpoint)) {}

std::optional<ConductorError> RoundRobinOrchestrator::validate(
    const protocol::WorkflowDefinition& definition) {
    if (definition.agents.empty()) {
        return ConductorError{ErrorCategory::InvalidConfiguration,
                              "Round-robin workflow needs at least one participant.",
                              "empty_agent_list"};
    }
    if (definition.round_count < 1) {
        return ConductorError{ErrorCategory::InvalidConfiguration,
                              "Round count must be at least 1, got " +
                                  std::to_string(definition.round_count) + ".",
                              "invalid_round_count", "Pass --rounds 1 or more."};
    }
    return std::nullopt;
}

std::string RoundRobinOrchestrator::frame_topic(
    const protocol::WorkflowDefinition& definition, const std::string& topic) {
    if (!definition.frame_topic) {
        return topic;
    }

    std::string participants;
    for (const auto& agent : definition.agents) {
        if (!participants.empty()) {
            participants += ", ";
        }
        participants += agent.name;
    }
    return "You are in a group brainstorming meeting. The topic is:\n\n" + topic +
           "\n\nParticipants: " + participants +
           ". Please contribute your perspective concisely. "
           "Build on what others have said.";
}

const protocol::AgentSpec& RoundRobinOrchestrator::synthesis_agent(
    const protocol::WorkflowDefinition& definition) {
    if (definition.synthesis_agent.has_value()) {
        return definition.synthesis_agent.value();
    }
    return definition.agents.back();
}

RunStatus RoundRobinOrchestrator::run(session::WorkflowRun& run) const {
    const TurnDriver driver(executor_, sink_, "RoundRobinOrchestrator", checkpoint_);
    if (run.status != RunStatus::Running) {
        LOG_WARN("RoundRobinOrchestrator: run " + run.id + " is " +
                 protocol::to_string(run.status) + ", nothing to do");
        return run.status;
    }

    if (auto invalid = validate(run.definition)) {
        driver.fail(run, *invalid);
        return run.status;
    }

    const auto& participants = run.definition.agents;
    for (int round = 1; round <= run.definition.round_count; ++round) {
        LOG_DEBUG("RoundRobinOrchestrator: run " + run.id + " round " +
                  std::to_string(round) + "/" +
                  std::to_string(run.definition.round_count));
        for (const auto& agent : participants) {
            auto turn = driver.take_turn(run, agent, round);
            if (core::errors::is_error(turn)) {
                driver.fail(run, core::errors::get_error(turn));
                return run.status;
            }
        }
    }

    const auto& synthesizer = synthesis_agent(run.definition);
    auto synthesis = driver.take_turn(run, synthesizer, 0,
                                      run.definition.synthesis_prompt);
    if (core::errors::is_error(synthesis)) {
        driver.fail(run, core::errors::get_error(synthesis));
        return run.status;
    }

    driver.complete(run);
    return run.status;
}

}  // namespace conductor::runtime

#include "runtime/sequential_orchestrator.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/turn_driver.hpp"

namespace conductor::runtime {

using core::errors::ConductorError;
using core::errors::ErrorCategory;
using protocol::RunStatus;

SequentialOrchestrator::SequentialOrchestrator(const AgentExecutor& executor,
                                               protocol::EventSink sink,
                                               session::Checkpoint checkpoint)
    : executor_(executor), sink_(std::move(sink)), checkpoint_(std::move(checkpoint)) {}

std::optional<ConductorError> SequentialOrchestrator::validate(
    const protocol::WorkflowDefinition& definition) {
    if (definition.agents.empty()) {
        return ConductorError{ErrorCategory::InvalidConfiguration,
                              "Sequential workflow needs at least one agent.",
                              "empty_agent_list"};
    }
    return std::nullopt;
}

RunStatus SequentialOrchestrator::run(session::WorkflowRun& run) const {
    const TurnDriver driver(executor_, sink_, "SequentialOrchestrator", checkpoint_);
    if (run.status != RunStatus::Running) {
        LOG_WARN("SequentialOrchestrator: run " + run.id + " is " +
                 protocol::to_string(run.status) + ", nothing to do");
        return run.status;
    }

    if (auto invalid = validate(run.definition)) {
        driver.fail(run, *invalid);
        return run.status;
    }

    if (auto error = driver.run_segment(run, run.definition.agents)) {
        driver.fail(run, *error);
        return run.status;
    }

    driver.complete(run);
    return run.status;
}

}  // namespace conductor::runtime

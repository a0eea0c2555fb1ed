#include "runtime/turn_driver.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace conductor::runtime {

using core::errors::ConductorError;
using protocol::EventType;
using protocol::RunStatus;

TurnDriver::TurnDriver(const AgentExecutor& executor, protocol::EventSink sink,
                       std::string component, session::Checkpoint checkpoint)
    : executor_(executor),
      sink_(std::move(sink)),
      component_(std::move(component)),
      checkpoint_(std::move(checkpoint)) {}

std::optional<ConductorError> TurnDriver::checkpoint(const session::WorkflowRun& run) const {
    if (!checkpoint_) {
        return std::nullopt;
    }
    return checkpoint_(run);
}

core::errors::Result<protocol::Message> TurnDriver::take_turn(
    session::WorkflowRun& run, const protocol::AgentSpec& agent, const int round,
    const std::string& extra_instructions) const {
    auto reply = executor_.invoke(agent, run.transcript.snapshot(), run.cancel_token,
                                  extra_instructions);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }

    auto appended = run.transcript.append(core::errors::get_value(reply));
    if (core::errors::is_error(appended)) {
        return core::errors::get_error(appended);
    }

    const auto message = core::errors::get_value(appended);
    LOG_INFO(component_ + ": " + agent.name + " appended message #" +
             std::to_string(message.index));
    if (auto error = checkpoint(run)) {
        return *error;
    }
    emit(run, EventType::Turn, agent.name, round, message.content);
    return message;
}

std::optional<ConductorError> TurnDriver::run_segment(
    session::WorkflowRun& run, const protocol::AgentList& agents) const {
    for (const auto& agent : agents) {
        auto turn = take_turn(run, agent);
        if (core::errors::is_error(turn)) {
            return core::errors::get_error(turn);
        }
    }
    return std::nullopt;
}

void TurnDriver::transition(session::WorkflowRun& run, const RunStatus next) const {
    const std::string prev = protocol::to_string(run.status);
    run.status = next;
    if (protocol::is_terminal(next)) {
        run.pending_request.reset();
        run.transcript.seal();
    }
    LOG_INFO(component_ + ": run " + run.id + " transition " + prev + " -> " +
             protocol::to_string(next));
}

void TurnDriver::fail(session::WorkflowRun& run, const ConductorError& error) const {
    if (protocol::is_terminal(run.status)) {
        return;
    }
    run.error = error.category == core::errors::ErrorCategory::Cancelled
                    ? std::string("cancelled")
                    : core::errors::format_error(error);
    LOG_ERROR(component_ + ": run " + run.id + " failed " +
              core::errors::format_error(error));
    transition(run, RunStatus::Failed);
    emit(run, EventType::Failed, "", 0, *run.error);
}

void TurnDriver::complete(session::WorkflowRun& run) const {
    transition(run, RunStatus::Completed);
    const auto& messages = run.transcript.messages();
    emit(run, EventType::Completed, messages.empty() ? "" : messages.back().author, 0,
         messages.empty() ? "" : messages.back().content);
}

void TurnDriver::emit(const session::WorkflowRun& run, const EventType type,
                      const std::string& agent, const int round,
                      const std::string& content) const {
    if (!sink_) {
        return;
    }
    protocol::WorkflowEvent event;
    event.run_id = run.id;
    event.type = type;
    event.agent = agent;
    event.round = round;
    event.content = content;
    sink_(event);
}

}  // namespace conductor::runtime

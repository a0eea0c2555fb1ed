#include "runtime/agent_executor.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <utility>
#include "core/logging/logger.hpp"

namespace conductor::runtime {

using core::errors::ConductorError;
using core::errors::ErrorCategory;
using protocol::Message;

namespace {

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](const unsigned char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    });
}

}  // namespace

AgentExecutor::AgentExecutor(std::shared_ptr<AgentInvoker> invoker,
                             ExecutorOptions options)
    : invoker_(std::move(invoker)), options_(options) {
    options_.max_attempts = std::clamp(options_.max_attempts, 1, 2);
}

core::errors::Result<std::string> AgentExecutor::attempt(
    const InvocationRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    auto reply = invoker_->call(request);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }

    // A reply that arrives after the deadline is discarded, even if the
    // invoker itself does not enforce the timeout.
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    if (request.timeout_ms > 0 &&
        elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
        return ConductorError{ErrorCategory::AgentInvocation,
                              "Agent " + request.agent_name + " timed out after " +
                                  std::to_string(elapsed) + " ms.",
                              "agent_timeout"};
    }

    const auto& text = core::errors::get_value(reply);
    if (is_blank(text)) {
        return ConductorError{ErrorCategory::AgentInvocation,
                              "Agent " + request.agent_name +
                                  " returned an empty response.",
                              "agent_empty_response"};
    }
    return text;
}

core::errors::Result<Message> AgentExecutor::invoke(
    const protocol::AgentSpec& agent, const protocol::TranscriptView& transcript,
    const std::shared_ptr<std::atomic_bool>& cancel_token,
    const std::string& extra_instructions) const {
    if (!invoker_) {
        return ConductorError{ErrorCategory::Internal,
                              "AgentExecutor has no invoker.", "missing_invoker"};
    }

    InvocationRequest request;
    request.agent_name = agent.name;
    request.instructions = agent.instructions;
    if (!extra_instructions.empty()) {
        request.instructions += "\n\n" + extra_instructions;
    }
    request.transcript = transcript;
    request.timeout_ms = options_.timeout_ms;
    request.cancel_token = cancel_token;

    ConductorError last_error{ErrorCategory::Internal, "No attempt made.",
                              "no_attempt"};
    for (int attempt_no = 1; attempt_no <= options_.max_attempts; ++attempt_no) {
        if (cancel_token && cancel_token->load()) {
            return ConductorError{ErrorCategory::Cancelled,
                                  "Run cancelled before agent " + agent.name + ".",
                                  "run_cancelled"};
        }

        LOG_DEBUG("AgentExecutor: invoking " + agent.name + " (attempt " +
                  std::to_string(attempt_no) + "/" +
                  std::to_string(options_.max_attempts) + ")");
        auto reply = attempt(request);
        if (!core::errors::is_error(reply)) {
            Message message;
            message.index = transcript ? transcript->size() : 0;
            message.author = agent.name;
            message.role = protocol::Role::Agent;
            message.content = core::errors::get_value(reply);
            return message;
        }

        last_error = core::errors::get_error(reply);
        if (last_error.category != ErrorCategory::AgentInvocation) {
            return last_error;
        }
        LOG_WARN("AgentExecutor: " + agent.name + " failed " +
                 core::errors::format_error(last_error));
    }
    return last_error;
}

}  // namespace conductor::runtime

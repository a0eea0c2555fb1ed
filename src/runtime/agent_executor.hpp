#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include "core/errors/conductor_errors.hpp"
#include "protocol/agent_contract.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/agent_invoker.hpp"

namespace conductor::runtime {

struct ExecutorOptions {
    // 1 = no retry, 2 = retry once. Values outside [1, 2] are clamped.
    int max_attempts = 1;
    std::uint32_t timeout_ms = 0;
};

// Runs one agent turn against a transcript snapshot. Never touches the
// ConversationState: the caller appends the returned message on success.
class AgentExecutor {
public:
    explicit AgentExecutor(std::shared_ptr<AgentInvoker> invoker,
                           ExecutorOptions options = {});

    core::errors::Result<protocol::Message> invoke(
        const protocol::AgentSpec& agent, const protocol::TranscriptView& transcript,
        const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr,
        const std::string& extra_instructions = "") const;

    const ExecutorOptions& options() const { return options_; }

private:
    core::errors::Result<std::string> attempt(
        const InvocationRequest& request) const;

    std::shared_ptr<AgentInvoker> invoker_;
    ExecutorOptions options_;
};

}  // namespace conductor::runtime

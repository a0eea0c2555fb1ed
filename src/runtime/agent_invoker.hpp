#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include "core/errors/conductor_errors.hpp"
#include "protocol/message_contract.hpp"

namespace conductor::runtime {

struct InvocationRequest {
    std::string agent_name;
    std::string instructions;
    protocol::TranscriptView transcript;
    std::uint32_t timeout_ms = 0;  // 0 = unbounded
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// The single capability every topology depends on: instructions plus
// transcript in, reply text out. Failures must use
// ErrorCategory::AgentInvocation (or Cancelled when the token fired).
class AgentInvoker {
public:
    virtual ~AgentInvoker() = default;

    virtual core::errors::Result<std::string> call(
        const InvocationRequest& request) = 0;
};

}  // namespace conductor::runtime

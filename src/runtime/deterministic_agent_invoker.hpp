#pragma once

#include <string>
#include "core/errors/conductor_errors.hpp"
#include "runtime/agent_invoker.hpp"

namespace conductor::runtime {

// Offline invoker: the reply is a pure function of the agent name and the
// transcript, so dry runs and demos need no agent backend.
class DeterministicAgentInvoker : public AgentInvoker {
public:
    core::errors::Result<std::string> call(const InvocationRequest& request) override;
};

}  // namespace conductor::runtime

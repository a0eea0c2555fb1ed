#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/connection_settings.hpp"
#include "core/errors/conductor_errors.hpp"
#include "runtime/agent_invoker.hpp"

namespace conductor::runtime {

struct CommandInvokerOptions {
    // Run through /bin/sh -c once per agent call.
    std::string command;
    std::filesystem::path working_directory = ".";
    core::config::ConnectionSettings connection;
};

// Bridges to an external agent program. The request is written as one JSON
// document on the child's stdin:
//   {"agent", "instructions", "transcript": [{index, author, role, content}],
//    "connection": {"endpoint", "deployment"}}
// and the child's stdout is the reply. A non-zero exit, a timeout or a
// cancellation kills/fails the call; nothing partial is returned.
class CommandAgentInvoker : public AgentInvoker {
public:
    explicit CommandAgentInvoker(CommandInvokerOptions options);

    core::errors::Result<std::string> call(const InvocationRequest& request) override;

    static nlohmann::json build_payload(const InvocationRequest& request,
                                        const core::config::ConnectionSettings& connection);

private:
    CommandInvokerOptions options_;
};

}  // namespace conductor::runtime

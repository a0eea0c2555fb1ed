#pragma once
#include <string>
#include <vector>

namespace conductor::protocol {

    // Agents differ only by data: the orchestrators never subclass per agent.
    struct AgentSpec {
        std::string name;
        std::string role_description;
        std::string instructions;
    };

    using AgentList = std::vector<AgentSpec>;

} // namespace conductor::protocol

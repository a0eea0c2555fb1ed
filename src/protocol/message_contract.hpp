#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conductor::protocol {

    enum class Role {
        User,   // Initial input that seeded the run
        Agent,  // Output of one agent turn
        Human   // Synthetic message carrying a human decision
    };

    // One transcript entry. Never edited after it is appended.
    struct Message {
        std::uint64_t index = 0;
        std::string author;
        Role role = Role::User;
        std::string content;
    };

    // Read-only ordered view of a transcript handed to one agent call.
    using TranscriptView = std::shared_ptr<const std::vector<Message>>;

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::User:
                return "user";
            case Role::Agent:
                return "agent";
            case Role::Human:
                return "human";
            default:
                return "unknown";
        }
    }

    inline std::optional<Role> role_from_string(const std::string& value) {
        if (value == "user") return Role::User;
        if (value == "agent") return Role::Agent;
        if (value == "human") return Role::Human;
        return std::nullopt;
    }

} // namespace conductor::protocol

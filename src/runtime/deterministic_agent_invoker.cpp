#include "runtime/deterministic_agent_invoker.hpp"

#include <cctype>
#include <string>

namespace conductor::runtime {

namespace {

// First alphanumeric token of 4+ characters, else the first token at all.
std::string pick_keyword(const std::string& text) {
    std::string token;
    std::string fallback;
    for (const char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
            token.push_back(c);
            continue;
        }
        if (!token.empty()) {
            if (fallback.empty()) {
                fallback = token;
            }
            if (token.size() >= 4) {
                return token;
            }
            token.clear();
        }
    }
    if (token.size() >= 4) {
        return token;
    }
    if (fallback.empty()) {
        fallback = token;
    }
    return fallback.empty() ? "input" : fallback;
}

std::string first_line(const std::string& text) {
    constexpr std::size_t kMaxLength = 80;
    std::string line = text.substr(0, text.find('\n'));
    if (line.size() > kMaxLength) {
        line = line.substr(0, kMaxLength) + "...";
    }
    return line;
}

}  // namespace

core::errors::Result<std::string> DeterministicAgentInvoker::call(
    const InvocationRequest& request) {
    if (request.cancel_token && request.cancel_token->load()) {
        return core::errors::ConductorError{core::errors::ErrorCategory::Cancelled,
                                            "Agent call cancelled.", "run_cancelled"};
    }

    const std::size_t turns = request.transcript ? request.transcript->size() : 0;
    if (turns == 0) {
        return request.agent_name + " has nothing to respond to yet.";
    }

    const auto& last = request.transcript->back();
    return request.agent_name + " (turn " + std::to_string(turns) + ") on '" +
           pick_keyword(last.content) + "': responding to " + last.author +
           " who said \"" + first_line(last.content) + "\"";
}

}  // namespace conductor::runtime

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/conductor_errors.hpp"
#include "protocol/message_contract.hpp"

namespace conductor::session {

// Append-only transcript of one run. Indices are assigned on append and are
// contiguous from 0; nothing is ever removed or rewritten.
class ConversationState {
public:
    core::errors::Result<protocol::Message> append(protocol::Message message);
    core::errors::Result<protocol::Message> append(const std::string& author,
                                                   protocol::Role role,
                                                   const std::string& content);

    protocol::TranscriptView snapshot() const;
    const std::vector<protocol::Message>& messages() const { return messages_; }
    std::size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

    // Called when the owning run becomes terminal; later appends fail.
    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }

    static core::errors::Result<ConversationState> restore(
        std::vector<protocol::Message> messages, bool sealed);

private:
    std::vector<protocol::Message> messages_;
    bool sealed_ = false;
};

}  // namespace conductor::session

#include "session/conversation_state.hpp"

#include <memory>
#include <utility>

namespace conductor::session {

using core::errors::ConductorError;
using core::errors::ErrorCategory;
using protocol::Message;

core::errors::Result<Message> ConversationState::append(Message message) {
    if (sealed_) {
        return ConductorError{ErrorCategory::InvalidTransition,
                              "Transcript is sealed; run is terminal.",
                              "run_terminal"};
    }
    message.index = messages_.size();
    messages_.push_back(std::move(message));
    return messages_.back();
}

core::errors::Result<Message> ConversationState::append(
    const std::string& author, const protocol::Role role,
    const std::string& content) {
    Message message;
    message.author = author;
    message.role = role;
    message.content = content;
    return append(std::move(message));
}

protocol::TranscriptView ConversationState::snapshot() const {
    return std::make_shared<const std::vector<Message>>(messages_);
}

core::errors::Result<ConversationState> ConversationState::restore(
    std::vector<Message> messages, const bool sealed) {
    for (std::size_t i = 0; i < messages.size(); ++i) {
        if (messages[i].index != i) {
            return ConductorError{ErrorCategory::Internal,
                                  "Transcript index gap at position " +
                                      std::to_string(i),
                                  "invalid_transcript"};
        }
    }

    ConversationState state;
    state.messages_ = std::move(messages);
    state.sealed_ = sealed;
    return state;
}

}  // namespace conductor::session

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/conductor_errors.hpp"
#include "protocol/message_contract.hpp"
#include "runtime/deterministic_agent_invoker.hpp"

namespace {

using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::protocol::Message;
using conductor::protocol::Role;
using conductor::runtime::DeterministicAgentInvoker;
using conductor::runtime::InvocationRequest;

InvocationRequest request_after(const std::string& author, const std::string& content) {
    auto messages = std::make_shared<std::vector<Message>>();
    Message message;
    message.index = 0;
    message.author = author;
    message.role = Role::User;
    message.content = content;
    messages->push_back(message);

    InvocationRequest request;
    request.agent_name = "TicketClassifier";
    request.transcript = messages;
    return request;
}

TEST(DeterministicAgentInvokerTest, RepliesToLastMessage) {
    DeterministicAgentInvoker invoker;
    auto reply = invoker.call(request_after("user", "My invoice is wrong"));
    ASSERT_FALSE(is_error(reply));
    EXPECT_EQ(get_value(reply),
              "TicketClassifier (turn 1) on 'invoice': responding to user who said "
              "\"My invoice is wrong\"");
}

TEST(DeterministicAgentInvokerTest, SameInputSameReply) {
    DeterministicAgentInvoker invoker;
    const auto request = request_after("user", "Launch plan\nsecond line");
    auto first = invoker.call(request);
    auto second = invoker.call(request);
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(first), get_value(second));
    EXPECT_EQ(get_value(first).find("second line"), std::string::npos);
}

TEST(DeterministicAgentInvokerTest, HonoursCancellation) {
    DeterministicAgentInvoker invoker;
    auto request = request_after("user", "anything");
    request.cancel_token = std::make_shared<std::atomic_bool>(true);
    auto reply = invoker.call(request);
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).category, ErrorCategory::Cancelled);
}

}  // namespace

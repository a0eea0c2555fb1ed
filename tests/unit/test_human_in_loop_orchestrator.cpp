#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/conductor_errors.hpp"
#include "protocol/workflow_contract.hpp"
#include "runtime/agent_executor.hpp"
#include "runtime/human_in_loop_orchestrator.hpp"
#include "scripted_invoker.hpp"

namespace {

using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::protocol::HumanDecision;
using conductor::protocol::Role;
using conductor::protocol::RunStatus;
using conductor::protocol::Topology;
using conductor::protocol::Verdict;
using conductor::protocol::WorkflowDefinition;
using conductor::runtime::AgentExecutor;
using conductor::runtime::HumanInLoopOrchestrator;
using conductor::testing::ScriptedInvoker;
using conductor::testing::make_agents;
using conductor::testing::make_run;

WorkflowDefinition expense_definition() {
    WorkflowDefinition definition;
    definition.agents = make_agents({"ExpenseAnalyst"});
    definition.post_gate_agents = make_agents({"ExpenseProcessor"});
    definition.gate_prompt = "Please review the expense analysis above.";
    return definition;
}

class HumanInLoopOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        invoker = std::make_shared<ScriptedInvoker>();
        invoker->replies["ExpenseAnalyst"] = "Within policy, recommend approval.";
        invoker->replies["ExpenseProcessor"] = "Reimbursement scheduled.";
        executor = std::make_unique<AgentExecutor>(invoker);
        orchestrator = std::make_unique<HumanInLoopOrchestrator>(*executor);
        run = make_run(Topology::HumanInLoop, expense_definition(),
                       "Team dinner, $450, 6 people");
    }

    HumanDecision decision_for_pending(Verdict verdict) const {
        HumanDecision decision;
        decision.request_id = run.pending_request->id;
        decision.verdict = verdict;
        return decision;
    }

    std::shared_ptr<ScriptedInvoker> invoker;
    std::unique_ptr<AgentExecutor> executor;
    std::unique_ptr<HumanInLoopOrchestrator> orchestrator;
    conductor::session::WorkflowRun run;
};

TEST_F(HumanInLoopOrchestratorTest, PausesAfterPreGateAgents) {
    auto started = orchestrator->start(run);
    ASSERT_FALSE(is_error(started));
    EXPECT_EQ(get_value(started), RunStatus::PausedAwaitingInput);

    ASSERT_TRUE(run.pending_request.has_value());
    EXPECT_FALSE(run.pending_request->id.empty());
    EXPECT_EQ(run.pending_request->step, HumanInLoopOrchestrator::kGateStep);
    EXPECT_EQ(run.pending_request->prompt, "Please review the expense analysis above.");
    EXPECT_EQ(run.transcript.size(), 2u);
    EXPECT_EQ(invoker->call_order(), std::vector<std::string>{"ExpenseAnalyst"});
}

TEST_F(HumanInLoopOrchestratorTest, ApprovalRunsPostGateAgents) {
    ASSERT_FALSE(is_error(orchestrator->start(run)));
    auto decision = decision_for_pending(Verdict::Approve);
    decision.note = "ok";

    auto resumed = orchestrator->resume(run, decision);
    ASSERT_FALSE(is_error(resumed));
    EXPECT_EQ(get_value(resumed), RunStatus::Completed);

    const auto& messages = run.transcript.messages();
    ASSERT_EQ(messages.size(), 4u);
    EXPECT_EQ(messages[2].role, Role::Human);
    EXPECT_EQ(messages[2].author, HumanInLoopOrchestrator::kHumanAuthor);
    EXPECT_EQ(messages[2].content, "Manager decision: APPROVE - ok");
    EXPECT_EQ(messages[3].author, "ExpenseProcessor");
    EXPECT_FALSE(run.pending_request.has_value());

    const auto calls = invoker->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].transcript.back().content, "Manager decision: APPROVE - ok");
}

TEST_F(HumanInLoopOrchestratorTest, RejectionStillReachesProcessor) {
    ASSERT_FALSE(is_error(orchestrator->start(run)));
    auto resumed = orchestrator->resume(run, decision_for_pending(Verdict::Reject));
    ASSERT_FALSE(is_error(resumed));
    EXPECT_EQ(get_value(resumed), RunStatus::Completed);
    EXPECT_EQ(run.transcript.messages()[2].content, "Manager decision: REJECT");
}

TEST_F(HumanInLoopOrchestratorTest, MismatchedRequestIdLeavesRunPaused) {
    ASSERT_FALSE(is_error(orchestrator->start(run)));
    HumanDecision decision;
    decision.request_id = "req-bogus";
    decision.verdict = Verdict::Approve;

    auto resumed = orchestrator->resume(run, decision);
    ASSERT_TRUE(is_error(resumed));
    EXPECT_EQ(get_error(resumed).category, ErrorCategory::InvalidTransition);
    EXPECT_EQ(get_error(resumed).code, "request_id_mismatch");
    EXPECT_EQ(run.status, RunStatus::PausedAwaitingInput);
    EXPECT_TRUE(run.pending_request.has_value());
    EXPECT_EQ(run.transcript.size(), 2u);
}

TEST_F(HumanInLoopOrchestratorTest, SecondDecisionIsRejected) {
    ASSERT_FALSE(is_error(orchestrator->start(run)));
    const auto decision = decision_for_pending(Verdict::Approve);
    ASSERT_FALSE(is_error(orchestrator->resume(run, decision)));

    auto again = orchestrator->resume(run, decision);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).category, ErrorCategory::InvalidTransition);
    EXPECT_EQ(run.transcript.size(), 4u);
    EXPECT_EQ(invoker->call_count(), 2u);
}

TEST_F(HumanInLoopOrchestratorTest, ResumeOnRunningRunIsRejected) {
    HumanDecision decision;
    decision.request_id = "req-anything";
    auto resumed = orchestrator->resume(run, decision);
    ASSERT_TRUE(is_error(resumed));
    EXPECT_EQ(get_error(resumed).code, "run_not_paused");
}

TEST_F(HumanInLoopOrchestratorTest, PreGateFailureFailsRunAndBlocksResume) {
    invoker->failing_agents.insert("ExpenseAnalyst");
    auto started = orchestrator->start(run);
    ASSERT_FALSE(is_error(started));
    EXPECT_EQ(get_value(started), RunStatus::Failed);
    EXPECT_FALSE(run.pending_request.has_value());
    EXPECT_TRUE(run.error.has_value());

    HumanDecision decision;
    decision.request_id = "req-anything";
    auto resumed = orchestrator->resume(run, decision);
    ASSERT_TRUE(is_error(resumed));
    EXPECT_EQ(get_error(resumed).code, "run_terminal");
}

TEST_F(HumanInLoopOrchestratorTest, PostGateFailureFailsRun) {
    invoker->failing_agents.insert("ExpenseProcessor");
    ASSERT_FALSE(is_error(orchestrator->start(run)));
    auto resumed = orchestrator->resume(run, decision_for_pending(Verdict::Approve));
    ASSERT_FALSE(is_error(resumed));
    EXPECT_EQ(get_value(resumed), RunStatus::Failed);
    EXPECT_EQ(run.transcript.size(), 3u);
}

TEST_F(HumanInLoopOrchestratorTest, StartWithPendingRequestIsRejected) {
    ASSERT_FALSE(is_error(orchestrator->start(run)));
    const auto pending_id = run.pending_request->id;

    auto again = orchestrator->start(run);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).category, ErrorCategory::InvalidConfiguration);
    EXPECT_EQ(get_error(again).code, "pending_request_exists");
    EXPECT_EQ(run.pending_request->id, pending_id);
}

TEST_F(HumanInLoopOrchestratorTest, PendingRequestCarriesDecisionForm) {
    ASSERT_FALSE(is_error(orchestrator->start(run)));
    ASSERT_TRUE(run.pending_request.has_value());
    EXPECT_EQ(run.pending_request->options,
              (std::vector<std::string>{"APPROVE", "REJECT", "MORE_INFO"}));
    EXPECT_EQ(run.pending_request->analysis_summary, "Within policy, recommend approval.");

    const auto snapshot = run.snapshot();
    ASSERT_TRUE(snapshot.pending_request.has_value());
    EXPECT_EQ(snapshot.pending_request->options.size(), 3u);
}

TEST_F(HumanInLoopOrchestratorTest, ConsumedDecisionIsCheckpointedBeforePostGateAgents) {
    std::vector<std::size_t> calls_at_checkpoint;
    std::vector<bool> pending_at_checkpoint;
    const HumanInLoopOrchestrator checkpointed(
        *executor, {},
        [&](const conductor::session::WorkflowRun& saved)
            -> std::optional<conductor::core::errors::ConductorError> {
            calls_at_checkpoint.push_back(invoker->call_count());
            pending_at_checkpoint.push_back(saved.pending_request.has_value());
            return std::nullopt;
        });
    ASSERT_FALSE(is_error(orchestrator->start(run)));

    auto resumed = checkpointed.resume(run, decision_for_pending(Verdict::Approve));
    ASSERT_FALSE(is_error(resumed));
    EXPECT_EQ(get_value(resumed), RunStatus::Completed);
    // Decision first, then the ExpenseProcessor turn.
    EXPECT_EQ(calls_at_checkpoint, (std::vector<std::size_t>{1u, 2u}));
    EXPECT_EQ(pending_at_checkpoint, (std::vector<bool>{false, false}));
}

TEST_F(HumanInLoopOrchestratorTest, FailedCheckpointStopsBeforePostGateAgents) {
    const HumanInLoopOrchestrator checkpointed(
        *executor, {},
        [](const conductor::session::WorkflowRun&)
            -> std::optional<conductor::core::errors::ConductorError> {
            return conductor::core::errors::ConductorError{
                ErrorCategory::Internal, "disk full", "state_write_failed"};
        });
    ASSERT_FALSE(is_error(orchestrator->start(run)));

    auto resumed = checkpointed.resume(run, decision_for_pending(Verdict::Approve));
    ASSERT_FALSE(is_error(resumed));
    EXPECT_EQ(get_value(resumed), RunStatus::Failed);
    EXPECT_EQ(invoker->call_order(), std::vector<std::string>{"ExpenseAnalyst"});
    EXPECT_FALSE(run.pending_request.has_value());
}

TEST(HumanInLoopValidationTest, RequiresBothSegments) {
    WorkflowDefinition definition;
    definition.agents = make_agents({"ExpenseAnalyst"});
    auto invalid = HumanInLoopOrchestrator::validate(definition);
    ASSERT_TRUE(invalid.has_value());
    EXPECT_EQ(invalid->category, ErrorCategory::InvalidConfiguration);
}

TEST(HumanInLoopValidationTest, RendersDecisionWithoutEmptyNote) {
    HumanDecision decision;
    decision.verdict = Verdict::MoreInfo;
    decision.note = "";
    EXPECT_EQ(HumanInLoopOrchestrator::render_decision(decision),
              "Manager decision: MORE_INFO");
}

}  // namespace

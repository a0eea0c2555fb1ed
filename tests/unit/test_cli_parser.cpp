#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/conductor_errors.hpp"
#include "temp_workspace.hpp"

namespace {

using conductor::app::cli::parse_and_validate;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::protocol::Backend;
using conductor::protocol::CliCommand;
using conductor::protocol::RunRequest;
using conductor::protocol::Topology;
using conductor::protocol::Verdict;
using conductor::testing::TempWorkspace;

conductor::core::errors::Result<RunRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("conductor_cli");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsOnUnknownCommand) {
    auto result = parse_tokens({"launch"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ParsesRunWithDefaults) {
    auto result = parse_tokens({"run", "--topology", "sequential", "--input", "My invoice"});
    ASSERT_FALSE(is_error(result));

    const auto& request = get_value(result);
    EXPECT_EQ(request.command, CliCommand::Run);
    EXPECT_EQ(request.topology, Topology::Sequential);
    EXPECT_EQ(request.input, "My invoice");
    EXPECT_EQ(request.backend, Backend::Deterministic);
    EXPECT_FALSE(request.round_count.has_value());
    EXPECT_FALSE(request.verbose);
}

TEST(CliParserTest, ParsesRoundRobinWithRounds) {
    auto result = parse_tokens(
        {"run", "--topology", "round-robin", "--input", "Launch", "--rounds", "2", "--verbose"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).topology, Topology::RoundRobin);
    ASSERT_TRUE(get_value(result).round_count.has_value());
    EXPECT_EQ(get_value(result).round_count.value(), 2);
    EXPECT_TRUE(get_value(result).verbose);
}

TEST(CliParserTest, ZeroRoundsIsLeftToTheRunner) {
    auto result =
        parse_tokens({"run", "--topology", "round-robin", "--input", "Launch", "--rounds", "0"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).round_count.value(), 0);
}

TEST(CliParserTest, RejectsNonNumericRounds) {
    auto result =
        parse_tokens({"run", "--topology", "round-robin", "--input", "x", "--rounds", "3a"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, RejectsRoundsForOtherTopologies) {
    auto result = parse_tokens({"run", "--topology", "sequential", "--input", "x", "--rounds", "2"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "flag_not_applicable");
}

TEST(CliParserTest, RejectsUnknownTopologyAsInputError) {
    auto result = parse_tokens({"run", "--topology", "mesh", "--input", "x"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "unknown_topology");
}

TEST(CliParserTest, RequiresInputForRun) {
    auto result = parse_tokens({"run", "--topology", "sequential"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, ParsesDecide) {
    auto result = parse_tokens({"decide", "--run-id", "run-1234abcd", "--request-id",
                                "req-0001", "--verdict", "more-info", "--note",
                                "Need receipts"});
    ASSERT_FALSE(is_error(result));

    const auto& request = get_value(result);
    EXPECT_EQ(request.command, CliCommand::Decide);
    EXPECT_EQ(request.run_id, "run-1234abcd");
    EXPECT_EQ(request.request_id, "req-0001");
    EXPECT_EQ(request.verdict, Verdict::MoreInfo);
    ASSERT_TRUE(request.note.has_value());
    EXPECT_EQ(request.note.value(), "Need receipts");
}

TEST(CliParserTest, DecideRequiresVerdict) {
    auto result = parse_tokens({"decide", "--run-id", "run-1", "--request-id", "req-1"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, RejectsUnknownVerdict) {
    auto result = parse_tokens(
        {"decide", "--run-id", "run-1", "--request-id", "req-1", "--verdict", "maybe"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
}

TEST(CliParserTest, StatusRequiresRunId) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");

    auto ok = parse_tokens({"status", "--run-id", "run-1", "--state-dir", "/tmp/runs"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).state_dir, std::filesystem::path("/tmp/runs"));
}

TEST(CliParserTest, RejectsFlagsThatDoNotApply) {
    auto result = parse_tokens({"cancel", "--run-id", "run-1", "--verdict", "approve"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "flag_not_applicable");

    auto backend = parse_tokens({"status", "--run-id", "run-1", "--backend", "command"});
    ASSERT_TRUE(is_error(backend));
    EXPECT_EQ(get_error(backend).code, "flag_not_applicable");
}

TEST(CliParserTest, FailsOnMissingValueAndUnknownArgument) {
    auto missing = parse_tokens({"run", "--topology"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_value");

    auto unknown = parse_tokens({"run", "--topology", "sequential", "--input", "x", "--fast"});
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_argument");
}

TEST(CliParserTest, CommandBackendNeedsAgentCommand) {
    auto missing = parse_tokens(
        {"run", "--topology", "sequential", "--input", "x", "--backend", "command"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_flag");

    auto conflicting = parse_tokens(
        {"run", "--topology", "sequential", "--input", "x", "--agent-command", "./agent.sh"});
    ASSERT_TRUE(is_error(conflicting));
    EXPECT_EQ(get_error(conflicting).code, "conflicting_flags");

    auto ok = parse_tokens({"run", "--topology", "sequential", "--input", "x", "--backend",
                            "command", "--agent-command", "./agent.sh", "--timeout-ms",
                            "30000"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).backend, Backend::Command);
    EXPECT_EQ(get_value(ok).agent_command, "./agent.sh");
    EXPECT_EQ(get_value(ok).timeout_ms.value(), 30000u);
}

TEST(CliParserTest, RejectsUnknownBackend) {
    auto result =
        parse_tokens({"run", "--topology", "sequential", "--input", "x", "--backend", "cloud"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_backend");
}

TEST(CliParserTest, ValidatesCatalogPath) {
    auto missing = parse_tokens({"run", "--topology", "sequential", "--input", "x",
                                 "--catalog", "/nonexistent/catalog.json"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "invalid_path");

    TempWorkspace workspace("cli_parser");
    const auto catalog = workspace.root() / "catalog.json";
    {
        std::ofstream out(catalog);
        out << "{}";
    }
    auto ok = parse_tokens(
        {"run", "--topology", "hitl", "--input", "x", "--catalog", catalog.string()});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).topology, Topology::HumanInLoop);
    ASSERT_TRUE(get_value(ok).catalog_file.has_value());
}

}  // namespace

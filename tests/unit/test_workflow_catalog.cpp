#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/connection_settings.hpp"
#include "core/config/workflow_catalog.hpp"
#include "core/errors/conductor_errors.hpp"
#include "protocol/workflow_contract.hpp"
#include "temp_workspace.hpp"

namespace {

using conductor::core::config::ConnectionSettings;
using conductor::core::config::default_catalog;
using conductor::core::config::load_catalog;
using conductor::core::config::parse_catalog;
using conductor::core::config::validate_connection;
using conductor::core::errors::ErrorCategory;
using conductor::core::errors::get_error;
using conductor::core::errors::get_value;
using conductor::core::errors::is_error;
using conductor::protocol::Topology;
using conductor::testing::TempWorkspace;

TEST(WorkflowCatalogTest, DefaultsMatchBuiltInWorkflows) {
    const auto catalog = default_catalog();

    ASSERT_EQ(catalog.sequential.agents.size(), 3u);
    EXPECT_EQ(catalog.sequential.agents[0].name, "TicketClassifier");
    EXPECT_EQ(catalog.sequential.agents[2].name, "SupportResponder");

    ASSERT_EQ(catalog.human_in_loop.agents.size(), 1u);
    ASSERT_EQ(catalog.human_in_loop.post_gate_agents.size(), 1u);
    EXPECT_EQ(catalog.human_in_loop.post_gate_agents[0].name, "ExpenseProcessor");
    EXPECT_FALSE(catalog.human_in_loop.gate_prompt.empty());

    EXPECT_EQ(catalog.round_robin.agents.size(), 3u);
    EXPECT_EQ(catalog.round_robin.round_count, 3);
    ASSERT_TRUE(catalog.round_robin.synthesis_agent.has_value());
    EXPECT_EQ(catalog.round_robin.synthesis_agent->name, "ProductManager");

    EXPECT_EQ(catalog.max_attempts, 1);
    EXPECT_EQ(&catalog.definition_for(Topology::RoundRobin), &catalog.round_robin);
}

TEST(WorkflowCatalogTest, SectionsOverrideDefaults) {
    const std::string text = R"({
        "sequential": {"agents": [{"name": "Triage", "instructions": "Sort it."}]},
        "executor": {"max_attempts": 2, "timeout_ms": 5000}
    })";

    auto parsed = parse_catalog(text);
    ASSERT_FALSE(is_error(parsed));
    const auto& catalog = get_value(parsed);
    ASSERT_EQ(catalog.sequential.agents.size(), 1u);
    EXPECT_EQ(catalog.sequential.agents[0].name, "Triage");
    EXPECT_EQ(catalog.sequential.agents[0].instructions, "Sort it.");
    EXPECT_EQ(catalog.max_attempts, 2);
    EXPECT_EQ(catalog.timeout_ms, 5000u);
    EXPECT_EQ(catalog.round_robin.agents.size(), 3u);
}

TEST(WorkflowCatalogTest, InvalidJsonIsConfigurationError) {
    auto parsed = parse_catalog("{not json");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(parsed).code, "config_parse_failed");
}

TEST(WorkflowCatalogTest, AgentWithoutNameIsConfigurationError) {
    auto parsed = parse_catalog(R"({"round_robin": {"agents": [{"instructions": "x"}]}})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Configuration);
    EXPECT_NE(get_error(parsed).message.find("round_robin"), std::string::npos);
}

TEST(WorkflowCatalogTest, RejectsOutOfRangeAttempts) {
    auto parsed = parse_catalog(R"({"executor": {"max_attempts": 3}})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Configuration);
}

TEST(WorkflowCatalogTest, LoadsFromFile) {
    TempWorkspace workspace("workflow_catalog");
    const auto path = workspace.root() / "catalog.json";
    {
        std::ofstream out(path);
        out << R"({"round_robin": {"agents": [{"name": "A"}, {"name": "B"}], "round_count": 2}})";
    }

    auto loaded = load_catalog(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).round_robin.round_count, 2);
    EXPECT_FALSE(get_value(loaded).round_robin.synthesis_agent.has_value());

    auto missing = load_catalog(workspace.root() / "missing.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::Configuration);
}

TEST(ConnectionSettingsTest, RejectsMissingAndPlaceholderEndpoint) {
    ConnectionSettings settings;
    auto missing = validate_connection(settings);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_endpoint");

    settings.endpoint = "https://<your-project>.services.ai.azure.com";
    auto placeholder = validate_connection(settings);
    ASSERT_TRUE(is_error(placeholder));
    EXPECT_EQ(get_error(placeholder).category, ErrorCategory::Configuration);
    EXPECT_EQ(get_error(placeholder).code, "placeholder_endpoint");

    settings.endpoint = "https://contoso.services.ai.azure.com";
    auto valid = validate_connection(settings);
    ASSERT_FALSE(is_error(valid));
    EXPECT_EQ(get_value(valid).deployment, "gpt-4o");
}

}  // namespace

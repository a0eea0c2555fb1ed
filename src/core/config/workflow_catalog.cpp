#include "core/config/workflow_catalog.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/json_codec.hpp"

namespace conductor::core::config {

using errors::ConductorError;
using errors::ErrorCategory;
using nlohmann::json;
using protocol::AgentSpec;
using protocol::Topology;
using protocol::WorkflowDefinition;

namespace {

AgentSpec make_agent(std::string name, std::string role, std::string instructions) {
    AgentSpec agent;
    agent.name = std::move(name);
    agent.role_description = std::move(role);
    agent.instructions = std::move(instructions);
    return agent;
}

ConductorError as_configuration_error(ConductorError error, const std::string& section) {
    error.category = ErrorCategory::Configuration;
    error.message = "Catalog section '" + section + "': " + error.message;
    error.code = "config_parse_failed";
    return error;
}

errors::Result<WorkflowDefinition> parse_section(const json& document,
                                                 const char* key,
                                                 const WorkflowDefinition& fallback) {
    const auto it = document.find(key);
    if (it == document.end()) {
        return fallback;
    }
    auto definition = protocol::definition_from_json(*it);
    if (errors::is_error(definition)) {
        return as_configuration_error(errors::get_error(definition), key);
    }
    return errors::get_value(definition);
}

}  // namespace

const WorkflowDefinition& WorkflowCatalog::definition_for(const Topology topology) const {
    switch (topology) {
        case Topology::HumanInLoop:
            return human_in_loop;
        case Topology::RoundRobin:
            return round_robin;
        case Topology::Sequential:
        default:
            return sequential;
    }
}

WorkflowCatalog default_catalog() {
    WorkflowCatalog catalog;

    catalog.sequential.agents = {
        make_agent("TicketClassifier", "Categorize the ticket",
                   "You are a customer-support ticket classifier. Read the customer "
                   "ticket and respond with EXACTLY one category (Billing, Technical, "
                   "or General) followed by a one-sentence reason. Format: "
                   "'Category: <category>\\nReason: <reason>'"),
        make_agent("KnowledgeResearcher", "Look up knowledge-base articles",
                   "You are a knowledge-base researcher for a support team. Given the "
                   "ticket and its classification, provide 2-3 bullet points of "
                   "relevant knowledge-base information that would help draft a "
                   "reply. Be concise and factual."),
        make_agent("SupportResponder", "Draft the customer reply",
                   "You are a professional customer-support agent. Using the ticket, "
                   "classification, and knowledge-base notes provided, draft a "
                   "friendly, empathetic, and helpful reply to the customer. Keep it "
                   "under 150 words.")};

    catalog.human_in_loop.agents = {
        make_agent("ExpenseAnalyst", "Analyze the expense report",
                   "You are a corporate expense analyst. Review the submitted expense "
                   "report and produce a structured analysis with: 1. Expense summary "
                   "(amount, category, vendor) 2. Policy compliance check 3. Risk "
                   "flags (if any) 4. Recommendation: APPROVE or FLAG FOR REVIEW. Be "
                   "concise and professional.")};
    catalog.human_in_loop.post_gate_agents = {
        make_agent("ExpenseProcessor", "Finalize the expense",
                   "You are an expense processing agent. Based on the expense analysis "
                   "and the manager's decision, produce a final processing summary: "
                   "if approved, confirm processing and expected reimbursement "
                   "timeline; if rejected, explain the reason and next steps for the "
                   "employee; if more info is needed, list the specific information "
                   "required. Keep the tone professional and helpful.")};
    catalog.human_in_loop.gate_prompt =
        "Please review the expense analysis above and provide your decision.";

    catalog.round_robin.agents = {
        make_agent("MarketingLead", "Messaging and campaigns",
                   "You are the Marketing Lead in a product launch brainstorm. Focus "
                   "on brand messaging, target audience, campaign channels, and "
                   "competitive positioning. Be creative but practical. Keep responses "
                   "under 100 words. Reference other participants' points."),
        make_agent("EngineeringLead", "Feature readiness and constraints",
                   "You are the Engineering Lead in a product launch brainstorm. Focus "
                   "on feature readiness, technical milestones, scalability concerns, "
                   "and integration points. Be realistic about timelines. Keep "
                   "responses under 100 words. Build on the discussion."),
        make_agent("ProductManager", "Synthesis and decisions",
                   "You are the Product Manager leading a product launch brainstorm. "
                   "Synthesize marketing and engineering perspectives. Focus on "
                   "prioritization, go-to-market strategy, success metrics, and risks. "
                   "Keep responses under 100 words. Drive toward actionable "
                   "decisions.")};
    catalog.round_robin.synthesis_agent = catalog.round_robin.agents.back();
    catalog.round_robin.synthesis_prompt =
        "The brainstorming rounds are complete. As the Product Manager, please "
        "synthesize all the inputs into a concise launch plan with: 1) Key "
        "messages, 2) Feature highlights, 3) Timeline, 4) Action items. Keep it "
        "under 200 words.";
    catalog.round_robin.round_count = 3;

    return catalog;
}

errors::Result<WorkflowCatalog> parse_catalog(const std::string& text) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return ConductorError{ErrorCategory::Configuration,
                              "Catalog is not a JSON object.", "config_parse_failed"};
    }

    const WorkflowCatalog defaults = default_catalog();
    WorkflowCatalog catalog;

    auto sequential = parse_section(document, "sequential", defaults.sequential);
    if (errors::is_error(sequential)) {
        return errors::get_error(sequential);
    }
    auto human = parse_section(document, "human_in_the_loop", defaults.human_in_loop);
    if (errors::is_error(human)) {
        return errors::get_error(human);
    }
    auto round_robin = parse_section(document, "round_robin", defaults.round_robin);
    if (errors::is_error(round_robin)) {
        return errors::get_error(round_robin);
    }
    catalog.sequential = errors::get_value(sequential);
    catalog.human_in_loop = errors::get_value(human);
    catalog.round_robin = errors::get_value(round_robin);

    const auto executor = document.find("executor");
    if (executor != document.end()) {
        if (!executor->is_object()) {
            return ConductorError{ErrorCategory::Configuration,
                                  "Catalog 'executor' must be an object.",
                                  "config_parse_failed"};
        }
        const auto attempts = executor->find("max_attempts");
        if (attempts != executor->end()) {
            if (!attempts->is_number_integer() || attempts->get<int>() < 1 ||
                attempts->get<int>() > 2) {
                return ConductorError{ErrorCategory::Configuration,
                                      "executor.max_attempts must be 1 or 2.",
                                      "config_parse_failed"};
            }
            catalog.max_attempts = attempts->get<int>();
        }
        const auto timeout = executor->find("timeout_ms");
        if (timeout != executor->end()) {
            if (!timeout->is_number_unsigned()) {
                return ConductorError{ErrorCategory::Configuration,
                                      "executor.timeout_ms must be a non-negative integer.",
                                      "config_parse_failed"};
            }
            catalog.timeout_ms = timeout->get<std::uint32_t>();
        }
    }
    return catalog;
}

errors::Result<WorkflowCatalog> load_catalog(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ConductorError{ErrorCategory::Configuration,
                              "Unable to open catalog file: " + path.string(),
                              "config_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_catalog(buffer.str());
}

}  // namespace conductor::core::config
